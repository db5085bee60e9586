#ifndef COALG_SHAPE_LIFTED_HPP
#define COALG_SHAPE_LIFTED_HPP

#include <coalg/capability.hpp>

#include <boost/variant.hpp>

#include <utility>

namespace coalg {

    // Either an effect in G or a plain value that has not needed one yet.
    // Turns any Apply G into an Applicative: point stays plain, and effects
    // are only combined once two of them meet.
    template <typename G, typename A>
    class Lifted {
    public:
        typedef A value_type;
        typedef apply_t<G, A> effect_type;

        static Lifted pure(A a) {
            return Lifted(step_type(plain{std::move(a)}));
        }

        static Lifted effect(effect_type ga) {
            return Lifted(step_type(std::move(ga)));
        }

        bool is_pure() const {
            return step_.which() == 1;
        }

        const A& pure_value() const {
            return boost::get<plain>(step_).value;
        }

        const effect_type& effect_value() const {
            return boost::get<effect_type>(step_);
        }

    private:
        struct plain {
            A value;
        };

        typedef boost::variant<effect_type, plain> step_type;

        explicit Lifted(step_type step) : step_(std::move(step)) {}

        step_type step_;
    };

    template <typename G>
    struct apply_applicative {
        template <typename A>
        struct rebind {
            typedef Lifted<G, A> other;
        };
    };

    template <typename G>
    struct Functor<apply_applicative<G>> {
        template <typename A, typename F>
        static Lifted<G, result_t<F, const A&>> map(const Lifted<G, A>& fa, F f) {
            typedef Lifted<G, result_t<F, const A&>> result_type;
            if (fa.is_pure())
                return result_type::pure(f(fa.pure_value()));
            return result_type::effect(Apply<G>::map(fa.effect_value(), f));
        }
    };

    template <typename G>
    struct Apply<apply_applicative<G>> : Functor<apply_applicative<G>> {
        template <typename A, typename B, typename F>
        static Lifted<G, result_t<F, const A&, const B&>> apply2(const Lifted<G, A>& fa, const Lifted<G, B>& fb, F f) {
            typedef Lifted<G, result_t<F, const A&, const B&>> result_type;
            if (fa.is_pure() && fb.is_pure())
                return result_type::pure(f(fa.pure_value(), fb.pure_value()));
            if (fa.is_pure()) {
                A a = fa.pure_value();
                return result_type::effect(Apply<G>::map(fb.effect_value(), [a, f](const B& b) { return f(a, b); }));
            }
            if (fb.is_pure()) {
                B b = fb.pure_value();
                return result_type::effect(Apply<G>::map(fa.effect_value(), [b, f](const A& a) { return f(a, b); }));
            }
            return result_type::effect(Apply<G>::apply2(fa.effect_value(), fb.effect_value(), f));
        }

        template <typename A, typename Fn>
        static Lifted<G, result_t<Fn, const A&>> ap(const Lifted<G, A>& fa, const Lifted<G, Fn>& ff) {
            return apply2(fa, ff, [](const A& a, const Fn& g) { return g(a); });
        }
    };

    template <typename G>
    struct Applicative<apply_applicative<G>> : Apply<apply_applicative<G>> {
        template <typename A>
        static Lifted<G, A> point(A a) {
            return Lifted<G, A>::pure(std::move(a));
        }
    };

} // namespace coalg

#endif
