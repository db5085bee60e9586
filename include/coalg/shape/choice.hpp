#ifndef COALG_SHAPE_CHOICE_HPP
#define COALG_SHAPE_CHOICE_HPP

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>
#include <coalg/foldable.hpp>

namespace coalg {

    enum class side { left, right };

    // One element, marked with the side it came from. Dual to Pair.
    template <typename A>
    struct Choice {
        typedef A value_type;
        side which;
        A value;

        static Choice left(A a) {
            return Choice{side::left, a};
        }

        static Choice right(A a) {
            return Choice{side::right, a};
        }
    };

    template <typename A>
    bool operator==(const Choice<A>& a, const Choice<A>& b) {
        return a.which == b.which && a.value == b.value;
    }

    struct choice_shape {
        template <typename A>
        struct rebind {
            typedef Choice<A> other;
        };
    };

    template <>
    struct Functor<choice_shape> {
        template <typename A, typename F>
        static Choice<result_t<F, const A&>> map(const Choice<A>& fa, F f) {
            return Choice<result_t<F, const A&>>{fa.which, f(fa.value)};
        }
    };

    template <>
    struct Foldable<choice_shape> : FoldableOps<Foldable<choice_shape>> {
        template <typename A, typename B, typename F>
        static B fold_left(const Choice<A>& fa, B z, F f) {
            return f(z, fa.value);
        }

        template <typename A, typename B, typename F>
        static B fold_right(const Choice<A>& fa, B z, F f) {
            return f(fa.value, z);
        }
    };

    template <>
    struct Foldable1<choice_shape> : Foldable<choice_shape> {
        template <typename A, typename F>
        static result_t<F, const A&> fold_map1(const Choice<A>& fa, F f) {
            return f(fa.value);
        }
    };

    template <>
    struct Equal<choice_shape> {
        template <typename A, typename Eq>
        static bool equal(const Choice<A>& a, const Choice<A>& b, Eq eq) {
            return a.which == b.which && eq(a.value, b.value);
        }
    };

} // namespace coalg

#endif
