#ifndef COALG_FREE_HPP
#define COALG_FREE_HPP

#include <coalg/capability.hpp>

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/variant.hpp>

#include <type_traits>
#include <utility>
#include <vector>

namespace coalg {

    // The free monad of a shape G: a value, or a G-shaped suspension of
    // further free structures.
    template <typename G, typename A>
    class Free {
    public:
        typedef A value_type;
        typedef apply_t<G, Free> suspension_type;

        static Free point(A a) {
            return Free(step_type(std::move(a)));
        }

        static Free roll(suspension_type s) {
            return Free(step_type(node_pointer(boost::make_shared<suspension_type>(std::move(s)))));
        }

        Free(const Free&) = default;
        Free(Free&&) = default;

        Free& operator=(Free other) {
            step_.swap(other.step_);
            return *this;
        }

        ~Free() {
            release(is_foldable<G>());
        }

        bool is_pure() const {
            return step_.which() == 0;
        }

        // Throws boost::bad_get on a suspension.
        const A& value() const {
            return boost::get<A>(step_);
        }

        // Throws boost::bad_get on a pure value.
        const suspension_type& suspension() const {
            return *boost::get<node_pointer>(step_);
        }

        // One step: the suspension (which 0) or the value (which 1).
        boost::variant<suspension_type, A> resume() const {
            if (is_pure())
                return boost::variant<suspension_type, A>(value());
            return boost::variant<suspension_type, A>(suspension());
        }

        template <typename P, typename R>
        result_t<P, const A&> fold(P on_pure, R on_suspend) const {
            if (is_pure())
                return on_pure(value());
            return on_suspend(suspension());
        }

        template <typename F>
        result_t<F, const A&> flat_map(F f) const {
            typedef result_t<F, const A&> result_type;
            if (is_pure())
                return f(value());
            return result_type::roll(Functor<G>::map(suspension(), [f](const Free& x) { return x.flat_map(f); }));
        }

        template <typename F>
        Free<G, result_t<F, const A&>> map(F f) const {
            typedef Free<G, result_t<F, const A&>> result_type;
            return flat_map([f](const A& a) { return result_type::point(f(a)); });
        }

    private:
        typedef boost::shared_ptr<const suspension_type> node_pointer;
        typedef boost::variant<A, node_pointer> step_type;

        explicit Free(step_type step) : step_(std::move(step)) {}

        void release(std::false_type) {}

        // Frees a deep chain of suspensions from a worklist instead of one
        // nested destructor call per layer.
        void release(std::true_type) {
            node_pointer* own = boost::get<node_pointer>(&step_);
            if (!own || !*own)
                return;
            std::vector<node_pointer> pending;
            pending.push_back(std::move(*own));
            while (!pending.empty()) {
                node_pointer node = std::move(pending.back());
                pending.pop_back();
                if (node.use_count() == 1)
                    Foldable<G>::fold_left(*node, &pending, [](std::vector<node_pointer>* acc, const Free& x) {
                        if (const node_pointer* p = boost::get<node_pointer>(&x.step_))
                            acc->push_back(*p);
                        return acc;
                    });
            }
        }

        step_type step_;
    };

    template <typename G, typename GA>
    Free<G, value_type_t<GA>> lift_f(const GA& ga) {
        typedef value_type_t<GA> A;
        return Free<G, A>::roll(Functor<G>::map(ga, [](const A& a) { return Free<G, A>::point(a); }));
    }

    template <typename G>
    struct free_shape {
        template <typename A>
        struct rebind {
            typedef Free<G, A> other;
        };
    };

    template <typename G>
    struct Functor<free_shape<G>> {
        template <typename A, typename F>
        static Free<G, result_t<F, const A&>> map(const Free<G, A>& fa, F f) {
            return fa.map(f);
        }
    };

    template <typename G>
    struct Monad<free_shape<G>> : Functor<free_shape<G>> {
        template <typename A>
        static Free<G, A> point(A a) {
            return Free<G, A>::point(std::move(a));
        }

        template <typename A, typename F>
        static result_t<F, const A&> bind(const Free<G, A>& fa, F f) {
            return fa.flat_map(f);
        }
    };

} // namespace coalg

#endif
