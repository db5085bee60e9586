#ifndef COALG_SHAPE_PAIR_HPP
#define COALG_SHAPE_PAIR_HPP

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>
#include <coalg/foldable.hpp>

namespace coalg {

    // Two elements. Cofree over it is an infinite binary tree.
    template <typename A>
    struct Pair {
        typedef A value_type;
        A first;
        A second;
    };

    template <typename A>
    bool operator==(const Pair<A>& a, const Pair<A>& b) {
        return a.first == b.first && a.second == b.second;
    }

    struct pair_shape {
        template <typename A>
        struct rebind {
            typedef Pair<A> other;
        };
    };

    template <>
    struct Functor<pair_shape> {
        template <typename A, typename F>
        static Pair<result_t<F, const A&>> map(const Pair<A>& fa, F f) {
            result_t<F, const A&> first = f(fa.first);
            return Pair<result_t<F, const A&>>{first, f(fa.second)};
        }
    };

    template <>
    struct Foldable<pair_shape> : FoldableOps<Foldable<pair_shape>> {
        template <typename A, typename B, typename F>
        static B fold_left(const Pair<A>& fa, B z, F f) {
            z = f(z, fa.first);
            return f(z, fa.second);
        }

        template <typename A, typename B, typename F>
        static B fold_right(const Pair<A>& fa, B z, F f) {
            z = f(fa.second, z);
            return f(fa.first, z);
        }
    };

    template <>
    struct Foldable1<pair_shape> : Foldable<pair_shape> {
        template <typename A, typename F>
        static result_t<F, const A&> fold_map1(const Pair<A>& fa, F f) {
            typedef result_t<F, const A&> B;
            B first = f(fa.first);
            return Semigroup<B>::append(first, f(fa.second));
        }
    };

    template <>
    struct Traverse<pair_shape> : Functor<pair_shape> {
        template <typename G, typename A, typename F>
        static apply_t<G, Pair<value_type_t<result_t<F, const A&>>>> traverse(const Pair<A>& fa, F f) {
            typedef value_type_t<result_t<F, const A&>> B;
            result_t<F, const A&> first = f(fa.first);
            return Apply<G>::apply2(first, f(fa.second), [](const B& x, const B& y) { return Pair<B>{x, y}; });
        }
    };

    template <>
    struct Traverse1<pair_shape> : Traverse<pair_shape> {
        template <typename G, typename A, typename F>
        static apply_t<G, Pair<value_type_t<result_t<F, const A&>>>> traverse1(const Pair<A>& fa, F f) {
            return traverse<G>(fa, f);
        }
    };

    // Pointwise.
    template <>
    struct Apply<pair_shape> : Functor<pair_shape> {
        template <typename A, typename B, typename F>
        static Pair<result_t<F, const A&, const B&>> apply2(const Pair<A>& fa, const Pair<B>& fb, F f) {
            result_t<F, const A&, const B&> first = f(fa.first, fb.first);
            return Pair<result_t<F, const A&, const B&>>{first, f(fa.second, fb.second)};
        }

        template <typename A, typename Fn>
        static Pair<result_t<Fn, const A&>> ap(const Pair<A>& fa, const Pair<Fn>& ff) {
            return apply2(fa, ff, [](const A& a, const Fn& g) { return g(a); });
        }
    };

    template <>
    struct Applicative<pair_shape> : Apply<pair_shape> {
        template <typename A>
        static Pair<A> point(A a) {
            return Pair<A>{a, a};
        }
    };

    template <>
    struct Equal<pair_shape> {
        template <typename A, typename Eq>
        static bool equal(const Pair<A>& a, const Pair<A>& b, Eq eq) {
            return eq(a.first, b.first) && eq(a.second, b.second);
        }
    };

} // namespace coalg

#endif
