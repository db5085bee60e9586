#ifndef COALG_SHAPE_IDENTITY_HPP
#define COALG_SHAPE_IDENTITY_HPP

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>
#include <coalg/foldable.hpp>

namespace coalg {

    template <typename A>
    struct Identity {
        typedef A value_type;
        A value;
    };

    template <typename A>
    bool operator==(const Identity<A>& a, const Identity<A>& b) {
        return a.value == b.value;
    }

    // Exactly one element. Cofree over it is an infinite stream.
    struct identity_shape {
        template <typename A>
        struct rebind {
            typedef Identity<A> other;
        };
    };

    template <>
    struct Functor<identity_shape> {
        template <typename A, typename F>
        static Identity<result_t<F, const A&>> map(const Identity<A>& fa, F f) {
            return Identity<result_t<F, const A&>>{f(fa.value)};
        }
    };

    template <>
    struct Foldable<identity_shape> : FoldableOps<Foldable<identity_shape>> {
        template <typename A, typename B, typename F>
        static B fold_left(const Identity<A>& fa, B z, F f) {
            return f(z, fa.value);
        }

        template <typename A, typename B, typename F>
        static B fold_right(const Identity<A>& fa, B z, F f) {
            return f(fa.value, z);
        }
    };

    template <>
    struct Foldable1<identity_shape> : Foldable<identity_shape> {
        template <typename A, typename F>
        static result_t<F, const A&> fold_map1(const Identity<A>& fa, F f) {
            return f(fa.value);
        }
    };

    template <>
    struct Traverse<identity_shape> : Functor<identity_shape> {
        template <typename G, typename A, typename F>
        static apply_t<G, Identity<value_type_t<result_t<F, const A&>>>> traverse(const Identity<A>& fa, F f) {
            typedef value_type_t<result_t<F, const A&>> B;
            return Functor<G>::map(f(fa.value), [](const B& b) { return Identity<B>{b}; });
        }
    };

    template <>
    struct Traverse1<identity_shape> : Traverse<identity_shape> {
        template <typename G, typename A, typename F>
        static apply_t<G, Identity<value_type_t<result_t<F, const A&>>>> traverse1(const Identity<A>& fa, F f) {
            return traverse<G>(fa, f);
        }
    };

    template <>
    struct Apply<identity_shape> : Functor<identity_shape> {
        template <typename A, typename B, typename F>
        static Identity<result_t<F, const A&, const B&>> apply2(const Identity<A>& fa, const Identity<B>& fb, F f) {
            return Identity<result_t<F, const A&, const B&>>{f(fa.value, fb.value)};
        }

        template <typename A, typename Fn>
        static Identity<result_t<Fn, const A&>> ap(const Identity<A>& fa, const Identity<Fn>& ff) {
            return Identity<result_t<Fn, const A&>>{ff.value(fa.value)};
        }
    };

    template <>
    struct Applicative<identity_shape> : Apply<identity_shape> {
        template <typename A>
        static Identity<A> point(A a) {
            return Identity<A>{a};
        }
    };

    template <>
    struct Equal<identity_shape> {
        template <typename A, typename Eq>
        static bool equal(const Identity<A>& a, const Identity<A>& b, Eq eq) {
            return eq(a.value, b.value);
        }
    };

} // namespace coalg

#endif
