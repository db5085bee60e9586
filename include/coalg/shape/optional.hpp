#ifndef COALG_SHAPE_OPTIONAL_HPP
#define COALG_SHAPE_OPTIONAL_HPP

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>
#include <coalg/foldable.hpp>

#include <boost/optional.hpp>

namespace coalg {

    // At most one element. Cofree over it is a possibly finite stream.
    struct optional_shape {
        template <typename A>
        struct rebind {
            typedef boost::optional<A> other;
        };
    };

    template <>
    struct Functor<optional_shape> {
        template <typename A, typename F>
        static boost::optional<result_t<F, const A&>> map(const boost::optional<A>& fa, F f) {
            if (!fa)
                return boost::none;
            return boost::optional<result_t<F, const A&>>(f(*fa));
        }
    };

    template <>
    struct Foldable<optional_shape> : FoldableOps<Foldable<optional_shape>> {
        template <typename A, typename B, typename F>
        static B fold_left(const boost::optional<A>& fa, B z, F f) {
            return fa ? f(z, *fa) : z;
        }

        template <typename A, typename B, typename F>
        static B fold_right(const boost::optional<A>& fa, B z, F f) {
            return fa ? f(*fa, z) : z;
        }
    };

    template <>
    struct Traverse<optional_shape> : Functor<optional_shape> {
        template <typename G, typename A, typename F>
        static apply_t<G, boost::optional<value_type_t<result_t<F, const A&>>>> traverse(const boost::optional<A>& fa, F f) {
            typedef value_type_t<result_t<F, const A&>> B;
            if (!fa)
                return Applicative<G>::point(boost::optional<B>());
            return Applicative<G>::map(f(*fa), [](const B& b) { return boost::optional<B>(b); });
        }
    };

    template <>
    struct Apply<optional_shape> : Functor<optional_shape> {
        template <typename A, typename B, typename F>
        static boost::optional<result_t<F, const A&, const B&>> apply2(const boost::optional<A>& fa, const boost::optional<B>& fb, F f) {
            if (!fa || !fb)
                return boost::none;
            return boost::optional<result_t<F, const A&, const B&>>(f(*fa, *fb));
        }

        template <typename A, typename Fn>
        static boost::optional<result_t<Fn, const A&>> ap(const boost::optional<A>& fa, const boost::optional<Fn>& ff) {
            return apply2(fa, ff, [](const A& a, const Fn& g) { return g(a); });
        }
    };

    template <>
    struct Applicative<optional_shape> : Apply<optional_shape> {
        template <typename A>
        static boost::optional<A> point(A a) {
            return boost::optional<A>(a);
        }
    };

    // The first present value wins.
    template <>
    struct Plus<optional_shape> {
        template <typename A>
        static boost::optional<A> plus(const boost::optional<A>& a, const boost::optional<A>& b) {
            return a ? a : b;
        }
    };

    template <>
    struct PlusEmpty<optional_shape> : Plus<optional_shape> {
        template <typename A>
        static boost::optional<A> empty() {
            return boost::none;
        }
    };

    template <>
    struct Equal<optional_shape> {
        template <typename A, typename Eq>
        static bool equal(const boost::optional<A>& a, const boost::optional<A>& b, Eq eq) {
            if (!a || !b)
                return !a && !b;
            return eq(*a, *b);
        }
    };

} // namespace coalg

#endif
