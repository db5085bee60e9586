#ifndef COALG_SHAPE_VECTOR_HPP
#define COALG_SHAPE_VECTOR_HPP

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>
#include <coalg/foldable.hpp>

#include <cstddef>
#include <vector>

namespace coalg {

    // Any number of ordered elements. Cofree over it is a rose tree.
    struct vector_shape {
        template <typename A>
        struct rebind {
            typedef std::vector<A> other;
        };
    };

    template <>
    struct Functor<vector_shape> {
        template <typename A, typename F>
        static std::vector<result_t<F, const A&>> map(const std::vector<A>& fa, F f) {
            std::vector<result_t<F, const A&>> out;
            out.reserve(fa.size());
            for (const A& a : fa)
                out.push_back(f(a));
            return out;
        }
    };

    template <>
    struct Foldable<vector_shape> : FoldableOps<Foldable<vector_shape>> {
        template <typename A, typename B, typename F>
        static B fold_left(const std::vector<A>& fa, B z, F f) {
            for (const A& a : fa)
                z = f(z, a);
            return z;
        }

        template <typename A, typename B, typename F>
        static B fold_right(const std::vector<A>& fa, B z, F f) {
            for (std::size_t i = fa.size(); i > 0; --i)
                z = f(fa[i - 1], z);
            return z;
        }
    };

    template <>
    struct Traverse<vector_shape> : Functor<vector_shape> {
        template <typename G, typename A, typename F>
        static apply_t<G, std::vector<value_type_t<result_t<F, const A&>>>> traverse(const std::vector<A>& fa, F f) {
            typedef value_type_t<result_t<F, const A&>> B;
            apply_t<G, std::vector<B>> acc = Applicative<G>::point(std::vector<B>());
            for (const A& a : fa) {
                acc = Applicative<G>::apply2(acc, f(a), [](std::vector<B> bs, const B& b) {
                    bs.push_back(b);
                    return bs;
                });
            }
            return acc;
        }
    };

    // Every pairing of the two sides, left side major.
    template <>
    struct Apply<vector_shape> : Functor<vector_shape> {
        template <typename A, typename B, typename F>
        static std::vector<result_t<F, const A&, const B&>> apply2(const std::vector<A>& fa, const std::vector<B>& fb, F f) {
            std::vector<result_t<F, const A&, const B&>> out;
            out.reserve(fa.size() * fb.size());
            for (const A& a : fa)
                for (const B& b : fb)
                    out.push_back(f(a, b));
            return out;
        }

        template <typename A, typename Fn>
        static std::vector<result_t<Fn, const A&>> ap(const std::vector<A>& fa, const std::vector<Fn>& ff) {
            return apply2(fa, ff, [](const A& a, const Fn& g) { return g(a); });
        }
    };

    template <>
    struct Applicative<vector_shape> : Apply<vector_shape> {
        template <typename A>
        static std::vector<A> point(A a) {
            return std::vector<A>(1, a);
        }
    };

    template <>
    struct Plus<vector_shape> {
        template <typename A>
        static std::vector<A> plus(std::vector<A> a, const std::vector<A>& b) {
            a.insert(a.end(), b.begin(), b.end());
            return a;
        }
    };

    template <>
    struct PlusEmpty<vector_shape> : Plus<vector_shape> {
        template <typename A>
        static std::vector<A> empty() {
            return std::vector<A>();
        }
    };

    template <>
    struct Equal<vector_shape> {
        template <typename A, typename Eq>
        static bool equal(const std::vector<A>& a, const std::vector<A>& b, Eq eq) {
            if (a.size() != b.size())
                return false;
            for (std::size_t i = 0; i < a.size(); ++i)
                if (!eq(a[i], b[i]))
                    return false;
            return true;
        }
    };

} // namespace coalg

#endif
