#ifndef COALG_SHAPE_NON_EMPTY_HPP
#define COALG_SHAPE_NON_EMPTY_HPP

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>
#include <coalg/foldable.hpp>

#include <cstddef>
#include <utility>
#include <vector>

namespace coalg {

    template <typename A>
    struct NonEmpty {
        typedef A value_type;
        A head;
        std::vector<A> tail;

        std::size_t size() const {
            return tail.size() + 1;
        }

        const A& operator[](std::size_t i) const {
            return i == 0 ? head : tail[i - 1];
        }
    };

    template <typename A>
    NonEmpty<A> non_empty(A head, std::vector<A> tail = std::vector<A>()) {
        return NonEmpty<A>{std::move(head), std::move(tail)};
    }

    template <typename A>
    bool operator==(const NonEmpty<A>& a, const NonEmpty<A>& b) {
        return a.head == b.head && a.tail == b.tail;
    }

    struct non_empty_shape {
        template <typename A>
        struct rebind {
            typedef NonEmpty<A> other;
        };
    };

    template <>
    struct Functor<non_empty_shape> {
        template <typename A, typename F>
        static NonEmpty<result_t<F, const A&>> map(const NonEmpty<A>& fa, F f) {
            NonEmpty<result_t<F, const A&>> out{f(fa.head), {}};
            out.tail.reserve(fa.tail.size());
            for (const A& a : fa.tail)
                out.tail.push_back(f(a));
            return out;
        }
    };

    template <>
    struct Foldable<non_empty_shape> : FoldableOps<Foldable<non_empty_shape>> {
        template <typename A, typename B, typename F>
        static B fold_left(const NonEmpty<A>& fa, B z, F f) {
            z = f(z, fa.head);
            for (const A& a : fa.tail)
                z = f(z, a);
            return z;
        }

        template <typename A, typename B, typename F>
        static B fold_right(const NonEmpty<A>& fa, B z, F f) {
            for (std::size_t i = fa.tail.size(); i > 0; --i)
                z = f(fa.tail[i - 1], z);
            return f(fa.head, z);
        }
    };

    template <>
    struct Foldable1<non_empty_shape> : Foldable<non_empty_shape> {
        template <typename A, typename F>
        static result_t<F, const A&> fold_map1(const NonEmpty<A>& fa, F f) {
            typedef result_t<F, const A&> B;
            B acc = f(fa.head);
            for (const A& a : fa.tail)
                acc = Semigroup<B>::append(acc, f(a));
            return acc;
        }
    };

    template <>
    struct Traverse<non_empty_shape> : Functor<non_empty_shape> {
        template <typename G, typename A, typename F>
        static apply_t<G, NonEmpty<value_type_t<result_t<F, const A&>>>> traverse(const NonEmpty<A>& fa, F f) {
            typedef value_type_t<result_t<F, const A&>> B;
            apply_t<G, NonEmpty<B>> acc = Apply<G>::map(f(fa.head), [](const B& b) {
                return NonEmpty<B>{b, std::vector<B>()};
            });
            for (const A& a : fa.tail) {
                acc = Apply<G>::apply2(acc, f(a), [](NonEmpty<B> bs, const B& b) {
                    bs.tail.push_back(b);
                    return bs;
                });
            }
            return acc;
        }
    };

    template <>
    struct Traverse1<non_empty_shape> : Traverse<non_empty_shape> {
        template <typename G, typename A, typename F>
        static apply_t<G, NonEmpty<value_type_t<result_t<F, const A&>>>> traverse1(const NonEmpty<A>& fa, F f) {
            return traverse<G>(fa, f);
        }
    };

    template <>
    struct Apply<non_empty_shape> : Functor<non_empty_shape> {
        template <typename A, typename B, typename F>
        static NonEmpty<result_t<F, const A&, const B&>> apply2(const NonEmpty<A>& fa, const NonEmpty<B>& fb, F f) {
            NonEmpty<result_t<F, const A&, const B&>> out{f(fa.head, fb.head), {}};
            for (std::size_t i = 0; i < fa.size(); ++i)
                for (std::size_t j = 0; j < fb.size(); ++j)
                    if (i != 0 || j != 0)
                        out.tail.push_back(f(fa[i], fb[j]));
            return out;
        }

        template <typename A, typename Fn>
        static NonEmpty<result_t<Fn, const A&>> ap(const NonEmpty<A>& fa, const NonEmpty<Fn>& ff) {
            return apply2(fa, ff, [](const A& a, const Fn& g) { return g(a); });
        }
    };

    template <>
    struct Applicative<non_empty_shape> : Apply<non_empty_shape> {
        template <typename A>
        static NonEmpty<A> point(A a) {
            return NonEmpty<A>{a, std::vector<A>()};
        }
    };

    template <>
    struct Plus<non_empty_shape> {
        template <typename A>
        static NonEmpty<A> plus(NonEmpty<A> a, const NonEmpty<A>& b) {
            a.tail.push_back(b.head);
            a.tail.insert(a.tail.end(), b.tail.begin(), b.tail.end());
            return a;
        }
    };

    template <>
    struct Equal<non_empty_shape> {
        template <typename A, typename Eq>
        static bool equal(const NonEmpty<A>& a, const NonEmpty<A>& b, Eq eq) {
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
