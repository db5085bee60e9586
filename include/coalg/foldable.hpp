#ifndef COALG_FOLDABLE_HPP
#define COALG_FOLDABLE_HPP

#include <coalg/algebra.hpp>
#include <coalg/capability.hpp>

#include <boost/optional.hpp>

#include <cstddef>
#include <vector>

namespace coalg {

    // Operations every Foldable gets from its fold_left. Self provides
    // fold_left(fa, z, f) and fold_right(fa, z, f).
    template <typename Self>
    struct FoldableOps {
        template <typename FA, typename F>
        static result_t<F, const value_type_t<FA>&> fold_map(const FA& fa, F f) {
            typedef value_type_t<FA> A;
            typedef result_t<F, const A&> B;
            return Self::fold_left(fa, Monoid<B>::zero(), [f](const B& acc, const A& a) {
                return Monoid<B>::append(acc, f(a));
            });
        }

        // fold_map for a semigroup; none when fa has no elements.
        template <typename FA, typename F>
        static boost::optional<result_t<F, const value_type_t<FA>&>> fold_map1_opt(const FA& fa, F f) {
            typedef value_type_t<FA> A;
            typedef result_t<F, const A&> B;
            return Self::fold_left(fa, boost::optional<B>(), [f](const boost::optional<B>& acc, const A& a) {
                if (!acc)
                    return boost::optional<B>(f(a));
                return boost::optional<B>(Semigroup<B>::append(*acc, f(a)));
            });
        }

        template <typename FA>
        static std::vector<value_type_t<FA>> to_vector(const FA& fa) {
            typedef value_type_t<FA> A;
            return Self::fold_left(fa, std::vector<A>(), [](std::vector<A> acc, const A& a) {
                acc.push_back(a);
                return acc;
            });
        }

        template <typename FA>
        static std::size_t length(const FA& fa) {
            typedef value_type_t<FA> A;
            return Self::fold_left(fa, std::size_t(0), [](std::size_t n, const A&) { return n + 1; });
        }

        template <typename FA>
        static bool empty(const FA& fa) {
            return length(fa) == 0;
        }
    };

} // namespace coalg

#endif
