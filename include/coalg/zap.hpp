#ifndef COALG_ZAP_HPP
#define COALG_ZAP_HPP

#include <coalg/capability.hpp>
#include <coalg/cofree.hpp>
#include <coalg/free.hpp>
#include <coalg/shape/choice.hpp>
#include <coalg/shape/identity.hpp>
#include <coalg/shape/pair.hpp>

namespace coalg {

    // Witness that F and G annihilate: a value on each side combines into
    // one result.
    template <typename F, typename G>
    struct Zap : not_defined {};

    template <typename F, typename G>
    struct is_zap : is_defined<Zap<F, G>> {};

    template <>
    struct Zap<identity_shape, identity_shape> {
        template <typename A, typename B, typename F>
        static result_t<F, const A&, const B&> zap_with(const Identity<A>& fa, const Identity<B>& gb, F f) {
            return f(fa.value, gb.value);
        }
    };

    // A choice selects one side of a pair.
    template <>
    struct Zap<pair_shape, choice_shape> {
        template <typename A, typename B, typename F>
        static result_t<F, const A&, const B&> zap_with(const Pair<A>& fa, const Choice<B>& gb, F f) {
            return f(gb.which == side::left ? fa.first : fa.second, gb.value);
        }
    };

    template <>
    struct Zap<choice_shape, pair_shape> {
        template <typename A, typename B, typename F>
        static result_t<F, const A&, const B&> zap_with(const Choice<A>& fa, const Pair<B>& gb, F f) {
            return f(fa.value, fa.which == side::left ? gb.first : gb.second);
        }
    };

    template <typename S, typename A, typename E>
    template <typename G, typename B, typename F>
    result_t<F, const A&, const B&> Cofree<S, A, E>::zap_with(const Free<G, B>& bs, F f) const {
        static_assert(is_zap<S, G>::value, "Cofree::zap_with needs a Zap between the two shapes");
        if (bs.is_pure())
            return f(head_, bs.value());
        return Zap<S, G>::zap_with(tail(), bs.suspension(), [f](const Cofree& c, const Free<G, B>& d) {
            return c.zap_with(d, f);
        });
    }

    template <typename S, typename A, typename E>
    template <typename G, typename Fn>
    result_t<Fn, const A&> Cofree<S, A, E>::zap(const Free<G, Fn>& fs) const {
        return zap_with(fs, [](const A& a, const Fn& g) { return g(a); });
    }

} // namespace coalg

#endif
