#ifndef COALG_SHOW_HPP
#define COALG_SHOW_HPP

#include <coalg/algebra.hpp>
#include <coalg/cofree.hpp>
#include <coalg/shape/choice.hpp>
#include <coalg/shape/identity.hpp>
#include <coalg/shape/non_empty.hpp>
#include <coalg/shape/pair.hpp>
#include <coalg/tag.hpp>

#include <boost/optional/optional_io.hpp>

#include <cstddef>
#include <ostream>
#include <type_traits>
#include <vector>

namespace coalg {

    // "head" for a leaf, "head :< [child, child]" otherwise. Forces every
    // lazy tail, so only print finite structures.
    template <typename S, typename A, typename E>
    typename std::enable_if<is_foldable<S>::value, std::ostream&>::type
    operator<<(std::ostream& os, const Cofree<S, A, E>& c) {
        os << c.head();
        std::vector<Cofree<S, A, E>> children = Foldable<S>::to_vector(c.tail());
        if (children.empty())
            return os;
        os << " :< [";
        for (std::size_t i = 0; i < children.size(); ++i) {
            if (i != 0)
                os << ", ";
            os << children[i];
        }
        return os << "]";
    }

    template <typename T, typename Tag>
    auto operator<<(std::ostream& os, const Tagged<T, Tag>& t) -> decltype(os << t.untag()) {
        return os << t.untag();
    }

    template <typename A>
    std::ostream& operator<<(std::ostream& os, const Identity<A>& i) {
        return os << "Identity(" << i.value << ")";
    }

    template <typename A>
    std::ostream& operator<<(std::ostream& os, const Pair<A>& p) {
        return os << "(" << p.first << ", " << p.second << ")";
    }

    template <typename A>
    std::ostream& operator<<(std::ostream& os, const Choice<A>& c) {
        return os << (c.which == side::left ? "left(" : "right(") << c.value << ")";
    }

    template <typename A>
    std::ostream& operator<<(std::ostream& os, const NonEmpty<A>& n) {
        os << "[" << n.head;
        for (const A& a : n.tail)
            os << ", " << a;
        return os << "]";
    }

    template <typename T>
    std::ostream& operator<<(std::ostream& os, const Max<T>& m) {
        return os << "Max(" << m.value << ")";
    }

    template <typename T>
    std::ostream& operator<<(std::ostream& os, const Min<T>& m) {
        return os << "Min(" << m.value << ")";
    }

} // namespace coalg

#endif
