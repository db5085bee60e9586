#ifndef COALG_NATURAL_HPP
#define COALG_NATURAL_HPP

#include <coalg/shape/identity.hpp>
#include <coalg/shape/non_empty.hpp>
#include <coalg/shape/optional.hpp>
#include <coalg/shape/pair.hpp>
#include <coalg/shape/vector.hpp>

#include <boost/optional.hpp>

#include <algorithm>
#include <vector>

namespace coalg {

    // Natural transformations S ~> T are function objects with one
    // templated call operator, valid for every element type:
    //
    //   template <typename X> apply_t<T, X> operator()(const apply_t<S, X>&) const;

    struct vector_to_optional {
        template <typename X>
        boost::optional<X> operator()(const std::vector<X>& v) const {
            if (v.empty())
                return boost::none;
            return boost::optional<X>(v.front());
        }
    };

    struct optional_to_vector {
        template <typename X>
        std::vector<X> operator()(const boost::optional<X>& o) const {
            if (!o)
                return std::vector<X>();
            return std::vector<X>(1, *o);
        }
    };

    struct non_empty_to_vector {
        template <typename X>
        std::vector<X> operator()(const NonEmpty<X>& n) const {
            std::vector<X> out(1, n.head);
            out.insert(out.end(), n.tail.begin(), n.tail.end());
            return out;
        }
    };

    struct identity_to_optional {
        template <typename X>
        boost::optional<X> operator()(const Identity<X>& i) const {
            return boost::optional<X>(i.value);
        }
    };

    struct pair_to_vector {
        template <typename X>
        std::vector<X> operator()(const Pair<X>& p) const {
            std::vector<X> out;
            out.push_back(p.first);
            out.push_back(p.second);
            return out;
        }
    };

    struct reverse_vector {
        template <typename X>
        std::vector<X> operator()(std::vector<X> v) const {
            std::reverse(v.begin(), v.end());
            return v;
        }
    };

    struct rotate_pair {
        template <typename X>
        Pair<X> operator()(const Pair<X>& p) const {
            return Pair<X>{p.second, p.first};
        }
    };

    // g after f.
    template <typename F, typename G>
    struct composed {
        F f;
        G g;

        template <typename FX>
        auto operator()(const FX& fx) const -> decltype(g(f(fx))) {
            return g(f(fx));
        }
    };

    template <typename F, typename G>
    composed<F, G> compose(F f, G g) {
        return composed<F, G>{f, g};
    }

} // namespace coalg

#endif
