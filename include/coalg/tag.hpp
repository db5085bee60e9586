#ifndef COALG_TAG_HPP
#define COALG_TAG_HPP

#include <utility>

namespace coalg {

    // Selects the zipping instances of a structure that also has a monad.
    struct zip_tag {};

    // A value of T seen as a different type. Same representation, other
    // instances.
    template <typename T, typename Tag>
    class Tagged {
    public:
        typedef T untagged_type;
        typedef Tag tag_type;
        typedef typename T::value_type value_type;

        explicit Tagged(T value) : value_(std::move(value)) {}

        const T& untag() const {
            return value_;
        }

    private:
        T value_;
    };

    template <typename Tag, typename T>
    Tagged<T, Tag> tag(T value) {
        return Tagged<T, Tag>(std::move(value));
    }

    template <typename T, typename Tag>
    const T& untag(const Tagged<T, Tag>& t) {
        return t.untag();
    }

    template <typename T, typename Tag>
    auto operator==(const Tagged<T, Tag>& a, const Tagged<T, Tag>& b) -> decltype(a.untag() == b.untag()) {
        return a.untag() == b.untag();
    }

    template <typename T, typename Tag>
    auto operator!=(const Tagged<T, Tag>& a, const Tagged<T, Tag>& b) -> decltype(a.untag() == b.untag()) {
        return !(a.untag() == b.untag());
    }

} // namespace coalg

#endif
