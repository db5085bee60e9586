#ifndef COALG_EVALUATION_HPP
#define COALG_EVALUATION_HPP

#include <boost/function.hpp>
#include <boost/make_shared.hpp>
#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>

#include <type_traits>
#include <utility>

namespace coalg {

    // Evaluation strategies for the tail of a recursive structure.
    struct eager {};
    struct lazy {};

    template <typename E>
    struct is_lazy : std::is_same<E, lazy> {};

    // A cell holding a value that is either already computed or computed
    // on first access, then kept.
    template <typename T>
    class suspended {
        struct key {};

    public:
        typedef boost::shared_ptr<const suspended> pointer;

        // Reachable only through ready and later.
        suspended(key, T value) : value_(std::move(value)) {}
        suspended(key, boost::function<T()> thunk) : thunk_(std::move(thunk)) {}

        static pointer ready(T value) {
            return boost::make_shared<suspended>(key(), std::move(value));
        }

        static pointer later(boost::function<T()> thunk) {
            return boost::make_shared<suspended>(key(), std::move(thunk));
        }

        const T& force() const {
            if (!value_) {
                value_ = thunk_();
                thunk_.clear();
            }
            return *value_;
        }

        bool evaluated() const {
            return value_.is_initialized();
        }

    private:
        mutable boost::optional<T> value_;
        mutable boost::function<T()> thunk_;
    };

    template <typename E>
    struct evaluation;

    template <>
    struct evaluation<eager> {
        template <typename T, typename F>
        static typename suspended<T>::pointer defer(F f) {
            return suspended<T>::ready(f());
        }
    };

    template <>
    struct evaluation<lazy> {
        template <typename T, typename F>
        static typename suspended<T>::pointer defer(F f) {
            return suspended<T>::later(boost::function<T()>(f));
        }
    };

    template <typename E, typename T, typename F>
    typename suspended<T>::pointer defer(F f) {
        return evaluation<E>::template defer<T>(f);
    }

} // namespace coalg

#endif
