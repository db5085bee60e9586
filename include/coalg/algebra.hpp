#ifndef COALG_ALGEBRA_HPP
#define COALG_ALGEBRA_HPP

#include <coalg/capability.hpp>

#include <string>
#include <type_traits>
#include <vector>

namespace coalg {

    template <typename T, typename Enable = void> struct Semigroup : not_defined {};
    template <typename T, typename Enable = void> struct Monoid : not_defined {};

    template <typename T> struct is_semigroup : is_defined<Semigroup<T>> {};
    template <typename T> struct is_monoid : is_defined<Monoid<T>> {};

    // Numbers combine by addition.
    template <typename T>
    struct Semigroup<T, typename std::enable_if<std::is_arithmetic<T>::value>::type> {
        static T append(const T& a, const T& b) {
            return a + b;
        }
    };

    template <typename T>
    struct Monoid<T, typename std::enable_if<std::is_arithmetic<T>::value>::type> : Semigroup<T> {
        static T zero() {
            return T();
        }
    };

    template <>
    struct Semigroup<std::string> {
        static std::string append(const std::string& a, const std::string& b) {
            return a + b;
        }
    };

    template <>
    struct Monoid<std::string> : Semigroup<std::string> {
        static std::string zero() {
            return std::string();
        }
    };

    template <typename T>
    struct Semigroup<std::vector<T>> {
        static std::vector<T> append(std::vector<T> a, const std::vector<T>& b) {
            a.insert(a.end(), b.begin(), b.end());
            return a;
        }
    };

    template <typename T>
    struct Monoid<std::vector<T>> : Semigroup<std::vector<T>> {
        static std::vector<T> zero() {
            return std::vector<T>();
        }
    };

    // Wrappers selecting another semigroup for the same value.
    template <typename T>
    struct Max {
        T value;
    };

    template <typename T>
    struct Min {
        T value;
    };

    template <typename T>
    struct First {
        T value;
    };

    template <typename T>
    struct Last {
        T value;
    };

    template <typename T>
    bool operator==(const Max<T>& a, const Max<T>& b) { return a.value == b.value; }
    template <typename T>
    bool operator==(const Min<T>& a, const Min<T>& b) { return a.value == b.value; }
    template <typename T>
    bool operator==(const First<T>& a, const First<T>& b) { return a.value == b.value; }
    template <typename T>
    bool operator==(const Last<T>& a, const Last<T>& b) { return a.value == b.value; }

    template <typename T>
    struct Semigroup<Max<T>> {
        static Max<T> append(const Max<T>& a, const Max<T>& b) {
            return a.value < b.value ? b : a;
        }
    };

    template <typename T>
    struct Semigroup<Min<T>> {
        static Min<T> append(const Min<T>& a, const Min<T>& b) {
            return b.value < a.value ? b : a;
        }
    };

    template <typename T>
    struct Semigroup<First<T>> {
        static First<T> append(const First<T>& a, const First<T>&) {
            return a;
        }
    };

    template <typename T>
    struct Semigroup<Last<T>> {
        static Last<T> append(const Last<T>&, const Last<T>& b) {
            return b;
        }
    };

} // namespace coalg

#endif
