#ifndef COALG_CAPABILITY_HPP
#define COALG_CAPABILITY_HPP

#include <type_traits>
#include <utility>

namespace coalg {

    // A shape is a tag type with an allocator-style rebind:
    //
    //   struct vector_shape {
    //       template <typename A> struct rebind { typedef std::vector<A> other; };
    //   };
    //
    // Every container a shape produces exposes value_type.
    template <typename S, typename A>
    using apply_t = typename S::template rebind<A>::other;

    template <typename FA>
    using value_type_t = typename std::decay<FA>::type::value_type;

    template <typename F, typename... Args>
    using result_t = typename std::decay<decltype(std::declval<F>()(std::declval<Args>()...))>::type;

    // Base of every capability a shape does not have.
    struct not_defined {};

    template <typename Instance>
    struct is_defined
        : std::integral_constant<bool, !std::is_base_of<not_defined, Instance>::value> {};

    // Capabilities. Specialise for a shape to give it the capability.
    template <typename S> struct Functor : not_defined {};
    template <typename S> struct Foldable : not_defined {};
    template <typename S> struct Foldable1 : not_defined {};
    template <typename S> struct Traverse : not_defined {};
    template <typename S> struct Traverse1 : not_defined {};
    template <typename S> struct Apply : not_defined {};
    template <typename S> struct Applicative : not_defined {};
    template <typename S> struct Plus : not_defined {};
    template <typename S> struct PlusEmpty : not_defined {};
    template <typename S> struct Bind : not_defined {};
    template <typename S> struct Monad : not_defined {};
    template <typename S> struct Comonad : not_defined {};
    template <typename S> struct Equal : not_defined {};

    template <typename S> struct is_functor : is_defined<Functor<S>> {};
    template <typename S> struct is_foldable : is_defined<Foldable<S>> {};
    template <typename S> struct is_foldable1 : is_defined<Foldable1<S>> {};
    template <typename S> struct is_traverse : is_defined<Traverse<S>> {};
    template <typename S> struct is_traverse1 : is_defined<Traverse1<S>> {};
    template <typename S> struct is_apply : is_defined<Apply<S>> {};
    template <typename S> struct is_applicative : is_defined<Applicative<S>> {};
    template <typename S> struct is_plus : is_defined<Plus<S>> {};
    template <typename S> struct is_plus_empty : is_defined<PlusEmpty<S>> {};
    template <typename S> struct is_bind : is_defined<Bind<S>> {};
    template <typename S> struct is_monad : is_defined<Monad<S>> {};
    template <typename S> struct is_comonad : is_defined<Comonad<S>> {};
    template <typename S> struct is_equal : is_defined<Equal<S>> {};

    // Instance resolution. A capability that can be derived in several ways
    // lists its derivations as rules, most specific first:
    //
    //   resolve<rule<is_foldable1<S>, CofreeFoldable1<S, E>>,
    //           rule<is_foldable<S>, CofreeFoldable<S, E>>>::type
    //
    // The first rule whose condition holds is the instance; when none holds
    // the capability is not_defined. Only the selected instance is ever
    // instantiated.
    template <typename Condition, typename Instance>
    struct rule {
        static constexpr bool value = Condition::value;
        typedef Instance type;
    };

    template <typename... Rules>
    struct resolve {
        typedef not_defined type;
    };

    template <typename Rule, typename... Rest>
    struct resolve<Rule, Rest...>
        : std::conditional<Rule::value, Rule, resolve<Rest...>>::type {};

} // namespace coalg

#endif
