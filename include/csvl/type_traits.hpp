#pragma once
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

namespace csvl {

////////////////
// is instance of
////////////////

template <template <typename...> class Template, typename T>
struct is_instance_of : std::false_type {};

template <template <typename...> class Template, typename... Ts>
struct is_instance_of<Template, Template<Ts...>> : std::true_type {};

template <template <typename...> class Template, typename T>
constexpr bool is_instance_of_v =
    is_instance_of<Template, std::remove_cv_t<T>>::value;

////////////////
// tied class
////////////////

// a class with a 'tied' method returning std::tie of its members, in the
// order they appear in a line
template <typename T, typename = void>
struct tied_class : std::false_type {};

template <typename T>
struct tied_class<T, std::void_t<decltype(std::declval<T&>().tied())>>
    : std::bool_constant<std::is_class_v<T>> {};

template <typename T>
constexpr bool tied_class_v = tied_class<T>::value;

template <typename Tuple>
struct decayed_tuple;

template <typename... Ts>
struct decayed_tuple<std::tuple<Ts...>> {
    using type = std::tuple<std::decay_t<Ts>...>;
};

// value types of the members a tied class binds
template <typename T>
using tied_tuple_t =
    typename decayed_tuple<decltype(std::declval<T&>().tied())>::type;

////////////////
// tuple to object
////////////////

// aggregate initializes a 'T' with the elements of the tuple
template <typename T, typename... Ts>
[[nodiscard]] T to_object(std::tuple<Ts...>&& values) {
    return std::apply(
        [](auto&&... args) { return T{std::forward<decltype(args)>(args)...}; },
        std::move(values));
}

} /* namespace csvl */
