#pragma once
#include "error.hpp"
#include "type_traits.hpp"
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace csvl {

////////////////
// shape kind
////////////////

enum class shape_kind {
    scalar,
    optional,
    tuple,
    named_struct,
    sequence,
    map,
    unknown
};

template <typename T, typename = void>
struct is_map_like : std::false_type {};

template <typename T>
struct is_map_like<T, std::void_t<typename T::key_type,
                                  typename T::mapped_type>> : std::true_type {};

template <typename T>
struct is_tuple_like {
    constexpr static bool value =
        is_instance_of_v<std::tuple, T> || is_instance_of_v<std::pair, T>;
};

template <typename T>
[[nodiscard]] constexpr shape_kind classify() {
    if constexpr (scalar_kind_of<T>() != scalar_kind::none) {
        return shape_kind::scalar;
    } else if constexpr (is_instance_of_v<std::optional, T>) {
        return shape_kind::optional;
    } else if constexpr (is_tuple_like<T>::value) {
        return shape_kind::tuple;
    } else if constexpr (is_instance_of_v<std::vector, T>) {
        return shape_kind::sequence;
    } else if constexpr (is_map_like<T>::value) {
        return shape_kind::map;
    } else if constexpr (tied_class_v<T>) {
        return shape_kind::named_struct;
    } else {
        return shape_kind::unknown;
    }
}

template <typename T>
constexpr shape_kind shape_of_v = classify<std::remove_cv_t<T>>();

////////////////
// member tuple
////////////////

// types of the fields a compound shape binds, in declaration order
template <typename T, typename = void>
struct members {
    using type = std::tuple<>;
};

template <typename... Ts>
struct members<std::tuple<Ts...>> {
    using type = std::tuple<Ts...>;
};

template <typename T, typename U>
struct members<std::pair<T, U>> {
    using type = std::tuple<T, U>;
};

template <typename T>
struct members<
    T, std::enable_if_t<tied_class_v<T> && !is_tuple_like<T>::value>> {
    using type = tied_tuple_t<T>;
};

template <typename T>
using members_t = typename members<T>::type;

////////////////
// validation
////////////////

// a leaf consumes exactly one field, unknown types are treated as leaves
// so that 'extract' reports them at compile time
template <typename T>
[[nodiscard]] constexpr bool is_leaf() {
    constexpr auto kind = shape_of_v<T>;
    return kind == shape_kind::scalar || kind == shape_kind::unknown;
}

template <typename T>
[[nodiscard]] constexpr bool is_optional_leaf() {
    if constexpr (shape_of_v<T> == shape_kind::optional) {
        return is_leaf<typename T::value_type>();
    } else {
        return false;
    }
}

template <typename T>
[[nodiscard]] constexpr const char* sequence_error() {
    using element = typename T::value_type;
    if constexpr (is_leaf<element>() || is_optional_leaf<element>()) {
        return nullptr;
    } else {
        return "sequence elements must consume exactly one field";
    }
}

template <typename T>
[[nodiscard]] constexpr const char* member_error(bool last) {
    constexpr auto kind = shape_of_v<T>;
    if constexpr (is_leaf<T>() || is_optional_leaf<T>()) {
        return nullptr;
    } else if constexpr (kind == shape_kind::sequence) {
        if (!last) {
            return "a sequence can only be the last member";
        }
        return sequence_error<T>();
    } else if constexpr (kind == shape_kind::map) {
        return "map-shaped member, a line carries no keys";
    } else {
        return "nested compound member";
    }
}

template <typename... Ts, size_t... Is>
[[nodiscard]] constexpr const char* members_error(std::tuple<Ts...>*,
                                                  std::index_sequence<Is...>) {
    const char* reason = nullptr;
    ((reason = (reason != nullptr)
                   ? reason
                   : member_error<Ts>(Is + 1 == sizeof...(Ts))),
     ...);
    return reason;
}

// nullptr if 'T' can be decoded from a single line, otherwise the reason
// why it cannot
template <typename T>
[[nodiscard]] constexpr const char* unsupported_shape_reason() {
    constexpr auto kind = shape_of_v<T>;
    if constexpr (kind == shape_kind::map) {
        return "map-shaped target, a line carries no keys";
    } else if constexpr (kind == shape_kind::optional) {
        if constexpr (is_optional_leaf<T>()) {
            return nullptr;
        } else {
            return "optional of a compound shape";
        }
    } else if constexpr (kind == shape_kind::sequence) {
        return sequence_error<T>();
    } else if constexpr (kind == shape_kind::tuple ||
                         kind == shape_kind::named_struct) {
        using tuple_type = members_t<T>;
        return members_error(
            static_cast<tuple_type*>(nullptr),
            std::make_index_sequence<std::tuple_size_v<tuple_type>>{});
    } else {
        return nullptr;
    }
}

////////////////
// borrows
////////////////

template <typename T>
constexpr bool borrows();

template <typename... Ts>
[[nodiscard]] constexpr bool any_borrows(std::tuple<Ts...>*) {
    return (false || ... || borrows<Ts>());
}

// true if any leaf of 'T' is a std::string_view
template <typename T>
constexpr bool borrows() {
    constexpr auto kind = shape_of_v<T>;
    if constexpr (std::is_same_v<std::remove_cv_t<T>, std::string_view>) {
        return true;
    } else if constexpr (kind == shape_kind::optional ||
                         kind == shape_kind::sequence) {
        return borrows<typename T::value_type>();
    } else if constexpr (kind == shape_kind::tuple ||
                         kind == shape_kind::named_struct) {
        return any_borrows(static_cast<members_t<T>*>(nullptr));
    } else {
        return false;
    }
}

template <typename T>
constexpr bool borrows_v = borrows<T>();

} /* namespace csvl */
