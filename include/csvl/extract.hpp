#pragma once
#include <charconv>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#ifndef CSVL_DISABLE_FAST_FLOAT
#include <fast_float/fast_float.h>
#else
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#endif

namespace csvl {

////////////////
// sign
////////////////

// from_chars only understands a leading '-', a single leading '+' is
// dropped before converting
[[nodiscard]] inline const char* skip_plus_sign(const char* const begin,
                                                const char* const end) {
    if (end - begin > 1 && *begin == '+' && begin[1] != '+' &&
        begin[1] != '-') {
        return begin + 1;
    }
    return begin;
}

// an infinite result is only valid if the text spells it, anything else
// overflowed the type
[[nodiscard]] inline bool spells_infinity(const char* begin,
                                          const char* const end) {
    if (begin != end && (*begin == '+' || *begin == '-')) {
        ++begin;
    }
    return begin != end && (*begin == 'i' || *begin == 'I');
}

////////////////
// to num
////////////////

template <typename T>
[[nodiscard]] std::enable_if_t<std::is_integral_v<T>, std::optional<T>> to_num(
    const char* const begin, const char* const end) {
    T value;
    const auto result = std::from_chars(skip_plus_sign(begin, end), end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

#ifndef CSVL_DISABLE_FAST_FLOAT

template <typename T>
[[nodiscard]] std::enable_if_t<std::is_floating_point_v<T>, std::optional<T>>
to_num(const char* const begin, const char* const end) {
    static_assert(!std::is_same_v<T, long double>,
                  "long double fields are not supported");

    T value;
    const auto result =
        fast_float::from_chars(skip_plus_sign(begin, end), end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    if (std::isinf(value) && !spells_infinity(begin, end)) {
        return std::nullopt;
    }
    return value;
}

#else

// strtod needs a null terminated copy, short fields are copied to the stack
template <typename T>
[[nodiscard]] std::enable_if_t<std::is_floating_point_v<T>, std::optional<T>>
to_num(const char* const begin, const char* const end) {
    static_assert(!std::is_same_v<T, long double>,
                  "long double fields are not supported");

    // strtod skips leading whitespace and accepts an empty range
    if (begin == end || std::isspace(static_cast<unsigned char>(*begin))) {
        return std::nullopt;
    }

    // strtod also reads hexadecimal floats, fast_float does not
    const auto is_hex_mark = [](char c) { return c == 'x' || c == 'X'; };
    if (std::any_of(begin, end, is_hex_mark)) {
        return std::nullopt;
    }

    constexpr static size_t stack_size = 64;
    const auto size = static_cast<size_t>(end - begin);

    std::array<char, stack_size + 1> stack_copy;
    std::string heap_copy;
    char* text = stack_copy.data();
    if (size > stack_size) {
        heap_copy.assign(begin, end);
        text = heap_copy.data();
    } else {
        std::memcpy(text, begin, size);
        text[size] = '\0';
    }

    char* parsed_end = nullptr;
    T value;
    errno = 0;
    if constexpr (std::is_same_v<T, float>) {
        value = std::strtof(text, &parsed_end);
    } else {
        value = std::strtod(text, &parsed_end);
    }

    if (parsed_end != text + size) {
        return std::nullopt;
    }
    // HUGE_VAL on overflow, an underflow keeps its rounded value
    if (errno == ERANGE && std::isinf(value)) {
        return std::nullopt;
    }
    return value;
}

#endif

////////////////
// extract
////////////////

namespace error_detail {
template <typename T>
constexpr bool always_false = false;
} /* namespace error_detail */

// converts the field [begin, end) into 'value', returns false if the text is
// not valid for the type, specialize it to decode fields into other types
template <typename T>
[[nodiscard]] bool extract(const char* begin, const char* end, T& value) {
    if constexpr (std::is_arithmetic_v<T>) {
        auto converted = to_num<T>(begin, end);
        if (!converted) {
            return false;
        }
        value = *converted;
        return true;
    } else {
        static_assert(error_detail::always_false<T>,
                      "no conversion for the given type, specialize "
                      "csvl::extract for it");
        return false;
    }
}

template <>
[[nodiscard]] inline bool extract(const char* begin, const char* end,
                                  bool& value) {
    const std::string_view text{begin, static_cast<size_t>(end - begin)};
    if (text == "true") {
        value = true;
        return true;
    }
    if (text == "false") {
        value = false;
        return true;
    }
    return false;
}

template <>
[[nodiscard]] inline bool extract(const char* begin, const char* end,
                                  char& value) {
    if (end - begin != 1) {
        return false;
    }
    value = *begin;
    return true;
}

template <>
[[nodiscard]] inline bool extract(const char* begin, const char* end,
                                  std::string& value) {
    value.assign(begin, end);
    return true;
}

// points into the line, or into the splitter buffer if it was unescaped
template <>
[[nodiscard]] inline bool extract(const char* begin, const char* end,
                                  std::string_view& value) {
    value = std::string_view{begin, static_cast<size_t>(end - begin)};
    return true;
}

} /* namespace csvl */
