#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

namespace csvl {

////////////////
// scalar kind
////////////////

enum class scalar_kind {
    none,
    boolean,
    i8,
    i16,
    i32,
    i64,
    u8,
    u16,
    u32,
    u64,
    f32,
    f64,
    character,
    string,
    custom
};

[[nodiscard]] constexpr const char* to_string(scalar_kind kind) {
    switch (kind) {
    case scalar_kind::boolean:
        return "bool";
    case scalar_kind::i8:
        return "i8";
    case scalar_kind::i16:
        return "i16";
    case scalar_kind::i32:
        return "i32";
    case scalar_kind::i64:
        return "i64";
    case scalar_kind::u8:
        return "u8";
    case scalar_kind::u16:
        return "u16";
    case scalar_kind::u32:
        return "u32";
    case scalar_kind::u64:
        return "u64";
    case scalar_kind::f32:
        return "f32";
    case scalar_kind::f64:
        return "f64";
    case scalar_kind::character:
        return "char";
    case scalar_kind::string:
        return "string";
    case scalar_kind::custom:
        return "custom";
    case scalar_kind::none:
        break;
    }
    return "none";
}

template <typename T>
[[nodiscard]] constexpr scalar_kind integral_kind() {
    static_assert(sizeof(T) <= 8, "integer wider than 64 bits");
    constexpr bool is_signed = std::is_signed_v<T>;
    if constexpr (sizeof(T) == 1) {
        return is_signed ? scalar_kind::i8 : scalar_kind::u8;
    } else if constexpr (sizeof(T) == 2) {
        return is_signed ? scalar_kind::i16 : scalar_kind::u16;
    } else if constexpr (sizeof(T) == 4) {
        return is_signed ? scalar_kind::i32 : scalar_kind::u32;
    } else {
        return is_signed ? scalar_kind::i64 : scalar_kind::u64;
    }
}

// kind reported in errors for a leaf of type 'T', 'none' if 'T' is not a
// built in leaf
template <typename T>
[[nodiscard]] constexpr scalar_kind scalar_kind_of() {
    if constexpr (std::is_same_v<T, bool>) {
        return scalar_kind::boolean;
    } else if constexpr (std::is_same_v<T, char>) {
        return scalar_kind::character;
    } else if constexpr (std::is_integral_v<T>) {
        return integral_kind<T>();
    } else if constexpr (std::is_same_v<T, float>) {
        return scalar_kind::f32;
    } else if constexpr (std::is_same_v<T, double>) {
        return scalar_kind::f64;
    } else if constexpr (std::is_same_v<T, std::string> ||
                         std::is_same_v<T, std::string_view>) {
        return scalar_kind::string;
    } else {
        return scalar_kind::none;
    }
}

////////////////
// error
////////////////

enum class error_kind {
    none,
    malformed,
    missing_field,
    trailing_fields,
    field_parse,
    unsupported_shape
};

[[nodiscard]] constexpr const char* to_string(error_kind kind) {
    switch (kind) {
    case error_kind::malformed:
        return "malformed";
    case error_kind::missing_field:
        return "missing field";
    case error_kind::trailing_fields:
        return "trailing fields";
    case error_kind::field_parse:
        return "field parse";
    case error_kind::unsupported_shape:
        return "unsupported shape";
    case error_kind::none:
        break;
    }
    return "none";
}

// describes why a line could not be decoded, fields not relevant to the
// kind are left at their defaults
struct error {
    error_kind kind{error_kind::none};

    // zero based field index, for 'missing_field' and 'field_parse'
    size_t index{0};

    // text of the offending field, for 'field_parse'
    std::string raw_text;

    // leaf the field was requested as, for 'missing_field' and 'field_parse'
    scalar_kind expected_kind{scalar_kind::none};

    // surplus fields, for 'trailing_fields'
    size_t remaining_count{0};

    // splitter message for 'malformed', offending shape for
    // 'unsupported_shape'
    std::string reason;

    [[nodiscard]] bool empty() const {
        return kind == error_kind::none;
    }

    void clear() {
        *this = error{};
    }
};

[[nodiscard]] inline std::string column_suffix(size_t index) {
    return "at column " + std::to_string(index + 1);
}

[[nodiscard]] inline std::string to_string(const error& e) {
    std::string msg;
    msg.reserve(64);

    switch (e.kind) {
    case error_kind::malformed:
        msg.append("malformed line: ").append(e.reason);
        break;
    case error_kind::missing_field:
        msg.append("missing field ")
            .append(column_suffix(e.index))
            .append(", expected \'")
            .append(to_string(e.expected_kind))
            .append("\'");
        break;
    case error_kind::trailing_fields:
        msg.append("invalid number of columns, ")
            .append(std::to_string(e.remaining_count))
            .append(" trailing field(s)");
        break;
    case error_kind::field_parse:
        msg.append("invalid conversion for parameter ")
            .append(column_suffix(e.index))
            .append(" as \'")
            .append(to_string(e.expected_kind))
            .append("\': \'")
            .append(e.raw_text)
            .append("\'");
        break;
    case error_kind::unsupported_shape:
        msg.append("unsupported shape: ").append(e.reason);
        break;
    case error_kind::none:
        break;
    }

    return msg;
}

} /* namespace csvl */
