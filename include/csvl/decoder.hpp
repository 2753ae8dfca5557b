#pragma once
#include "common.hpp"
#include "deserializer.hpp"
#include "error.hpp"
#include "exception.hpp"
#include "record_cursor.hpp"
#include "setup.hpp"
#include "shape.hpp"
#include "splitter.hpp"
#include "type_traits.hpp"
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace csvl {

////////////////
// decoded type
////////////////

// a single requested type is returned as is, multiple types are returned
// as a tuple
template <typename T, typename... Ts>
struct decoded {
    using type = std::tuple<T, Ts...>;
};

template <typename T>
struct decoded<T> {
    using type = T;
};

template <typename T, typename... Ts>
using decoded_t = typename decoded<T, Ts...>::type;

////////////////
// line decoder
////////////////

template <typename... Options>
class line_decoder {
    constexpr static auto string_error = setup<Options...>::string_error;
    constexpr static auto throw_on_error = setup<Options...>::throw_on_error;

public:
    // splits the line by the given delimiter and fills a 'T' from the
    // fields, or a std::tuple<T, Ts...> if more types are given,
    // std::string_view leaves point into 'line' or into the decoder and are
    // valid until the next call
    template <typename T, typename... Ts>
    [[nodiscard]] decoded_t<T, Ts...> decode(
        std::string_view line, char delim = default_delimiter) {
        using target = decoded_t<T, Ts...>;

        clear_error();

        // rejected before the line is looked at
        constexpr const char* reason = unsupported_shape_reason<target>();
        if constexpr (reason != nullptr) {
            set_error_unsupported_shape(reason);
            return target{};
        } else {
            const auto& fields = splitter_.split(line, delim);
            if (!splitter_.valid()) {
                set_error_bad_split();
                return target{};
            }

            record_cursor cursor{fields};
            deserializer visitor{cursor};

            auto value = visitor.template deserialize<target>();
            if (!visitor.valid()) {
                set_error(visitor.error());
                return target{};
            }
            return value;
        }
    }

    // same as above, but returns a 'T' object created from the extracted
    // values of type 'Ts'
    template <typename T, typename... Ts>
    [[nodiscard]] T decode_object(std::string_view line,
                                  char delim = default_delimiter) {
        return to_object<T>(decode<std::tuple<Ts...>>(line, delim));
    }

    [[nodiscard]] bool valid() const {
        return error_.empty();
    }

    [[nodiscard]] const csvl::error& error() const {
        return error_;
    }

    [[nodiscard]] const std::string& error_msg() const {
        assert_string_error_defined<string_error>();
        return error_msg_;
    }

    [[nodiscard]] bool unterminated_quote() const {
        return splitter_.unterminated_quote();
    }

    // splits the line without converting it, the ranges are valid until the
    // next call
    const split_data& split(std::string_view line,
                            char delim = default_delimiter) {
        clear_error();
        const auto& fields = splitter_.split(line, delim);
        if (!splitter_.valid()) {
            set_error_bad_split();
        }
        return fields;
    }

private:
    ////////////////
    // error
    ////////////////

    void clear_error() {
        error_.clear();
        if constexpr (string_error) {
            error_msg_.clear();
        }
    }

    void set_error(const csvl::error& e) {
        error_ = e;
        if constexpr (string_error) {
            error_msg_ = to_string(error_);
        }
        throw_if_throw_on_error<throw_on_error>(error_);
    }

    void set_error_bad_split() {
        set_error(splitter_.malformed_error());
    }

    void set_error_unsupported_shape(const char* reason) {
        csvl::error e;
        e.kind = error_kind::unsupported_shape;
        e.reason = reason;
        set_error(e);
    }

    ////////////////
    // members
    ////////////////

    // the splitter never throws, a bad split goes through set_error so
    // 'error_' is filled before the exception leaves
    using splitter_type =
        std::conditional_t<throw_on_error, splitter<>, splitter<Options...>>;

    csvl::error error_;
    std::string error_msg_;
    splitter_type splitter_;
};

////////////////
// single line
////////////////

// the decoder used by the functions below does not outlive the call, views
// into its unescape buffer would dangle
template <typename T>
void assert_no_borrowed_leaves() {
    static_assert(!borrows_v<T>,
                  "std::string_view leaves need a line_decoder which outlives "
                  "them, use csvl::line_decoder instead");
}

// decodes a comma separated line, throws csvl::exception on failure
template <typename T, typename... Ts>
[[nodiscard]] decoded_t<T, Ts...> from_str(std::string_view line) {
    assert_no_borrowed_leaves<decoded_t<T, Ts...>>();
    line_decoder<throw_on_error> decoder;
    return decoder.template decode<T, Ts...>(line);
}

// decodes a line separated by 'sep', throws csvl::exception on failure
template <typename T, typename... Ts>
[[nodiscard]] decoded_t<T, Ts...> from_str_sep(std::string_view line,
                                               char sep) {
    assert_no_borrowed_leaves<decoded_t<T, Ts...>>();
    line_decoder<throw_on_error> decoder;
    return decoder.template decode<T, Ts...>(line, sep);
}

} /* namespace csvl */
