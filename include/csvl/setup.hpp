#pragma once
#include <cstddef>
#include <type_traits>

namespace csvl {

////////////////
// options
////////////////

// keep a message describing the last error, available through 'error_msg'
class string_error {};

// throw csvl::exception instead of recording the error
class throw_on_error {};

////////////////
// setup
////////////////

template <typename... Options>
struct setup {
private:
    template <typename Option>
    constexpr static size_t occurrences =
        (size_t{0} + ... + (std::is_same_v<Options, Option> ? 1 : 0));

    constexpr static size_t string_error_count =
        occurrences<csvl::string_error>;

    constexpr static size_t throw_on_error_count =
        occurrences<csvl::throw_on_error>;

public:
    constexpr static bool string_error = string_error_count != 0;
    constexpr static bool throw_on_error = throw_on_error_count != 0;

private:
    static_assert(string_error_count < 2,
                  "csvl::string_error given more than once");

    static_assert(throw_on_error_count < 2,
                  "csvl::throw_on_error given more than once");

    static_assert(!(string_error && throw_on_error),
                  "csvl::string_error and csvl::throw_on_error exclude "
                  "each other");

    static_assert(string_error_count + throw_on_error_count ==
                      sizeof...(Options),
                  "unknown option passed to csvl::setup");
};

} /* namespace csvl */
