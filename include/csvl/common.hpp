#pragma once
#include <cstddef>
#include <utility>
#include <vector>

namespace csvl {

using string_range = std::pair<const char*, const char*>;
using split_data = std::vector<string_range>;

constexpr inline char default_delimiter = ',';
constexpr inline char quote_character = '"';

template <bool StringError>
void assert_string_error_defined() {
    static_assert(StringError,
                  "'string_error' needs to be enabled to use 'error_msg'");
}

} /* namespace csvl */
