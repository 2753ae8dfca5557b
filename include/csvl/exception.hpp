#pragma once
#include "error.hpp"
#include <exception>
#include <string>
#include <utility>

namespace csvl {

////////////////
// exception
////////////////

class exception : public std::exception {
    csvl::error error_;
    std::string msg_;

public:
    exception(csvl::error e)
        : error_{std::move(e)}, msg_{to_string(error_)} {
    }

    [[nodiscard]] char const* what() const noexcept override {
        return msg_.c_str();
    }

    [[nodiscard]] const csvl::error& error() const noexcept {
        return error_;
    }

    [[nodiscard]] error_kind kind() const noexcept {
        return error_.kind;
    }
};

template <bool ThrowOnError>
void throw_if_throw_on_error(const csvl::error& e) {
    if constexpr (ThrowOnError) {
        throw csvl::exception{e};
    }
}

} /* namespace csvl */
