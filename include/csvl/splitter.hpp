#pragma once
#include "common.hpp"
#include "error.hpp"
#include "exception.hpp"
#include "setup.hpp"
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace csvl {

// splits one line into fields, a field starting with a quote may contain
// delimiters and line breaks, a doubled quote inside of it stands for a
// single quote, the first unquoted line break ends the record
template <typename... Options>
class splitter {
private:
    constexpr static auto string_error = setup<Options...>::string_error;
    constexpr static auto throw_on_error = setup<Options...>::throw_on_error;

    using error_type = std::conditional_t<string_error, std::string, bool>;

public:
    [[nodiscard]] bool valid() const {
        if constexpr (string_error) {
            return error_.empty();
        } else if constexpr (throw_on_error) {
            return true;
        } else {
            return !error_;
        }
    }

    [[nodiscard]] const std::string& error_msg() const {
        assert_string_error_defined<string_error>();
        return error_;
    }

    [[nodiscard]] bool unterminated_quote() const {
        return unterminated_quote_;
    }

    // error describing the last failed split
    [[nodiscard]] csvl::error malformed_error() const {
        csvl::error e;
        e.kind = error_kind::malformed;
        e.reason = unterminated_quote_msg();
        return e;
    }

    // the returned ranges point either into 'line' or, if the line had to
    // be unescaped, into a buffer owned by the splitter, they stay valid
    // until the next call to split
    const split_data& split(std::string_view line,
                            char delimiter = default_delimiter) {
        clear_error();
        split_data_.clear();
        delimiter_ = delimiter;

        if (!line.empty() &&
            std::memchr(line.data(), quote_character, line.size()) != nullptr) {
            buffer_.assign(line.data(), line.size());
            writable_ = buffer_.data();
            line_ = writable_;
        } else {
            writable_ = nullptr;
            line_ = line.data();
        }

        begin_ = line_;
        end_of_line_ = line_ + line.size();

        for (done_ = false; !done_; read())
            ;

        return split_data_;
    }

private:
    ////////////////
    // error
    ////////////////

    void clear_error() {
        if constexpr (string_error) {
            error_.clear();
        } else {
            error_ = false;
        }
        unterminated_quote_ = false;
    }

    [[nodiscard]] std::string unterminated_quote_msg() const {
        return "unterminated quote at position: " +
               std::to_string(quote_position_);
    }

    void set_error_unterminated_quote(size_t n) {
        unterminated_quote_ = true;
        quote_position_ = n;
        if constexpr (string_error) {
            error_.clear();
            error_.append(unterminated_quote_msg());
        } else if constexpr (throw_on_error) {
            throw csvl::exception{malformed_error()};
        } else {
            error_ = true;
        }
    }

    ////////////////
    // matching
    ////////////////

    [[nodiscard]] static bool is_line_break(char c) {
        return c == '\n' || c == '\r';
    }

    [[nodiscard]] bool at_end(const char* curr) const {
        return curr == end_of_line_;
    }

    ////////////////
    // reading
    ////////////////

    void push_and_start_next(const char* field_end, const char* next_begin) {
        split_data_.emplace_back(begin_, field_end);
        begin_ = next_begin;
    }

    void push_and_finish(const char* field_end) {
        split_data_.emplace_back(begin_, field_end);
        done_ = true;
    }

    void read() {
        if (!at_end(begin_) && *begin_ == quote_character) {
            read_quoted();
            return;
        }
        read_normal();
    }

    void read_normal() {
        for (end_ = begin_; !at_end(end_); ++end_) {
            if (*end_ == delimiter_) {
                push_and_start_next(end_, end_ + 1);
                return;
            }

            // eg: ...,hello\r\n -> hello
            if (is_line_break(*end_)) {
                break;
            }
        }
        push_and_finish(end_);
    }

    // the unescaped content is shifted to the left in place, starting at
    // the opening quote, the write position never passes the read position
    void read_quoted() {
        char* curr = writable_ + (begin_ - line_);
        end_ = begin_ + 1;

        while (true) {
            if (at_end(end_)) {
                // eg: ...,"hell\0 -> quote not terminated
                set_error_unterminated_quote(begin_ - line_);
                done_ = true;
                return;
            }

            if (*end_ != quote_character) {
                *curr++ = *end_++;
                continue;
            }
            // quote found

            // double quote
            // eg: ...,"hel""lo",... -> hel"lo
            if (!at_end(end_ + 1) && end_[1] == quote_character) {
                *curr++ = quote_character;
                end_ += 2;
                continue;
            }

            ++end_;
            break;
        }

        // data after the closing quote is kept
        // eg: ...,"hel"lo,... -> hello
        while (!at_end(end_)) {
            if (*end_ == delimiter_) {
                push_and_start_next(curr, end_ + 1);
                return;
            }

            if (is_line_break(*end_)) {
                break;
            }

            *curr++ = *end_++;
        }
        push_and_finish(curr);
    }

    ////////////////
    // members
    ////////////////

    error_type error_{};
    bool unterminated_quote_{false};
    size_t quote_position_{0};
    bool done_{true};
    char delimiter_{default_delimiter};

    std::string buffer_;
    split_data split_data_;

    char* writable_{nullptr};
    const char* line_{nullptr};
    const char* begin_{nullptr};
    const char* end_{nullptr};
    const char* end_of_line_{nullptr};
};

} /* namespace csvl */
