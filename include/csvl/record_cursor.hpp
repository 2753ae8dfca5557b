#pragma once
#include "common.hpp"
#include <cstddef>
#include <optional>

namespace csvl {

////////////////
// record cursor
////////////////

// forward only view over the fields of one split line, it borrows the
// split data and must not outlive it
class record_cursor {
public:
    explicit record_cursor(const split_data& fields) : fields_{fields} {
    }

    // returns the next field and advances, std::nullopt at the end of the
    // record
    [[nodiscard]] std::optional<string_range> next_field() {
        if (position_ == fields_.size()) {
            return std::nullopt;
        }
        return fields_[position_++];
    }

    [[nodiscard]] size_t remaining_count() const {
        return fields_.size() - position_;
    }

    // index of the last field returned by next_field, 0 if none was
    [[nodiscard]] size_t current_index() const {
        return position_ == 0 ? 0 : position_ - 1;
    }

    [[nodiscard]] size_t consumed_count() const {
        return position_;
    }

private:
    const split_data& fields_;
    size_t position_{0};
};

} /* namespace csvl */
