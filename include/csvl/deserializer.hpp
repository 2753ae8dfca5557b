#pragma once
#include "error.hpp"
#include "extract.hpp"
#include "record_cursor.hpp"
#include "shape.hpp"
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace csvl {

////////////////
// deserializer
////////////////

// fills a value of the requested type from the fields of a cursor, the
// shape of the type decides how many fields are consumed and how they are
// converted, the first failure stops the whole deserialization
class deserializer {
public:
    explicit deserializer(record_cursor& cursor) : cursor_{cursor} {
    }

    // returns a default constructed 'T' if not valid afterwards
    template <typename T>
    [[nodiscard]] T deserialize() {
        T value{};

        constexpr const char* reason = unsupported_shape_reason<T>();
        if constexpr (reason != nullptr) {
            set_error_unsupported_shape(reason);
            return value;
        } else {
            visit(value);

            if (valid() && cursor_.remaining_count() != 0) {
                set_error_trailing_fields(cursor_.remaining_count());
            }

            if (!valid()) {
                return T{};
            }
            return value;
        }
    }

    [[nodiscard]] bool valid() const {
        return error_.empty();
    }

    [[nodiscard]] const csvl::error& error() const {
        return error_;
    }

private:
    ////////////////
    // error
    ////////////////

    void set_error_missing_field(size_t index, scalar_kind expected) {
        error_.kind = error_kind::missing_field;
        error_.index = index;
        error_.expected_kind = expected;
    }

    void set_error_trailing_fields(size_t remaining) {
        error_.kind = error_kind::trailing_fields;
        error_.remaining_count = remaining;
    }

    void set_error_field_parse(const string_range field, size_t index,
                               scalar_kind expected) {
        error_.kind = error_kind::field_parse;
        error_.index = index;
        error_.raw_text.assign(field.first, field.second);
        error_.expected_kind = expected;
    }

    void set_error_unsupported_shape(const char* reason) {
        error_.kind = error_kind::unsupported_shape;
        error_.reason = reason;
    }

    ////////////////
    // dispatch
    ////////////////

    template <typename T>
    void visit(T& value) {
        if (!valid()) {
            return;
        }

        constexpr auto kind = shape_of_v<T>;
        if constexpr (kind == shape_kind::optional) {
            visit_optional(value);
        } else if constexpr (kind == shape_kind::tuple) {
            visit_members(value);
        } else if constexpr (kind == shape_kind::named_struct) {
            auto fields = value.tied();
            visit_members(fields);
        } else if constexpr (kind == shape_kind::sequence) {
            visit_sequence(value);
        } else {
            visit_leaf(value);
        }
    }

    ////////////////
    // leaves
    ////////////////

    // types with a user defined 'extract' are reported as custom leaves
    template <typename T>
    [[nodiscard]] constexpr static scalar_kind leaf_kind() {
        constexpr auto kind = scalar_kind_of<T>();
        return kind == scalar_kind::none ? scalar_kind::custom : kind;
    }

    template <typename T>
    void visit_leaf(T& value) {
        const size_t index = leaf_index_++;
        auto field = cursor_.next_field();
        if (!field) {
            set_error_missing_field(index, leaf_kind<T>());
            return;
        }

        if (!extract(field->first, field->second, value)) {
            set_error_field_parse(*field, cursor_.current_index(),
                                  leaf_kind<T>());
        }
    }

    // an empty field, or no field at all, leaves the optional empty
    template <typename T>
    void visit_optional(std::optional<T>& value) {
        ++leaf_index_;
        value.reset();

        auto field = cursor_.next_field();
        if (!field || field->first == field->second) {
            return;
        }

        T raw_value{};
        if (!extract(field->first, field->second, raw_value)) {
            set_error_field_parse(*field, cursor_.current_index(),
                                  leaf_kind<T>());
            return;
        }
        value = std::move(raw_value);
    }

    ////////////////
    // compound
    ////////////////

    template <typename Tuple>
    void visit_members(Tuple& members) {
        std::apply([this](auto&... member) { (visit(member), ...); },
                   members);
    }

    // absorbs every field left in the cursor
    template <typename T, typename Allocator>
    void visit_sequence(std::vector<T, Allocator>& values) {
        values.clear();
        values.reserve(cursor_.remaining_count());

        while (valid() && cursor_.remaining_count() != 0) {
            T element{};
            visit(element);
            values.push_back(std::move(element));
        }
    }

    ////////////////
    // members
    ////////////////

    record_cursor& cursor_;
    csvl::error error_;

    // number of leaves requested so far, differs from the number of
    // consumed fields once an optional was requested after the end of the
    // record
    size_t leaf_index_{0};
};

} /* namespace csvl */
