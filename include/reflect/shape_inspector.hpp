#pragma once

#include "reflect/shape.hpp"

#include <string>
#include <vector>

namespace shapesql {

/**
 * @brief Read-only classification queries over a Shape.
 *
 * All queries are total: they never fail and never mutate the shape.
 * Capability queries (is_text, is_sequence, ...) look at the shape's
 * definition class rather than at its type identifier.
 */
class ShapeInspector {
public:
    [[nodiscard]] static ShapeKind classify(const Shape& shape) { return shape.kind; }

    [[nodiscard]] static bool is_record(const Shape& shape) {
        return shape.kind == ShapeKind::RECORD;
    }

    // Ordered fields of a record; empty for every other kind
    [[nodiscard]] static const std::vector<Field>& fields(const Shape& shape);

    // Referenced shape of a REFERENCE, nullptr for other kinds or when missing
    [[nodiscard]] static const Shape* referenced(const Shape& shape);

    // Wrapped shape of an optional, nullptr otherwise
    [[nodiscard]] static const Shape* optional_inner(const Shape& shape);

    [[nodiscard]] static bool is_text(const Shape& shape);
    [[nodiscard]] static bool is_optional(const Shape& shape);
    [[nodiscard]] static bool is_sequence(const Shape& shape);
    [[nodiscard]] static bool is_associative(const Shape& shape);
    [[nodiscard]] static bool is_fixed_array(const Shape& shape);

    // Short description for diagnostics, e.g. "record User", "array [u8; 4]"
    [[nodiscard]] static std::string describe(const Shape& shape);
};

} // namespace shapesql
