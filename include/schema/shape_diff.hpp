#pragma once

#include "reflect/shape.hpp"

#include <string>
#include <vector>

namespace shapesql {

enum class DiffKind : uint8_t {
    EQUAL,      // structurally identical
    DIFFERENT,  // incomparable or changed non-record shapes
    RECORD,     // two records; see field lists
    SEQUENCE,   // two differing sequence containers
};

/**
 * @brief Structural difference between two shapes (metadata only, never values).
 *
 * For two records the field lists are ordered: insertions follow the `to`
 * shape, deletions/updates/unchanged follow the `from` shape.
 */
class ShapeDiff {
public:
    [[nodiscard]] static ShapeDiff compute(ShapePtr from, ShapePtr to);
    [[nodiscard]] static bool shapes_equal(const Shape& a, const Shape& b);

    [[nodiscard]] DiffKind kind() const { return kind_; }
    [[nodiscard]] bool is_equal() const { return kind_ == DiffKind::EQUAL; }

    [[nodiscard]] const ShapePtr& from() const { return from_; }
    [[nodiscard]] const ShapePtr& to() const { return to_; }

    [[nodiscard]] const std::vector<std::string>& insertions() const { return insertions_; }
    [[nodiscard]] const std::vector<std::string>& deletions() const { return deletions_; }
    [[nodiscard]] const std::vector<std::string>& updates() const { return updates_; }
    [[nodiscard]] const std::vector<std::string>& unchanged() const { return unchanged_; }

    [[nodiscard]] bool has_field_changes() const {
        return !insertions_.empty() || !deletions_.empty() || !updates_.empty();
    }

private:
    ShapeDiff(DiffKind kind, ShapePtr from, ShapePtr to);

    DiffKind kind_;
    ShapePtr from_;
    ShapePtr to_;
    std::vector<std::string> insertions_;
    std::vector<std::string> deletions_;
    std::vector<std::string> updates_;
    std::vector<std::string> unchanged_;
};

} // namespace shapesql
