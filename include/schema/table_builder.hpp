#pragma once

#include "core/error.hpp"
#include "reflect/shape.hpp"
#include "schema/table.hpp"

namespace shapesql {

/**
 * @brief Converts a record shape into a Table definition.
 *
 * Single linear pass over the fields, no state kept between calls, safe to
 * call concurrently. Errors are terminal and no partial Table is returned:
 *   - NOT_A_STRUCT          top-level shape is not a record (tagged types included)
 *   - UNSUPPORTED_TYPE      a field's shape has no SQL mapping
 *   - MULTIPLE_PRIMARY_KEYS more than one field carries psql::primary_key
 */
class TableBuilder {
public:
    [[nodiscard]] static Result<Table> convert(const Shape& shape);

    // Lowercased type identifier; generic arguments are not part of the name
    [[nodiscard]] static std::string table_name(const Shape& shape);

    [[nodiscard]] static Result<Column> field_to_column(const Field& field);
};

} // namespace shapesql
