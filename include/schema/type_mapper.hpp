#pragma once

#include "core/error.hpp"
#include "core/sql_type.hpp"
#include "reflect/shape.hpp"

namespace shapesql {

/**
 * @brief Maps a field's shape to a SQL column type.
 *
 * Rules, first match wins:
 *   bool -> BOOLEAN; integers by layout size (<=2 SMALLINT, 4 INTEGER,
 *   8 and wider BIGINT); floats 4 REAL / 8 DOUBLE PRECISION; char -> CHAR(1);
 *   owned or borrowed text -> TEXT, including a reference to text;
 *   optional T -> NULLABLE(map(T)); list, set, map and nested records ->
 *   JSONB; tagged types -> INTEGER (the discriminant).
 * Everything else (fixed-length arrays, never, non-text references or
 * opaque types) fails with UNSUPPORTED_TYPE.
 */
class TypeMapper {
public:
    [[nodiscard]] static Result<SqlType> map(const Shape& shape);

private:
    static Result<SqlType> map_primitive(const Shape& shape);
    static Result<SqlType> map_reference(const Shape& shape);
    static Result<SqlType> unsupported(const Shape& shape);
};

} // namespace shapesql
