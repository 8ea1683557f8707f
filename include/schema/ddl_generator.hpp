#pragma once

#include "core/error.hpp"
#include "reflect/shape.hpp"
#include "schema/shape_diff.hpp"
#include "schema/table.hpp"

#include <string>

namespace shapesql {

struct DdlOptions {
    std::string schema;          // empty = unqualified table names
    bool if_not_exists = false;
};

/**
 * @brief Renders PostgreSQL DDL for converted tables and shape diffs.
 */
class DdlGenerator {
public:
    explicit DdlGenerator(DdlOptions options = {});

    // CREATE TABLE for an already converted table
    [[nodiscard]] std::string create_table(const Table& table) const;

    // Convert the shape, then render CREATE TABLE
    [[nodiscard]] Result<std::string> create_table(const Shape& shape) const;

    /**
     * @brief ALTER TABLE moving a table from diff.from() to diff.to()
     *
     * Added fields become ADD COLUMN, removed fields DROP COLUMN, and
     * changed fields ALTER COLUMN ... TYPE plus SET/DROP NOT NULL.
     * Fails with INCOMPATIBLE_CHANGE when the diff is not between two
     * records or a field changes type outside the numeric/text families,
     * and with NO_CHANGES when no column is affected.
     */
    [[nodiscard]] Result<std::string> alter_table(const ShapeDiff& diff) const;

    // Compatible when both mapped types are numeric or text, or the base type is unchanged
    [[nodiscard]] static bool is_compatible_change(const Shape& from, const Shape& to);

    [[nodiscard]] std::string qualified_name(const std::string& table_name) const;
    [[nodiscard]] const DdlOptions& options() const { return options_; }

private:
    static std::string column_definition(const Column& column);

    DdlOptions options_;
};

} // namespace shapesql
