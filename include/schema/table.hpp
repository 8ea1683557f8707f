#pragma once

#include "core/sql_type.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace shapesql {

struct Column {
    std::string name;
    SqlType data_type = SqlType::text();
    bool nullable = false;
};

/**
 * @brief Table definition handed to the schema builder.
 *
 * `primary_key` indexes into `columns`; at most one column is the key.
 */
struct Table {
    std::string name;
    std::vector<Column> columns;
    std::optional<size_t> primary_key;

    [[nodiscard]] const Column* primary_key_column() const {
        if (!primary_key || *primary_key >= columns.size()) return nullptr;
        return &columns[*primary_key];
    }

    [[nodiscard]] const Column* find_column(const std::string& column_name) const {
        for (const auto& col : columns) {
            if (col.name == column_name) return &col;
        }
        return nullptr;
    }
};

// {"name": ..., "columns": [{"name", "type", "nullable"}], "primary_key": name|null}
[[nodiscard]] nlohmann::json table_to_json(const Table& table);

} // namespace shapesql
