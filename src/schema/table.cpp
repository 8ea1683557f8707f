#include "schema/table.hpp"

namespace shapesql {

nlohmann::json table_to_json(const Table& table) {
    nlohmann::json columns = nlohmann::json::array();
    for (const auto& col : table.columns) {
        columns.push_back({
            {"name", col.name},
            {"type", col.data_type.to_sql()},
            {"nullable", col.nullable},
        });
    }

    nlohmann::json doc;
    doc["name"] = table.name;
    doc["columns"] = std::move(columns);
    if (const auto* pk = table.primary_key_column()) {
        doc["primary_key"] = pk->name;
    } else {
        doc["primary_key"] = nullptr;
    }
    return doc;
}

} // namespace shapesql
