#include "schema/table_builder.hpp"
#include "core/utils.hpp"
#include "reflect/shape_inspector.hpp"
#include "schema/attribute_resolver.hpp"
#include "schema/type_mapper.hpp"

#include <format>
#include <vector>

namespace shapesql {

std::string TableBuilder::table_name(const Shape& shape) {
    return utils::to_lower(shape.type_identifier);
}

Result<Column> TableBuilder::field_to_column(const Field& field) {
    if (!field.shape) {
        return Result<Column>::error(ErrorCategory::MISSING_TYPE_INFO,
            std::format("Field '{}' has no shape", field.name));
    }

    auto mapped = TypeMapper::map(*field.shape);
    if (mapped.is_error()) {
        return Result<Column>::error(mapped.error_category(),
            std::format("{} (field '{}')", mapped.error_message(), field.name));
    }

    Column column;
    column.name = field.name;
    column.data_type = mapped.value().base();
    column.nullable = ShapeInspector::is_optional(*field.shape);
    return Result<Column>::ok(std::move(column));
}

Result<Table> TableBuilder::convert(const Shape& shape) {
    if (ShapeInspector::classify(shape) != ShapeKind::RECORD) {
        return Result<Table>::error(ErrorCategory::NOT_A_STRUCT,
            std::format("Expected struct, got: {}", ShapeInspector::describe(shape)));
    }

    Table table;
    table.name = table_name(shape);

    const auto& fields = ShapeInspector::fields(shape);
    table.columns.reserve(fields.size());
    std::vector<size_t> pk_indices;

    for (const auto& field : fields) {
        auto column = field_to_column(field);
        if (column.is_error()) {
            utils::log::debug(std::format("Table '{}': {}", table.name, column.error_message()));
            return Result<Table>::error_from(column);
        }

        if (AttributeResolver::resolve(field)) {
            pk_indices.push_back(table.columns.size());
        }
        table.columns.emplace_back(std::move(column.value()));
    }

    if (pk_indices.size() > 1) {
        std::vector<std::string> names;
        names.reserve(pk_indices.size());
        for (const auto idx : pk_indices) {
            names.push_back(table.columns[idx].name);
        }
        return Result<Table>::error(ErrorCategory::MULTIPLE_PRIMARY_KEYS,
            std::format("Multiple primary keys defined: table '{}' has {} primary keys: [{}]",
                table.name, pk_indices.size(), utils::join(names, ", ")));
    }

    if (!pk_indices.empty()) {
        table.primary_key = pk_indices.front();
    }

    utils::log::debug(std::format("Converted '{}' into table '{}' with {} columns",
        shape.type_identifier, table.name, table.columns.size()));
    return Result<Table>::ok(std::move(table));
}

} // namespace shapesql
