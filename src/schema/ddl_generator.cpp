#include "schema/ddl_generator.hpp"
#include "core/utils.hpp"
#include "reflect/shape_inspector.hpp"
#include "schema/table_builder.hpp"
#include "schema/type_mapper.hpp"

#include <format>
#include <vector>

namespace shapesql {

namespace {

const Field* find_field(const Shape& shape, const std::string& name) {
    for (const auto& f : ShapeInspector::fields(shape)) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

} // anonymous namespace

DdlGenerator::DdlGenerator(DdlOptions options)
    : options_(std::move(options)) {}

std::string DdlGenerator::qualified_name(const std::string& table_name) const {
    if (options_.schema.empty()) {
        return utils::quote_identifier(table_name);
    }
    return std::format("{}.{}", utils::quote_identifier(options_.schema),
        utils::quote_identifier(table_name));
}

std::string DdlGenerator::column_definition(const Column& column) {
    return std::format("{} {}{}", utils::quote_identifier(column.name),
        column.data_type.to_sql(), column.nullable ? "" : " NOT NULL");
}

std::string DdlGenerator::create_table(const Table& table) const {
    std::vector<std::string> lines;
    lines.reserve(table.columns.size() + 1);
    for (const auto& col : table.columns) {
        lines.push_back("    " + column_definition(col));
    }
    if (const auto* pk = table.primary_key_column()) {
        lines.push_back(std::format("    PRIMARY KEY ({})", utils::quote_identifier(pk->name)));
    }

    return std::format("CREATE TABLE {}{} (\n{}\n);",
        options_.if_not_exists ? "IF NOT EXISTS " : "",
        qualified_name(table.name),
        utils::join(lines, ",\n"));
}

Result<std::string> DdlGenerator::create_table(const Shape& shape) const {
    auto table = TableBuilder::convert(shape);
    if (table.is_error()) return Result<std::string>::error_from(table);
    return Result<std::string>::ok(create_table(table.value()));
}

bool DdlGenerator::is_compatible_change(const Shape& from, const Shape& to) {
    const auto from_type = TypeMapper::map(from);
    const auto to_type = TypeMapper::map(to);
    if (from_type.is_error() || to_type.is_error()) return false;

    const auto& a = from_type.value().base();
    const auto& b = to_type.value().base();
    if (a == b) return true;
    return (a.is_numeric() || a.is_textual()) && (b.is_numeric() || b.is_textual());
}

Result<std::string> DdlGenerator::alter_table(const ShapeDiff& diff) const {
    switch (diff.kind()) {
        case DiffKind::EQUAL:
            return Result<std::string>::error(ErrorCategory::NO_CHANGES,
                "Cannot create ALTER TABLE from equal shapes - no changes needed");
        case DiffKind::DIFFERENT:
            return Result<std::string>::error(ErrorCategory::INCOMPATIBLE_CHANGE,
                "Cannot create ALTER TABLE from different shapes - shapes are incompatible");
        case DiffKind::SEQUENCE:
            return Result<std::string>::error(ErrorCategory::INCOMPATIBLE_CHANGE,
                "Cannot create ALTER TABLE from sequence diff - only record diffs are supported");
        case DiffKind::RECORD:
            break;
    }

    if (!diff.has_field_changes()) {
        return Result<std::string>::error(ErrorCategory::NO_CHANGES, "No column changes found");
    }

    const Shape& from = *diff.from();
    const Shape& to = *diff.to();
    std::vector<std::string> actions;

    for (const auto& name : diff.insertions()) {
        const Field* field = find_field(to, name);
        if (!field) {
            return Result<std::string>::error(ErrorCategory::MISSING_TYPE_INFO,
                std::format("Field '{}' not found in target shape", name));
        }
        auto column = TableBuilder::field_to_column(*field);
        if (column.is_error()) return Result<std::string>::error_from(column);
        actions.push_back("ADD COLUMN " + column_definition(column.value()));
    }

    for (const auto& name : diff.updates()) {
        const Field* old_field = find_field(from, name);
        const Field* new_field = find_field(to, name);
        if (!old_field || !new_field || !old_field->shape || !new_field->shape) {
            return Result<std::string>::error(ErrorCategory::MISSING_TYPE_INFO,
                std::format("Field '{}' has no shape on both sides of the diff", name));
        }
        if (!is_compatible_change(*old_field->shape, *new_field->shape)) {
            return Result<std::string>::error(ErrorCategory::INCOMPATIBLE_CHANGE,
                std::format("Incompatible type change for field '{}': {} -> {}. "
                            "Only conversions between numbers and strings are supported",
                    name, ShapeInspector::describe(*old_field->shape),
                    ShapeInspector::describe(*new_field->shape)));
        }

        auto column = TableBuilder::field_to_column(*new_field);
        if (column.is_error()) return Result<std::string>::error_from(column);
        const auto& col = column.value();
        const auto quoted = utils::quote_identifier(col.name);
        actions.push_back(std::format("ALTER COLUMN {} TYPE {}", quoted, col.data_type.to_sql()));
        actions.push_back(std::format("ALTER COLUMN {} {}", quoted,
            col.nullable ? "DROP NOT NULL" : "SET NOT NULL"));
    }

    for (const auto& name : diff.deletions()) {
        actions.push_back("DROP COLUMN " + utils::quote_identifier(name));
    }

    return Result<std::string>::ok(std::format("ALTER TABLE {}\n    {};",
        qualified_name(TableBuilder::table_name(to)), utils::join(actions, ",\n    ")));
}

} // namespace shapesql
