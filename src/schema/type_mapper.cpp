#include "schema/type_mapper.hpp"
#include "reflect/shape_inspector.hpp"

#include <format>

namespace shapesql {

Result<SqlType> TypeMapper::map(const Shape& shape) {
    if (shape.kind == ShapeKind::PRIMITIVE) {
        return map_primitive(shape);
    }

    // Owned text containers (String and friends)
    if (ShapeInspector::is_text(shape)) {
        return Result<SqlType>::ok(SqlType::text());
    }

    if (shape.kind == ShapeKind::REFERENCE) {
        return map_reference(shape);
    }

    if (ShapeInspector::is_optional(shape)) {
        const Shape* inner = ShapeInspector::optional_inner(shape);
        if (!inner) {
            return Result<SqlType>::error(ErrorCategory::MISSING_TYPE_INFO,
                std::format("Optional '{}' has no inner shape", shape.type_identifier));
        }
        auto inner_type = map(*inner);
        if (inner_type.is_error()) return inner_type;
        return Result<SqlType>::ok(SqlType::nullable(std::move(inner_type.value())));
    }

    // Complex values are stored as a single JSON document
    if (ShapeInspector::is_sequence(shape) || ShapeInspector::is_associative(shape)
        || ShapeInspector::is_record(shape)) {
        return Result<SqlType>::ok(SqlType::jsonb());
    }

    if (shape.kind == ShapeKind::TAGGED) {
        return Result<SqlType>::ok(SqlType::integer());
    }

    return unsupported(shape);
}

Result<SqlType> TypeMapper::map_primitive(const Shape& shape) {
    const auto size = shape.layout.size_bytes;

    switch (shape.primitive) {
        case PrimitiveKind::BOOLEAN:
            return Result<SqlType>::ok(SqlType::boolean());

        case PrimitiveKind::INTEGER:
            if (!shape.layout.sized || size == 0) {
                return Result<SqlType>::error(ErrorCategory::UNSUPPORTED_TYPE,
                    std::format("Unsupported type: unsized integer {}", shape.type_identifier));
            }
            if (size <= 2) return Result<SqlType>::ok(SqlType::smallint());
            if (size == 4) return Result<SqlType>::ok(SqlType::integer());
            return Result<SqlType>::ok(SqlType::bigint());

        case PrimitiveKind::FLOAT:
            if (!shape.layout.sized) {
                return Result<SqlType>::error(ErrorCategory::UNSUPPORTED_TYPE,
                    std::format("Unsupported type: unsized float {}", shape.type_identifier));
            }
            if (size == 4) return Result<SqlType>::ok(SqlType::real());
            if (size == 8) return Result<SqlType>::ok(SqlType::double_precision());
            return Result<SqlType>::error(ErrorCategory::UNSUPPORTED_TYPE,
                std::format("Unsupported type: float with size {} ({})",
                    size, shape.type_identifier));

        case PrimitiveKind::CHAR:
            return Result<SqlType>::ok(SqlType::fixed_char(1));

        case PrimitiveKind::STR:
            return Result<SqlType>::ok(SqlType::text());

        default:
            return unsupported(shape);
    }
}

Result<SqlType> TypeMapper::map_reference(const Shape& shape) {
    const Shape* target = ShapeInspector::referenced(shape);
    if (!target) {
        return Result<SqlType>::error(ErrorCategory::MISSING_TYPE_INFO,
            std::format("Reference '{}' has no referenced shape", shape.type_identifier));
    }

    // Borrowed text maps like owned text, whatever the reference markers say
    if (ShapeInspector::is_text(*target)) {
        return Result<SqlType>::ok(SqlType::text());
    }

    return Result<SqlType>::error(ErrorCategory::UNSUPPORTED_TYPE,
        std::format("Unsupported type: pointer/reference to {}",
            ShapeInspector::describe(*target)));
}

Result<SqlType> TypeMapper::unsupported(const Shape& shape) {
    return Result<SqlType>::error(ErrorCategory::UNSUPPORTED_TYPE,
        std::format("Unsupported type: {}", ShapeInspector::describe(shape)));
}

} // namespace shapesql
