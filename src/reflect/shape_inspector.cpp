#include "reflect/shape_inspector.hpp"

#include <format>

namespace shapesql {

const std::vector<Field>& ShapeInspector::fields(const Shape& shape) {
    static const std::vector<Field> kNoFields;
    return shape.kind == ShapeKind::RECORD ? shape.fields : kNoFields;
}

const Shape* ShapeInspector::referenced(const Shape& shape) {
    if (shape.kind != ShapeKind::REFERENCE) return nullptr;
    return shape.inner.get();
}

const Shape* ShapeInspector::optional_inner(const Shape& shape) {
    if (!is_optional(shape)) return nullptr;
    return shape.inner.get();
}

bool ShapeInspector::is_text(const Shape& shape) {
    if (shape.def == ShapeDef::TEXT) return true;
    return shape.kind == ShapeKind::PRIMITIVE && shape.primitive == PrimitiveKind::STR;
}

bool ShapeInspector::is_optional(const Shape& shape) {
    return shape.def == ShapeDef::OPTION;
}

bool ShapeInspector::is_sequence(const Shape& shape) {
    return shape.def == ShapeDef::LIST || shape.def == ShapeDef::SET;
}

bool ShapeInspector::is_associative(const Shape& shape) {
    return shape.def == ShapeDef::MAP;
}

bool ShapeInspector::is_fixed_array(const Shape& shape) {
    return shape.def == ShapeDef::ARRAY;
}

std::string ShapeInspector::describe(const Shape& shape) {
    if (shape.def != ShapeDef::SCALAR) {
        return std::format("{} {}", shape_def_to_string(shape.def), shape.type_identifier);
    }
    if (shape.kind == ShapeKind::PRIMITIVE) {
        return std::format("{} primitive {}",
            primitive_kind_to_string(shape.primitive), shape.type_identifier);
    }
    return std::format("{} {}", shape_kind_to_string(shape.kind), shape.type_identifier);
}

} // namespace shapesql
