#include "reflect/shape.hpp"
#include "schema/schema_constants.hpp"

#include <format>
#include <limits>

namespace shapesql {

const char* shape_kind_to_string(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::PRIMITIVE: return "primitive";
        case ShapeKind::RECORD: return "record";
        case ShapeKind::TAGGED: return "tagged";
        case ShapeKind::REFERENCE: return "reference";
        case ShapeKind::OPAQUE: return "opaque";
        default: return "unknown";
    }
}

const char* shape_def_to_string(ShapeDef def) {
    switch (def) {
        case ShapeDef::SCALAR: return "scalar";
        case ShapeDef::TEXT: return "text";
        case ShapeDef::OPTION: return "option";
        case ShapeDef::LIST: return "list";
        case ShapeDef::SET: return "set";
        case ShapeDef::MAP: return "map";
        case ShapeDef::ARRAY: return "array";
        default: return "unknown";
    }
}

const char* primitive_kind_to_string(PrimitiveKind prim) {
    switch (prim) {
        case PrimitiveKind::NONE: return "none";
        case PrimitiveKind::BOOLEAN: return "bool";
        case PrimitiveKind::INTEGER: return "int";
        case PrimitiveKind::FLOAT: return "float";
        case PrimitiveKind::CHAR: return "char";
        case PrimitiveKind::STR: return "str";
        case PrimitiveKind::NEVER: return "never";
        default: return "unknown";
    }
}

namespace shapes {

namespace {

ShapePtr make_primitive(std::string type_identifier, PrimitiveKind prim, ShapeLayout layout) {
    auto s = std::make_shared<Shape>();
    s->type_identifier = std::move(type_identifier);
    s->kind = ShapeKind::PRIMITIVE;
    s->primitive = prim;
    s->layout = layout;
    return s;
}

ShapePtr make_wrapper(std::string type_identifier, ShapeDef def, ShapePtr inner,
                      uint32_t size_bytes) {
    auto s = std::make_shared<Shape>();
    s->type_identifier = std::move(type_identifier);
    s->kind = ShapeKind::OPAQUE;
    s->def = def;
    s->layout.size_bytes = size_bytes;
    if (inner) s->type_params.push_back(inner);
    s->inner = std::move(inner);
    return s;
}

} // anonymous namespace

ShapePtr boolean() {
    return make_primitive("bool", PrimitiveKind::BOOLEAN, ShapeLayout{1, false, false, true});
}

ShapePtr integer(std::string type_identifier, uint32_t size_bytes, bool is_signed) {
    return make_primitive(std::move(type_identifier), PrimitiveKind::INTEGER,
                          ShapeLayout{size_bytes, is_signed, false, true});
}

ShapePtr floating(std::string type_identifier, uint32_t size_bytes) {
    return make_primitive(std::move(type_identifier), PrimitiveKind::FLOAT,
                          ShapeLayout{size_bytes, true, true, true});
}

ShapePtr character() {
    return make_primitive("char", PrimitiveKind::CHAR, ShapeLayout{4, false, false, true});
}

ShapePtr str() {
    return make_primitive("str", PrimitiveKind::STR, ShapeLayout{0, false, false, false});
}

ShapePtr never() {
    return make_primitive("!", PrimitiveKind::NEVER, ShapeLayout{0, false, false, true});
}

ShapePtr string() {
    auto s = std::make_shared<Shape>();
    s->type_identifier = "String";
    s->kind = ShapeKind::OPAQUE;
    s->def = ShapeDef::TEXT;
    s->layout.size_bytes = 24;
    return s;
}

ShapePtr reference(ShapePtr inner) {
    auto s = std::make_shared<Shape>();
    s->type_identifier = std::format("&{}", inner ? inner->type_identifier : "?");
    s->kind = ShapeKind::REFERENCE;
    s->layout.size_bytes = 16;
    s->inner = std::move(inner);
    return s;
}

ShapePtr option(ShapePtr inner) {
    return make_wrapper("Option", ShapeDef::OPTION, std::move(inner), 0);
}

ShapePtr list(ShapePtr element, std::string type_identifier) {
    return make_wrapper(std::move(type_identifier), ShapeDef::LIST, std::move(element), 24);
}

ShapePtr set(ShapePtr element, std::string type_identifier) {
    return make_wrapper(std::move(type_identifier), ShapeDef::SET, std::move(element), 48);
}

ShapePtr map(ShapePtr key, ShapePtr value, std::string type_identifier) {
    auto s = std::make_shared<Shape>();
    s->type_identifier = std::move(type_identifier);
    s->kind = ShapeKind::OPAQUE;
    s->def = ShapeDef::MAP;
    s->layout.size_bytes = 48;
    if (key) s->type_params.push_back(key);
    if (value) s->type_params.push_back(value);
    s->key = std::move(key);
    s->inner = std::move(value);
    return s;
}

ShapePtr array(ShapePtr element, size_t length) {
    auto s = std::make_shared<Shape>();
    const uint32_t elem_size = element ? element->layout.size_bytes : 0;
    s->type_identifier = std::format("[{}; {}]",
        element ? element->type_identifier : "?", length);
    s->kind = ShapeKind::OPAQUE;
    s->def = ShapeDef::ARRAY;
    const uint64_t total = static_cast<uint64_t>(elem_size) * length;
    const bool overflow = (length != 0 && total / length != elem_size)
        || total > std::numeric_limits<uint32_t>::max();
    if (overflow) {
        s->layout.sized = false;
    } else {
        s->layout.size_bytes = static_cast<uint32_t>(total);
    }
    s->array_length = length;
    s->inner = std::move(element);
    return s;
}

ShapePtr record(std::string type_identifier, std::vector<Field> fields,
                std::vector<ShapePtr> type_params) {
    auto s = std::make_shared<Shape>();
    s->type_identifier = std::move(type_identifier);
    s->kind = ShapeKind::RECORD;
    s->fields = std::move(fields);
    s->type_params = std::move(type_params);
    return s;
}

ShapePtr tagged(std::string type_identifier, std::vector<std::string> variants) {
    auto s = std::make_shared<Shape>();
    s->type_identifier = std::move(type_identifier);
    s->kind = ShapeKind::TAGGED;
    s->layout.size_bytes = 1;
    s->variants = std::move(variants);
    return s;
}

Field field(std::string name, ShapePtr shape, std::vector<Attribute> attributes) {
    Field f;
    f.name = std::move(name);
    f.shape = std::move(shape);
    f.attributes = std::move(attributes);
    return f;
}

Attribute primary_key_attribute() {
    Attribute attr;
    attr.ns = std::string{schema_attr::kNamespace};
    attr.key = std::string{schema_attr::kPrimaryKey};
    return attr;
}

} // namespace shapes

} // namespace shapesql
