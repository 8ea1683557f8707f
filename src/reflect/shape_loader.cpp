#include "reflect/shape_loader.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <limits>
#include <unordered_map>

using json = nlohmann::json;

namespace shapesql {

// Constexpr document keys (used 2+ times between parsing and writing)
static constexpr const char* kTypeIdentifier = "type_identifier";
static constexpr const char* kKind           = "kind";
static constexpr const char* kDef            = "def";
static constexpr const char* kPrimitive      = "primitive";
static constexpr const char* kLayout         = "layout";
static constexpr const char* kFields         = "fields";
static constexpr const char* kVariants       = "variants";
static constexpr const char* kInner          = "inner";
static constexpr const char* kKey            = "key";
static constexpr const char* kLength         = "length";
static constexpr const char* kTypeParams     = "type_params";

namespace {

Result<ShapePtr> invalid(const std::string& path, const std::string& what) {
    return Result<ShapePtr>::error(ErrorCategory::INVALID_SHAPE_DOCUMENT,
        std::format("{}: {}", path, what));
}

std::optional<ShapeKind> parse_kind(const std::string& s) {
    static const std::unordered_map<std::string, ShapeKind> lookup = {
        {"primitive", ShapeKind::PRIMITIVE},
        {"record",    ShapeKind::RECORD},
        {"tagged",    ShapeKind::TAGGED},
        {"reference", ShapeKind::REFERENCE},
        {"opaque",    ShapeKind::OPAQUE},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<ShapeDef> parse_def(const std::string& s) {
    static const std::unordered_map<std::string, ShapeDef> lookup = {
        {"scalar", ShapeDef::SCALAR},
        {"text",   ShapeDef::TEXT},
        {"option", ShapeDef::OPTION},
        {"list",   ShapeDef::LIST},
        {"set",    ShapeDef::SET},
        {"map",    ShapeDef::MAP},
        {"array",  ShapeDef::ARRAY},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<PrimitiveKind> parse_primitive(const std::string& s) {
    static const std::unordered_map<std::string, PrimitiveKind> lookup = {
        {"bool",  PrimitiveKind::BOOLEAN},
        {"int",   PrimitiveKind::INTEGER},
        {"float", PrimitiveKind::FLOAT},
        {"char",  PrimitiveKind::CHAR},
        {"str",   PrimitiveKind::STR},
        {"never", PrimitiveKind::NEVER},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

const std::string* string_member(const json& node, const char* key) {
    const auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return nullptr;
    return it->get_ptr<const std::string*>();
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

Result<ShapePtr> ShapeLoader::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<ShapePtr>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open shape file: {}", path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    auto result = load_from_string(buffer);
    if (result.is_error()) {
        return Result<ShapePtr>::error(result.error_category(),
            std::format("{}: {}", path, result.error_message()));
    }
    return result;
}

Result<ShapePtr> ShapeLoader::load_from_string(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Result<ShapePtr>::error(ErrorCategory::INVALID_SHAPE_DOCUMENT,
            std::format("Failed to parse shape document: {}", e.what()));
    }
    return from_json(doc);
}

Result<ShapePtr> ShapeLoader::from_json(const json& doc) {
    return parse_shape(doc, "$");
}

std::optional<ShapePtr> ShapeLoader::builtin(const std::string& name) {
    using Factory = ShapePtr (*)();
    static const std::unordered_map<std::string, Factory> lookup = {
        {"bool",   &shapes::boolean},
        {"u8",     &shapes::u8},
        {"u16",    &shapes::u16},
        {"u32",    &shapes::u32},
        {"u64",    &shapes::u64},
        {"u128",   &shapes::u128},
        {"usize",  &shapes::usize},
        {"i8",     &shapes::i8},
        {"i16",    &shapes::i16},
        {"i32",    &shapes::i32},
        {"i64",    &shapes::i64},
        {"i128",   &shapes::i128},
        {"isize",  &shapes::isize},
        {"f32",    &shapes::f32},
        {"f64",    &shapes::f64},
        {"char",   &shapes::character},
        {"str",    &shapes::str},
        {"&str",   &shapes::str_ref},
        {"String", &shapes::string},
        {"!",      &shapes::never},
    };
    const auto it = lookup.find(name);
    if (it == lookup.end()) return std::nullopt;
    return it->second();
}

// ============================================================================
// Parsing
// ============================================================================

Result<ShapePtr> ShapeLoader::parse_shape(const json& node, const std::string& path) {
    if (node.is_string()) {
        const auto& alias = node.get_ref<const std::string&>();
        if (auto shape = builtin(alias)) return Result<ShapePtr>::ok(std::move(*shape));
        return invalid(path, std::format("unknown shape alias '{}'", alias));
    }
    if (!node.is_object()) {
        return invalid(path, "shape must be an object or an alias string");
    }

    auto shape = std::make_shared<Shape>();

    const auto* ident = string_member(node, kTypeIdentifier);
    if (!ident || ident->empty()) {
        return invalid(path, "missing 'type_identifier'");
    }
    shape->type_identifier = *ident;

    if (node.contains(kDef)) {
        const auto* def_str = string_member(node, kDef);
        const auto def = def_str ? parse_def(*def_str) : std::nullopt;
        if (!def) return invalid(path, "unknown def");
        shape->def = *def;
    }

    // Shapes defined only by their behaviour default to opaque
    shape->kind = (shape->def == ShapeDef::SCALAR) ? ShapeKind::PRIMITIVE : ShapeKind::OPAQUE;
    if (node.contains(kKind)) {
        const auto* kind_str = string_member(node, kKind);
        const auto kind = kind_str ? parse_kind(*kind_str) : std::nullopt;
        if (!kind) {
            return invalid(path, std::format("unknown kind '{}'",
                kind_str ? *kind_str : node[kKind].dump()));
        }
        shape->kind = *kind;
    }

    if (shape->kind == ShapeKind::PRIMITIVE && shape->def == ShapeDef::SCALAR) {
        const auto* prim_str = string_member(node, kPrimitive);
        if (!prim_str) return invalid(path, "primitive shape requires 'primitive'");
        const auto prim = parse_primitive(*prim_str);
        if (!prim) return invalid(path, std::format("unknown primitive '{}'", *prim_str));
        shape->primitive = *prim;
    }

    if (const auto it = node.find(kLayout); it != node.end()) {
        if (!it->is_object()) return invalid(path + ".layout", "layout must be an object");
        if (const auto size = it->find("size"); size != it->end()) {
            if (!size->is_number_unsigned()
                || size->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
                return invalid(path + ".layout.size",
                    std::format("size must be an unsigned 32-bit integer, got {}", size->dump()));
            }
        }
        try {
            shape->layout.size_bytes = it->value("size", 0u);
            shape->layout.is_signed = it->value("signed", false);
            shape->layout.is_float = it->value("float", false);
            shape->layout.sized = it->value("sized", true);
        } catch (const json::type_error& e) {
            return invalid(path + ".layout", e.what());
        }
    }

    if (shape->kind == ShapeKind::RECORD) {
        const auto it = node.find(kFields);
        if (it == node.end() || !it->is_array()) {
            return invalid(path, "record shape requires a 'fields' array");
        }
        shape->fields.reserve(it->size());
        for (size_t i = 0; i < it->size(); ++i) {
            auto field = parse_field((*it)[i], std::format("{}.fields[{}]", path, i));
            if (field.is_error()) return Result<ShapePtr>::error_from(field);
            shape->fields.emplace_back(std::move(field.value()));
        }
    }

    if (const auto it = node.find(kVariants); it != node.end()) {
        if (!it->is_array()) return invalid(path + ".variants", "variants must be an array");
        for (size_t i = 0; i < it->size(); ++i) {
            const auto& v = (*it)[i];
            if (v.is_string()) {
                shape->variants.push_back(v.get<std::string>());
            } else if (v.is_object() && string_member(v, "name")) {
                shape->variants.push_back(*string_member(v, "name"));
            } else {
                return invalid(std::format("{}.variants[{}]", path, i), "variant must be a name");
            }
        }
    }

    if (const auto it = node.find(kInner); it != node.end()) {
        auto inner = parse_shape(*it, path + ".inner");
        if (inner.is_error()) return inner;
        shape->inner = std::move(inner.value());
    }

    if (const auto it = node.find(kKey); it != node.end()) {
        auto key = parse_shape(*it, path + ".key");
        if (key.is_error()) return key;
        shape->key = std::move(key.value());
    }

    if (const auto it = node.find(kLength); it != node.end()) {
        if (!it->is_number_unsigned()) return invalid(path + ".length", "length must be unsigned");
        shape->array_length = it->get<size_t>();
    }

    if (const auto it = node.find(kTypeParams); it != node.end()) {
        if (!it->is_array()) return invalid(path + ".type_params", "type_params must be an array");
        for (size_t i = 0; i < it->size(); ++i) {
            auto param = parse_shape((*it)[i], std::format("{}.type_params[{}]", path, i));
            if (param.is_error()) return param;
            shape->type_params.push_back(std::move(param.value()));
        }
    }

    return Result<ShapePtr>::ok(std::move(shape));
}

Result<Field> ShapeLoader::parse_field(const json& node, const std::string& path) {
    if (!node.is_object()) {
        return Result<Field>::error(ErrorCategory::INVALID_SHAPE_DOCUMENT,
            std::format("{}: field must be an object", path));
    }

    Field field;
    const auto* name = string_member(node, "name");
    if (!name || name->empty()) {
        return Result<Field>::error(ErrorCategory::INVALID_SHAPE_DOCUMENT,
            std::format("{}: missing field 'name'", path));
    }
    field.name = *name;

    const auto shape_it = node.find("shape");
    if (shape_it == node.end()) {
        return Result<Field>::error(ErrorCategory::INVALID_SHAPE_DOCUMENT,
            std::format("{}: missing field 'shape'", path));
    }
    auto shape = parse_shape(*shape_it, path + ".shape");
    if (shape.is_error()) return Result<Field>::error_from(shape);
    field.shape = std::move(shape.value());

    if (const auto it = node.find("attributes"); it != node.end()) {
        if (!it->is_array()) {
            return Result<Field>::error(ErrorCategory::INVALID_SHAPE_DOCUMENT,
                std::format("{}.attributes: attributes must be an array", path));
        }
        for (size_t i = 0; i < it->size(); ++i) {
            auto attr = parse_attribute((*it)[i], std::format("{}.attributes[{}]", path, i));
            if (attr.is_error()) return Result<Field>::error_from(attr);
            field.attributes.emplace_back(std::move(attr.value()));
        }
    }

    if (const auto it = node.find("doc"); it != node.end() && it->is_array()) {
        for (const auto& line : *it) {
            if (line.is_string()) field.doc.push_back(line.get<std::string>());
        }
    }

    return Result<Field>::ok(std::move(field));
}

Result<Attribute> ShapeLoader::parse_attribute(const json& node, const std::string& path) {
    if (!node.is_object()) {
        return Result<Attribute>::error(ErrorCategory::INVALID_SHAPE_DOCUMENT,
            std::format("{}: attribute must be an object", path));
    }

    Attribute attr;
    const auto* key = string_member(node, "key");
    if (!key) {
        return Result<Attribute>::error(ErrorCategory::INVALID_SHAPE_DOCUMENT,
            std::format("{}: missing attribute 'key'", path));
    }
    attr.key = *key;
    if (const auto* ns = string_member(node, "ns")) attr.ns = *ns;
    if (const auto it = node.find("value"); it != node.end() && !it->is_null()) {
        attr.value = it->is_string() ? it->get<std::string>() : it->dump();
    }
    return Result<Attribute>::ok(std::move(attr));
}

// ============================================================================
// Writing
// ============================================================================

json ShapeLoader::to_json(const Shape& shape) {
    json doc;
    doc[kTypeIdentifier] = shape.type_identifier;
    doc[kKind] = shape_kind_to_string(shape.kind);
    if (shape.def != ShapeDef::SCALAR) {
        doc[kDef] = shape_def_to_string(shape.def);
    }
    if (shape.primitive != PrimitiveKind::NONE) {
        doc[kPrimitive] = primitive_kind_to_string(shape.primitive);
    }
    doc[kLayout] = {
        {"size", shape.layout.size_bytes},
        {"signed", shape.layout.is_signed},
        {"float", shape.layout.is_float},
        {"sized", shape.layout.sized},
    };

    if (shape.kind == ShapeKind::RECORD) {
        json fields = json::array();
        for (const auto& f : shape.fields) {
            json field_doc;
            field_doc["name"] = f.name;
            field_doc["shape"] = f.shape ? to_json(*f.shape) : json();
            json attrs = json::array();
            for (const auto& a : f.attributes) {
                json attr_doc;
                if (a.ns) attr_doc["ns"] = *a.ns;
                attr_doc["key"] = a.key;
                if (a.value) attr_doc["value"] = *a.value;
                attrs.push_back(std::move(attr_doc));
            }
            field_doc["attributes"] = std::move(attrs);
            if (!f.doc.empty()) field_doc["doc"] = f.doc;
            fields.push_back(std::move(field_doc));
        }
        doc[kFields] = std::move(fields);
    }

    if (!shape.variants.empty()) doc[kVariants] = shape.variants;
    if (shape.inner) doc[kInner] = to_json(*shape.inner);
    if (shape.key) doc[kKey] = to_json(*shape.key);
    if (shape.def == ShapeDef::ARRAY) doc[kLength] = shape.array_length;

    if (!shape.type_params.empty()) {
        json params = json::array();
        for (const auto& p : shape.type_params) {
            if (p) params.push_back(to_json(*p));
        }
        doc[kTypeParams] = std::move(params);
    }
    return doc;
}

} // namespace shapesql
