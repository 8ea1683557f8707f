#pragma once

#include "core/error.hpp"
#include "reflect/shape.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace shapesql {

/**
 * @brief Reads and writes JSON shape documents.
 *
 * A shape node is either an object
 *   {"type_identifier": "User", "kind": "record", "fields": [...]}
 * or a string naming a well-known shape ("u64", "String", "&str", ...).
 * Errors carry the JSON path of the offending node, e.g.
 *   "$.fields[2].shape: unknown kind 'struct'".
 */
class ShapeLoader {
public:
    [[nodiscard]] static Result<ShapePtr> load_from_file(const std::string& path);
    [[nodiscard]] static Result<ShapePtr> load_from_string(const std::string& json_text);
    [[nodiscard]] static Result<ShapePtr> from_json(const nlohmann::json& doc);

    [[nodiscard]] static nlohmann::json to_json(const Shape& shape);

    // Shape for a well-known alias such as "u32" or "String"
    [[nodiscard]] static std::optional<ShapePtr> builtin(const std::string& name);

private:
    static Result<ShapePtr> parse_shape(const nlohmann::json& node, const std::string& path);
    static Result<Field> parse_field(const nlohmann::json& node, const std::string& path);
    static Result<Attribute> parse_attribute(const nlohmann::json& node, const std::string& path);
};

} // namespace shapesql
