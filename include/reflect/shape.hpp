#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shapesql {

struct Shape;
using ShapePtr = std::shared_ptr<const Shape>;

/**
 * @brief Structural kind of a shape as reported by the reflection system
 */
enum class ShapeKind : uint8_t {
    PRIMITIVE,
    RECORD,      // composite type with named fields
    TAGGED,      // discriminated union / enum
    REFERENCE,   // pointer or borrowed reference
    OPAQUE,      // library type known only through its definition class
};

/**
 * @brief Definition class: what the shape behaves like, independent of its kind
 */
enum class ShapeDef : uint8_t {
    SCALAR,
    TEXT,        // owned text container
    OPTION,
    LIST,
    SET,
    MAP,
    ARRAY,       // fixed-length array
};

enum class PrimitiveKind : uint8_t {
    NONE,
    BOOLEAN,
    INTEGER,
    FLOAT,
    CHAR,
    STR,
    NEVER,
};

struct ShapeLayout {
    uint32_t size_bytes = 0;
    bool is_signed = false;
    bool is_float = false;
    bool sized = true;
};

struct Attribute {
    std::optional<std::string> ns;
    std::string key;
    std::optional<std::string> value;
};

struct Field {
    std::string name;
    ShapePtr shape;
    std::vector<Attribute> attributes;
    std::vector<std::string> doc;
};

/**
 * @brief Reflection-derived description of a data type.
 *
 * Shapes form an immutable graph shared through ShapePtr. `inner` is the
 * referenced shape of a REFERENCE, the wrapped shape of an OPTION, the
 * element of LIST/SET/ARRAY and the value of a MAP; `key` is the MAP key.
 * For monomorphized generics `type_identifier` holds the base name only and
 * the concrete arguments are listed in `type_params`.
 */
struct Shape {
    std::string type_identifier;
    ShapeKind kind = ShapeKind::PRIMITIVE;
    ShapeDef def = ShapeDef::SCALAR;
    PrimitiveKind primitive = PrimitiveKind::NONE;
    ShapeLayout layout;

    std::vector<Field> fields;          // RECORD
    std::vector<std::string> variants;  // TAGGED
    ShapePtr inner;
    ShapePtr key;
    size_t array_length = 0;            // ARRAY
    std::vector<ShapePtr> type_params;
};

[[nodiscard]] const char* shape_kind_to_string(ShapeKind kind);
[[nodiscard]] const char* shape_def_to_string(ShapeDef def);
[[nodiscard]] const char* primitive_kind_to_string(PrimitiveKind prim);

// ============================================================================
// Shape construction helpers (what a reflection front end would emit)
// ============================================================================

namespace shapes {

[[nodiscard]] ShapePtr boolean();
[[nodiscard]] ShapePtr integer(std::string type_identifier, uint32_t size_bytes, bool is_signed);
[[nodiscard]] ShapePtr floating(std::string type_identifier, uint32_t size_bytes);

[[nodiscard]] inline ShapePtr u8() { return integer("u8", 1, false); }
[[nodiscard]] inline ShapePtr u16() { return integer("u16", 2, false); }
[[nodiscard]] inline ShapePtr u32() { return integer("u32", 4, false); }
[[nodiscard]] inline ShapePtr u64() { return integer("u64", 8, false); }
[[nodiscard]] inline ShapePtr u128() { return integer("u128", 16, false); }
[[nodiscard]] inline ShapePtr usize() { return integer("usize", 8, false); }
[[nodiscard]] inline ShapePtr i8() { return integer("i8", 1, true); }
[[nodiscard]] inline ShapePtr i16() { return integer("i16", 2, true); }
[[nodiscard]] inline ShapePtr i32() { return integer("i32", 4, true); }
[[nodiscard]] inline ShapePtr i64() { return integer("i64", 8, true); }
[[nodiscard]] inline ShapePtr i128() { return integer("i128", 16, true); }
[[nodiscard]] inline ShapePtr isize() { return integer("isize", 8, true); }
[[nodiscard]] inline ShapePtr f32() { return floating("f32", 4); }
[[nodiscard]] inline ShapePtr f64() { return floating("f64", 8); }

[[nodiscard]] ShapePtr character();
[[nodiscard]] ShapePtr str();
[[nodiscard]] ShapePtr never();
[[nodiscard]] ShapePtr string();
[[nodiscard]] ShapePtr reference(ShapePtr inner);
[[nodiscard]] inline ShapePtr str_ref() { return reference(str()); }

[[nodiscard]] ShapePtr option(ShapePtr inner);
[[nodiscard]] ShapePtr list(ShapePtr element, std::string type_identifier = "Vec");
[[nodiscard]] ShapePtr set(ShapePtr element, std::string type_identifier = "HashSet");
[[nodiscard]] ShapePtr map(ShapePtr key, ShapePtr value, std::string type_identifier = "HashMap");
[[nodiscard]] ShapePtr array(ShapePtr element, size_t length);

[[nodiscard]] ShapePtr record(std::string type_identifier, std::vector<Field> fields,
                              std::vector<ShapePtr> type_params = {});
[[nodiscard]] ShapePtr tagged(std::string type_identifier, std::vector<std::string> variants);

[[nodiscard]] Field field(std::string name, ShapePtr shape,
                          std::vector<Attribute> attributes = {});

[[nodiscard]] Attribute primary_key_attribute();

} // namespace shapes

} // namespace shapesql
