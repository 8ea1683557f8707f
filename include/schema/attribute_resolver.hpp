#pragma once

#include "reflect/shape.hpp"

namespace shapesql {

/**
 * @brief Detects the primary-key marker among a field's attributes.
 *
 * A field is a primary key iff one of its attributes has namespace exactly
 * "psql" and key exactly "primary_key". Both comparisons are case-sensitive;
 * an attribute without a namespace never matches.
 */
class AttributeResolver {
public:
    [[nodiscard]] static bool is_primary_key(const Attribute& attr);
    [[nodiscard]] static bool resolve(const Field& field);
};

} // namespace shapesql
