#include "schema/attribute_resolver.hpp"
#include "schema/schema_constants.hpp"

#include <algorithm>

namespace shapesql {

bool AttributeResolver::is_primary_key(const Attribute& attr) {
    if (!attr.ns.has_value()) return false;
    return *attr.ns == schema_attr::kNamespace && attr.key == schema_attr::kPrimaryKey;
}

bool AttributeResolver::resolve(const Field& field) {
    return std::any_of(field.attributes.begin(), field.attributes.end(),
        [](const Attribute& attr) { return is_primary_key(attr); });
}

} // namespace shapesql
