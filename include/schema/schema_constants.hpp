#pragma once

#include <string_view>

namespace shapesql::schema_attr {

// Attribute namespace and key that mark a field as the table's primary key
inline constexpr std::string_view kNamespace  = "psql";
inline constexpr std::string_view kPrimaryKey = "primary_key";

} // namespace shapesql::schema_attr
