#include "core/sql_type.hpp"

#include <format>

namespace shapesql {

const char* sql_type_tag_to_string(SqlTypeTag tag) {
    switch (tag) {
        case SqlTypeTag::BOOLEAN: return "BOOLEAN";
        case SqlTypeTag::SMALLINT: return "SMALLINT";
        case SqlTypeTag::INTEGER: return "INTEGER";
        case SqlTypeTag::BIGINT: return "BIGINT";
        case SqlTypeTag::REAL: return "REAL";
        case SqlTypeTag::DOUBLE_PRECISION: return "DOUBLE_PRECISION";
        case SqlTypeTag::TEXT: return "TEXT";
        case SqlTypeTag::FIXED_CHAR: return "FIXED_CHAR";
        case SqlTypeTag::JSONB: return "JSONB";
        case SqlTypeTag::NULLABLE: return "NULLABLE";
        default: return "UNKNOWN";
    }
}

SqlType SqlType::fixed_char(uint32_t length) {
    SqlType t(SqlTypeTag::FIXED_CHAR);
    t.length_ = length;
    return t;
}

SqlType SqlType::nullable(SqlType inner) {
    SqlType t(SqlTypeTag::NULLABLE);
    t.inner_ = std::make_shared<const SqlType>(std::move(inner));
    return t;
}

const SqlType& SqlType::base() const {
    const SqlType* current = this;
    while (current->tag_ == SqlTypeTag::NULLABLE && current->inner_) {
        current = current->inner_.get();
    }
    return *current;
}

bool SqlType::is_numeric() const {
    switch (base().tag_) {
        case SqlTypeTag::SMALLINT:
        case SqlTypeTag::INTEGER:
        case SqlTypeTag::BIGINT:
        case SqlTypeTag::REAL:
        case SqlTypeTag::DOUBLE_PRECISION:
            return true;
        default:
            return false;
    }
}

bool SqlType::is_textual() const {
    const auto t = base().tag_;
    return t == SqlTypeTag::TEXT || t == SqlTypeTag::FIXED_CHAR;
}

std::string SqlType::to_sql() const {
    switch (tag_) {
        case SqlTypeTag::BOOLEAN: return "BOOLEAN";
        case SqlTypeTag::SMALLINT: return "SMALLINT";
        case SqlTypeTag::INTEGER: return "INTEGER";
        case SqlTypeTag::BIGINT: return "BIGINT";
        case SqlTypeTag::REAL: return "REAL";
        case SqlTypeTag::DOUBLE_PRECISION: return "DOUBLE PRECISION";
        case SqlTypeTag::TEXT: return "TEXT";
        case SqlTypeTag::FIXED_CHAR: return std::format("CHAR({})", length_);
        case SqlTypeTag::JSONB: return "JSONB";
        // Nullability is a column property in DDL
        case SqlTypeTag::NULLABLE: return inner_ ? inner_->to_sql() : "TEXT";
    }
    return "TEXT";
}

bool SqlType::operator==(const SqlType& other) const {
    if (tag_ != other.tag_) return false;
    if (tag_ == SqlTypeTag::FIXED_CHAR) return length_ == other.length_;
    if (tag_ == SqlTypeTag::NULLABLE) {
        if (!inner_ || !other.inner_) return inner_ == other.inner_;
        return *inner_ == *other.inner_;
    }
    return true;
}

} // namespace shapesql
