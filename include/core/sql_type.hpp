#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace shapesql {

/**
 * @brief Closed set of SQL column types produced by the type mapper
 *
 * NULLABLE wraps another SqlType; nullability of the owning column is
 * carried separately on the Column.
 */
enum class SqlTypeTag : uint8_t {
    BOOLEAN,
    SMALLINT,
    INTEGER,
    BIGINT,
    REAL,
    DOUBLE_PRECISION,
    TEXT,
    FIXED_CHAR,
    JSONB,
    NULLABLE,
};

[[nodiscard]] const char* sql_type_tag_to_string(SqlTypeTag tag);

/**
 * @brief Immutable SQL type value (tag + optional length or wrapped type)
 */
class SqlType {
public:
    static SqlType boolean() { return SqlType(SqlTypeTag::BOOLEAN); }
    static SqlType smallint() { return SqlType(SqlTypeTag::SMALLINT); }
    static SqlType integer() { return SqlType(SqlTypeTag::INTEGER); }
    static SqlType bigint() { return SqlType(SqlTypeTag::BIGINT); }
    static SqlType real() { return SqlType(SqlTypeTag::REAL); }
    static SqlType double_precision() { return SqlType(SqlTypeTag::DOUBLE_PRECISION); }
    static SqlType text() { return SqlType(SqlTypeTag::TEXT); }
    static SqlType fixed_char(uint32_t length = 1);
    static SqlType jsonb() { return SqlType(SqlTypeTag::JSONB); }
    static SqlType nullable(SqlType inner);

    [[nodiscard]] SqlTypeTag tag() const { return tag_; }
    [[nodiscard]] uint32_t length() const { return length_; }
    [[nodiscard]] bool is_nullable() const { return tag_ == SqlTypeTag::NULLABLE; }

    // Wrapped type of a NULLABLE; nullptr otherwise
    [[nodiscard]] const SqlType* inner() const { return inner_.get(); }

    // Strip every NULLABLE layer
    [[nodiscard]] const SqlType& base() const;

    [[nodiscard]] bool is_numeric() const;
    [[nodiscard]] bool is_textual() const;

    // PostgreSQL spelling, e.g. "DOUBLE PRECISION", "CHAR(1)"
    [[nodiscard]] std::string to_sql() const;

    bool operator==(const SqlType& other) const;
    bool operator!=(const SqlType& other) const { return !(*this == other); }

private:
    explicit SqlType(SqlTypeTag tag) : tag_(tag) {}

    SqlTypeTag tag_;
    uint32_t length_ = 0;
    std::shared_ptr<const SqlType> inner_;
};

} // namespace shapesql
