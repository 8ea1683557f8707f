#include <catch2/catch_test_macros.hpp>
#include "schema/table_builder.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace shapesql;

static Table convert_ok(const ShapePtr& shape) {
    auto result = TableBuilder::convert(*shape);
    INFO(result.error_message());
    REQUIRE(result.is_ok());
    return result.value();
}

TEST_CASE("TableBuilder: plain record without primary key", "[table_builder]") {
    auto user = shapes::record("User", {
        shapes::field("id", shapes::u64()),
        shapes::field("username", shapes::string()),
        shapes::field("is_active", shapes::boolean()),
    });

    const auto table = convert_ok(user);
    REQUIRE(table.name == "user");
    REQUIRE(table.columns.size() == 3);

    REQUIRE(table.columns[0].name == "id");
    REQUIRE(table.columns[0].data_type == SqlType::bigint());
    REQUIRE_FALSE(table.columns[0].nullable);

    REQUIRE(table.columns[1].name == "username");
    REQUIRE(table.columns[1].data_type == SqlType::text());
    REQUIRE_FALSE(table.columns[1].nullable);

    REQUIRE(table.columns[2].name == "is_active");
    REQUIRE(table.columns[2].data_type == SqlType::boolean());
    REQUIRE_FALSE(table.columns[2].nullable);

    REQUIRE_FALSE(table.primary_key.has_value());
    REQUIRE(table.primary_key_column() == nullptr);
}

TEST_CASE("TableBuilder: single primary key", "[table_builder]") {
    auto post = shapes::record("BlogPost", {
        shapes::field("id", shapes::string(), {shapes::primary_key_attribute()}),
        shapes::field("title", shapes::string()),
    });

    const auto table = convert_ok(post);
    REQUIRE(table.name == "blogpost");
    REQUIRE(table.primary_key == 0u);

    const auto* pk = table.primary_key_column();
    REQUIRE(pk != nullptr);
    REQUIRE(pk->name == "id");
    REQUIRE(pk->data_type == SqlType::text());

    const auto* title = table.find_column("title");
    REQUIRE(title != nullptr);
    REQUIRE(title->data_type == SqlType::text());
    REQUIRE_FALSE(title->nullable);
}

TEST_CASE("TableBuilder: primary key in a later position", "[table_builder]") {
    auto product = shapes::record("Product", {
        shapes::field("name", shapes::string()),
        shapes::field("price", shapes::f64()),
        shapes::field("sku", shapes::string(), {shapes::primary_key_attribute()}),
    });

    const auto table = convert_ok(product);
    REQUIRE(table.primary_key == 2u);
    REQUIRE(table.primary_key_column()->name == "sku");
}

TEST_CASE("TableBuilder: multiple primary keys fail", "[table_builder]") {
    auto double_pk = shapes::record("DoublePk", {
        shapes::field("id1", shapes::u64(), {shapes::primary_key_attribute()}),
        shapes::field("id2", shapes::u64(), {shapes::primary_key_attribute()}),
    });

    auto result = TableBuilder::convert(*double_pk);
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::MULTIPLE_PRIMARY_KEYS);
    REQUIRE(result.error_message().find("doublepk") != std::string::npos);
    REQUIRE(result.error_message().find("id1") != std::string::npos);
    REQUIRE(result.error_message().find("id2") != std::string::npos);
}

TEST_CASE("TableBuilder: containers and nested records become JSONB", "[table_builder]") {
    auto address = shapes::record("Address", {
        shapes::field("street", shapes::string()),
        shapes::field("city", shapes::string()),
    });
    auto user = shapes::record("UserWithAddress", {
        shapes::field("tags", shapes::list(shapes::string())),
        shapes::field("address", address),
        shapes::field("billing", shapes::option(address)),
        shapes::field("metadata", shapes::map(shapes::string(), shapes::string())),
    });

    const auto table = convert_ok(user);
    REQUIRE(table.columns.size() == 4);
    for (const auto& col : table.columns) {
        REQUIRE(col.data_type == SqlType::jsonb());
    }
    REQUIRE_FALSE(table.find_column("tags")->nullable);
    REQUIRE_FALSE(table.find_column("address")->nullable);
    REQUIRE(table.find_column("billing")->nullable);
}

TEST_CASE("TableBuilder: fixed-length array fails", "[table_builder]") {
    auto fixed = shapes::record("FixedSizeArrays", {
        shapes::field("id", shapes::u32()),
        shapes::field("digest", shapes::array(shapes::u8(), 32)),
    });

    auto result = TableBuilder::convert(*fixed);
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::UNSUPPORTED_TYPE);
    REQUIRE(result.error_message().find("digest") != std::string::npos);
}

TEST_CASE("TableBuilder: optional fields are nullable with the inner type", "[table_builder]") {
    auto optional_fields = shapes::record("OptionalFields", {
        shapes::field("required", shapes::string()),
        shapes::field("email", shapes::option(shapes::string())),
        shapes::field("age", shapes::option(shapes::u32())),
        shapes::field("score", shapes::option(shapes::f64())),
        shapes::field("active", shapes::option(shapes::boolean())),
        shapes::field("initial", shapes::option(shapes::character())),
    });

    const auto table = convert_ok(optional_fields);
    REQUIRE_FALSE(table.find_column("required")->nullable);

    REQUIRE(table.find_column("email")->nullable);
    REQUIRE(table.find_column("email")->data_type == SqlType::text());
    REQUIRE(table.find_column("age")->nullable);
    REQUIRE(table.find_column("age")->data_type == SqlType::integer());
    REQUIRE(table.find_column("score")->data_type == SqlType::double_precision());
    REQUIRE(table.find_column("active")->data_type == SqlType::boolean());
    REQUIRE(table.find_column("initial")->data_type == SqlType::fixed_char(1));
}

TEST_CASE("TableBuilder: tagged type as field vs top level", "[table_builder]") {
    auto status = shapes::tagged("Status", {"Active", "Inactive", "Banned"});

    SECTION("As a field it is stored as INTEGER") {
        auto user = shapes::record("UserWithStatus", {
            shapes::field("id", shapes::u64()),
            shapes::field("status", status),
        });
        const auto table = convert_ok(user);
        REQUIRE(table.find_column("status")->data_type == SqlType::integer());
        REQUIRE_FALSE(table.find_column("status")->nullable);
    }

    SECTION("At the top level it is rejected") {
        auto result = TableBuilder::convert(*status);
        REQUIRE(result.is_error());
        REQUIRE(result.error_category() == ErrorCategory::NOT_A_STRUCT);
    }
}

TEST_CASE("TableBuilder: non-record top-level shapes are rejected", "[table_builder]") {
    for (const auto& shape : {shapes::u64(), shapes::string(), shapes::str_ref(),
                              shapes::list(shapes::u8()), shapes::option(shapes::u8())}) {
        auto result = TableBuilder::convert(*shape);
        REQUIRE(result.is_error());
        REQUIRE(result.error_category() == ErrorCategory::NOT_A_STRUCT);
    }
}

TEST_CASE("TableBuilder: borrowed strings", "[table_builder]") {
    auto borrowed = shapes::record("BorrowedData", {
        shapes::field("name", shapes::str_ref()),
        shapes::field("label", shapes::string()),
    });

    const auto table = convert_ok(borrowed);
    REQUIRE(table.columns[0].data_type == SqlType::text());
    REQUIRE(table.columns[1].data_type == SqlType::text());
    REQUIRE_FALSE(table.columns[0].nullable);
}

TEST_CASE("TableBuilder: generic instantiation keeps the base name", "[table_builder]") {
    auto wrapper = shapes::record("Wrapper", {
        shapes::field("value", shapes::u32()),
    }, {shapes::u32()});

    const auto table = convert_ok(wrapper);
    REQUIRE(table.name == "wrapper");
    REQUIRE(table.columns[0].data_type == SqlType::integer());
}

TEST_CASE("TableBuilder: empty record", "[table_builder]") {
    const auto table = convert_ok(shapes::record("Marker", {}));
    REQUIRE(table.name == "marker");
    REQUIRE(table.columns.empty());
    REQUIRE_FALSE(table.primary_key.has_value());
}

TEST_CASE("TableBuilder: field without shape", "[table_builder]") {
    Field broken;
    broken.name = "ghost";
    auto record = shapes::record("Broken", {broken});

    auto result = TableBuilder::convert(*record);
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::MISSING_TYPE_INFO);
}

TEST_CASE("TableBuilder: concurrent conversions agree", "[table_builder][concurrency]") {
    auto shape = shapes::record("Account", {
        shapes::field("id", shapes::u64(), {shapes::primary_key_attribute()}),
        shapes::field("email", shapes::option(shapes::string())),
        shapes::field("roles", shapes::list(shapes::string())),
    });

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                auto result = TableBuilder::convert(*shape);
                if (!result.is_ok() || result.value().columns.size() != 3
                    || result.value().primary_key != 0u) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& w : workers) w.join();
    REQUIRE(mismatches.load() == 0);
}
