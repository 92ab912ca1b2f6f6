#include <gtest/gtest.h>

#include "schema_metadata.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using nlohmann::json;

TEST(SchemaMetadataTest, DerivesFromColumnRecords) {
    std::vector<ColumnRecord> columns = {
        {"orders", "order_id", "int", false, true, true, false, "", ""},
        {"orders", "customer_id", "int", false, false, false, true, "customers", "id"},
        {"customers", "id", "int", false, true, true, false, "", ""},
        {"customers", "name", "varchar", true, false, false, false, "", ""},
    };
    SchemaMetadata metadata = derive_metadata(columns);

    std::vector<std::string> entities = {"orders", "order_id", "customer_id", "customers", "id", "name"};
    EXPECT_EQ(metadata.entities, entities);
    EXPECT_EQ(metadata.primary_key, "order_id");
    ASSERT_EQ(metadata.foreign_keys.size(), 1u);
    EXPECT_EQ(metadata.foreign_keys[0].column, "customer_id");
    EXPECT_EQ(metadata.foreign_keys[0].referenced_table, "customers");
    EXPECT_EQ(metadata.foreign_keys[0].referenced_column, "id");
}

TEST(SchemaMetadataTest, NoPrimaryKeyLeavesItEmpty) {
    SchemaMetadata metadata = derive_metadata({{"logs", "message", "text"}});
    EXPECT_TRUE(metadata.primary_key.empty());
    EXPECT_TRUE(metadata.foreign_keys.empty());
}

TEST(SchemaMetadataTest, ParsesColumnsPayload) {
    json j = {{"columns", json::array({
        {{"table", "users"}, {"column", "id"}, {"data_type", "int"}, {"is_primary_key", true}},
        {{"table", "users"}, {"column", "name"}, {"data_type", "varchar"}},
    })}};
    SchemaMetadata metadata = parse_schema_metadata(j);

    EXPECT_EQ(metadata.entities, (std::vector<std::string>{"users", "id", "name"}));
    EXPECT_EQ(metadata.primary_key, "id");
}

TEST(SchemaMetadataTest, ParsesExplicitMetadata) {
    json j = {
        {"entities", {"orders", "customer_id"}},
        {"primary_key", "order_id"},
        {"foreign_keys", json::array({
            "legacy_ref",
            {{"column", "customer_id"}, {"referenced_table", "customers"}, {"referenced_column", "id"}}
        })}
    };
    SchemaMetadata metadata = parse_schema_metadata(j);

    EXPECT_EQ(metadata.primary_key, "order_id");
    ASSERT_EQ(metadata.foreign_keys.size(), 2u);
    EXPECT_EQ(metadata.foreign_keys[0].column, "legacy_ref");
    EXPECT_TRUE(metadata.foreign_keys[0].referenced_table.empty());
    EXPECT_EQ(metadata.foreign_keys[1].referenced_table, "customers");

    json back = metadata_to_json(metadata);
    EXPECT_EQ(back["foreign_keys"][1]["referenced_column"], "id");
}

TEST(SchemaMetadataTest, RejectsMalformedPayloads) {
    EXPECT_THROW(parse_schema_metadata({{"columns", "users"}}), std::invalid_argument);
    EXPECT_THROW(parse_schema_metadata({{"columns", json::array({{{"table", "users"}}})}}),
                 std::invalid_argument);
    EXPECT_THROW(parse_schema_metadata({{"foreign_keys", json::array({42})}}), std::invalid_argument);
}

TEST(SchemaMetadataTest, EmptyPayloadGivesEmptyMetadata) {
    SchemaMetadata metadata = parse_schema_metadata(json::object());
    EXPECT_TRUE(metadata.entities.empty());
    EXPECT_TRUE(metadata.primary_key.empty());
    EXPECT_TRUE(metadata.foreign_keys.empty());
}
