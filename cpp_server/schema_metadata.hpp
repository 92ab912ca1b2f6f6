#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// One row of the schema-introspection result.
struct ColumnRecord {
    std::string table;
    std::string column;
    std::string data_type;
    bool is_nullable = true;
    bool is_identity = false;
    bool is_primary_key = false;
    bool is_foreign_key = false;
    std::string referenced_table;   // empty when unknown
    std::string referenced_column;  // empty when unknown
};

struct ForeignKey {
    std::string column;
    std::string referenced_table;
    std::string referenced_column;
};

struct SchemaMetadata {
    std::vector<std::string> entities;
    std::string primary_key;  // empty when the schema has none
    std::vector<ForeignKey> foreign_keys;
};

// Entities are table and column names in encounter order without duplicates.
// The primary key is the first primary-key column; every foreign-key column
// becomes a ForeignKey carrying its reference.
SchemaMetadata derive_metadata(const std::vector<ColumnRecord>& columns);

ColumnRecord parse_column_record(const nlohmann::json& j);

// Accepts either {"columns": [...]} or explicit
// {"entities": [...], "primary_key": "...", "foreign_keys": [...]} where a
// foreign key is a column name string or an object with column /
// referenced_table / referenced_column.
SchemaMetadata parse_schema_metadata(const nlohmann::json& j);

nlohmann::json metadata_to_json(const SchemaMetadata& metadata);
