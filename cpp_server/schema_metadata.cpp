#include "schema_metadata.hpp"

#include <stdexcept>
#include <unordered_set>

SchemaMetadata derive_metadata(const std::vector<ColumnRecord>& columns) {
    SchemaMetadata metadata;
    std::unordered_set<std::string> seen;

    auto add_entity = [&](const std::string& name) {
        if (!name.empty() && seen.insert(name).second) {
            metadata.entities.push_back(name);
        }
    };

    for (const auto& col : columns) {
        add_entity(col.table);
        add_entity(col.column);

        if (col.is_primary_key && metadata.primary_key.empty()) {
            metadata.primary_key = col.column;
        }
        if (col.is_foreign_key) {
            metadata.foreign_keys.push_back({col.column, col.referenced_table, col.referenced_column});
        }
    }

    return metadata;
}

ColumnRecord parse_column_record(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("table") || !j.contains("column")) {
        throw std::invalid_argument("column record requires table and column");
    }

    ColumnRecord rec;
    rec.table = j["table"].get<std::string>();
    rec.column = j["column"].get<std::string>();
    rec.data_type = j.value("data_type", std::string(""));
    rec.is_nullable = j.value("is_nullable", true);
    rec.is_identity = j.value("is_identity", false);
    rec.is_primary_key = j.value("is_primary_key", false);
    rec.is_foreign_key = j.value("is_foreign_key", false);
    rec.referenced_table = j.value("referenced_table", std::string(""));
    rec.referenced_column = j.value("referenced_column", std::string(""));
    return rec;
}

SchemaMetadata parse_schema_metadata(const nlohmann::json& j) {
    if (j.contains("columns")) {
        const auto& cols = j["columns"];
        if (!cols.is_array()) {
            throw std::invalid_argument("'columns' must be an array");
        }
        std::vector<ColumnRecord> records;
        records.reserve(cols.size());
        for (const auto& c : cols) {
            records.push_back(parse_column_record(c));
        }
        return derive_metadata(records);
    }

    SchemaMetadata metadata;
    metadata.entities = j.value("entities", std::vector<std::string>{});
    metadata.primary_key = j.value("primary_key", std::string(""));

    if (j.contains("foreign_keys")) {
        const auto& fks = j["foreign_keys"];
        if (!fks.is_array()) {
            throw std::invalid_argument("'foreign_keys' must be an array");
        }
        for (const auto& fk : fks) {
            if (fk.is_string()) {
                metadata.foreign_keys.push_back({fk.get<std::string>(), "", ""});
            } else if (fk.is_object() && fk.contains("column")) {
                metadata.foreign_keys.push_back({
                    fk["column"].get<std::string>(),
                    fk.value("referenced_table", std::string("")),
                    fk.value("referenced_column", std::string(""))
                });
            } else {
                throw std::invalid_argument("foreign key must be a string or an object with 'column'");
            }
        }
    }

    return metadata;
}

nlohmann::json metadata_to_json(const SchemaMetadata& metadata) {
    nlohmann::json fks = nlohmann::json::array();
    for (const auto& fk : metadata.foreign_keys) {
        fks.push_back({
            {"column", fk.column},
            {"referenced_table", fk.referenced_table},
            {"referenced_column", fk.referenced_column}
        });
    }
    return {
        {"entities", metadata.entities},
        {"primary_key", metadata.primary_key},
        {"foreign_keys", fks}
    };
}
