#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

struct VectorEntry {
    std::string schema_id;
    std::string database;
    std::string schema_text;
    nlohmann::json metadata;
    std::vector<float> embedding;
};

struct SearchResult {
    std::string schema_id;
    std::string database;
    float score;
    nlohmann::json metadata;
};

class VectorDB {
public:
    // Insert or overwrite an entry by schema_id.
    void store(const std::string& schema_id,
               const std::string& database,
               const std::string& schema_text,
               const nlohmann::json& metadata,
               const std::vector<float>& embedding);

    // Returns false if schema_id was not stored.
    bool remove(const std::string& schema_id);

    // Brute-force cosine similarity search.
    // If database_filter is non-empty, only search within that database.
    // Throws DimensionMismatchError if the query length differs from an entry's.
    std::vector<SearchResult> search(const std::vector<float>& query_embedding,
                                     int top_k,
                                     const std::string& database_filter = "") const;

    size_t size() const { return entries_.size(); }
    size_t database_count() const { return database_index_.size(); }

private:
    // Primary store: schema_id -> entry
    std::unordered_map<std::string, VectorEntry> entries_;

    // Secondary index: database -> [schema_ids]
    std::unordered_map<std::string, std::vector<std::string>> database_index_;

    void unindex(const VectorEntry& entry);
};
