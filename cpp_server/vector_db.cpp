#include "vector_db.hpp"
#include "hash_projector.hpp"

#include <algorithm>

void VectorDB::unindex(const VectorEntry& entry) {
    auto& ids = database_index_[entry.database];
    ids.erase(std::remove(ids.begin(), ids.end(), entry.schema_id), ids.end());
    if (ids.empty()) {
        database_index_.erase(entry.database);
    }
}

void VectorDB::store(const std::string& schema_id,
                     const std::string& database,
                     const std::string& schema_text,
                     const nlohmann::json& metadata,
                     const std::vector<float>& embedding) {
    // If overwriting, remove old database_index entry
    auto it = entries_.find(schema_id);
    if (it != entries_.end()) {
        unindex(it->second);
    }

    entries_[schema_id] = VectorEntry{schema_id, database, schema_text, metadata, embedding};
    database_index_[database].push_back(schema_id);
}

bool VectorDB::remove(const std::string& schema_id) {
    auto it = entries_.find(schema_id);
    if (it == entries_.end()) {
        return false;
    }
    unindex(it->second);
    entries_.erase(it);
    return true;
}

std::vector<SearchResult> VectorDB::search(const std::vector<float>& query_embedding,
                                           int top_k,
                                           const std::string& database_filter) const {
    std::vector<std::pair<float, const VectorEntry*>> scored;

    if (!database_filter.empty()) {
        // Filtered search: only entries in that database
        auto it = database_index_.find(database_filter);
        if (it != database_index_.end()) {
            for (const auto& sid : it->second) {
                auto eit = entries_.find(sid);
                if (eit != entries_.end()) {
                    float score = cosine_similarity(query_embedding, eit->second.embedding);
                    scored.emplace_back(score, &eit->second);
                }
            }
        }
    } else {
        // Unfiltered: scan all entries
        for (const auto& [sid, entry] : entries_) {
            float score = cosine_similarity(query_embedding, entry.embedding);
            scored.emplace_back(score, &entry);
        }
    }

    // Sort descending by score, ties by schema_id for a stable order
    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second->schema_id < b.second->schema_id;
    });

    // Take top_k
    std::vector<SearchResult> results;
    int count = std::min(std::max(top_k, 0), static_cast<int>(scored.size()));
    for (int i = 0; i < count; ++i) {
        results.push_back({
            scored[i].second->schema_id,
            scored[i].second->database,
            scored[i].first,
            scored[i].second->metadata
        });
    }

    return results;
}
