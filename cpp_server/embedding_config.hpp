#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

constexpr size_t DEFAULT_EMBED_DIM = 3072;

// Generator names as they appear in configuration and in responses.
constexpr const char* GEN_ENHANCED = "enhanced";
constexpr const char* GEN_PRIMARY_KEY = "primary_key_aware";
constexpr const char* GEN_FOREIGN_KEY = "foreign_key_aware";
constexpr const char* GEN_LEARNED = "learned";

const std::vector<std::string>& generator_names();

// Extra weight each kind of signal contributes to its slot.
struct WeightTable {
    float base = 1.0f;
    float primary_key_token = 0.0f;
    float foreign_key_token = 0.0f;
    float primary_key_extra = 0.0f;
    float foreign_key_extra = 0.0f;
    float referenced_extra = 0.0f;
    float domain_keyword = 0.0f;
    float conditional = 0.0f;
    float entity = 0.0f;
};

// Throws ConfigurationError for a name without a weight table (incl. "learned").
WeightTable default_weight_table(const std::string& generator);

struct EmbeddingConfig {
    EmbeddingConfig();

    size_t embedding_size = DEFAULT_EMBED_DIM;
    // Generators absent from this map get weight 0.
    std::map<std::string, float> generator_weights;
    std::map<std::string, WeightTable> weight_tables;
    bool remove_stop_words = false;
    // Sliding window of the enhanced generator. 2 * window_radius must stay
    // below embedding_size.
    float window_decay = 0.5f;
    size_t window_radius = 1;

    float weight_for(const std::string& generator) const;
    const WeightTable& weight_table(const std::string& generator) const;

    // Throws ConfigurationError.
    void validate() const;
};

// Keys missing from j keep their defaults; unknown keys are rejected.
// Throws ConfigurationError.
EmbeddingConfig parse_config(const nlohmann::json& j);

EmbeddingConfig load_config(const std::string& path);
