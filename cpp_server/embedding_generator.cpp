#include "embedding_generator.hpp"
#include "errors.hpp"
#include "tokenizer.hpp"

#include <unordered_set>
#include <utility>

EmbeddingGenerator::EmbeddingGenerator(const WeightTable& weights, KeywordLists keywords,
                                       size_t embedding_size, bool remove_stop_words,
                                       std::unique_ptr<HashProjector> projector)
    : weights_(weights),
      keywords_(std::move(keywords)),
      embedding_size_(embedding_size),
      remove_stop_words_(remove_stop_words),
      projector_(std::move(projector)) {
    if (embedding_size_ == 0) {
        throw ConfigurationError("embedding_size must be positive");
    }
}

void EmbeddingGenerator::add(std::vector<float>& vec, WordIndex& index,
                             const std::string& word, float weight) const {
    if (word.empty() || weight == 0.0f) {
        return;
    }
    projector_->accumulate(vec, index.get_or_add(word), weight);
}

std::vector<float> EmbeddingGenerator::accumulate_signals(const std::string& schema_text,
                                                          const SchemaMetadata& metadata,
                                                          WordIndex& index) const {
    std::vector<float> vec(embedding_size_, 0.0f);

    std::vector<std::string> tokens = tokenize(schema_text, remove_stop_words_);
    if (tokens.empty()) {
        return vec;
    }

    std::string primary_key = to_lower(metadata.primary_key);

    std::vector<ForeignKey> foreign_keys;
    std::unordered_set<std::string> fk_columns;
    for (const auto& fk : metadata.foreign_keys) {
        ForeignKey lowered{to_lower(fk.column), to_lower(fk.referenced_table), to_lower(fk.referenced_column)};
        if (!lowered.column.empty()) {
            fk_columns.insert(lowered.column);
        }
        foreign_keys.push_back(std::move(lowered));
    }

    // Every token, with key bonuses folded into one accumulation.
    for (const auto& token : tokens) {
        float w = weights_.base;
        if (!primary_key.empty() && token == primary_key) {
            w += weights_.primary_key_token;
        }
        if (fk_columns.count(token) > 0) {
            w += weights_.foreign_key_token;
        }
        add(vec, index, token, w);
    }

    add(vec, index, primary_key, weights_.primary_key_extra);

    for (const auto& fk : foreign_keys) {
        add(vec, index, fk.column, weights_.foreign_key_extra);
        add(vec, index, fk.referenced_table, weights_.referenced_extra);
        add(vec, index, fk.referenced_column, weights_.referenced_extra);
    }

    for (const auto& keyword : keywords_.domain) {
        add(vec, index, keyword, weights_.domain_keyword);
    }

    std::unordered_set<std::string> present(tokens.begin(), tokens.end());
    for (const auto& keyword : keywords_.conditional) {
        if (present.count(keyword) > 0) {
            add(vec, index, keyword, weights_.conditional);
        }
    }
    for (const auto& pattern : keywords_.join_patterns) {
        for (const auto& fk : foreign_keys) {
            if (fk.column.find(pattern) != std::string::npos) {
                add(vec, index, fk.column, weights_.conditional);
            }
        }
    }

    for (const auto& entity : metadata.entities) {
        add(vec, index, to_lower(entity), weights_.entity);
    }

    return vec;
}

std::vector<float> EmbeddingGenerator::generate(const std::string& schema_text,
                                                const SchemaMetadata& metadata,
                                                WordIndex& index) const {
    return normalize(accumulate_signals(schema_text, metadata, index));
}
