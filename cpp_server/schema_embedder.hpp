#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "embedder.hpp"
#include "embedding_config.hpp"
#include "embedding_generator.hpp"
#include "schema_metadata.hpp"
#include "word_index.hpp"

// Runs every generator with a positive weight over one schema and blends the
// results. All generators of a call share one WordIndex, so a word lands in
// the same slot for each of them. Embeddings that will be compared with each
// other must come from the same vocabulary.
class SchemaEmbedder {
public:
    // Validates config. text_model is only required when the "learned"
    // generator has a positive weight. Throws ConfigurationError.
    explicit SchemaEmbedder(EmbeddingConfig config,
                            std::unique_ptr<TextEmbedder> text_model = nullptr);

    // Uses a vocabulary scoped to this call.
    std::vector<float> embed(const std::string& schema_text, const SchemaMetadata& metadata) const;

    std::vector<float> embed(const std::string& schema_text, const SchemaMetadata& metadata,
                             WordIndex& vocabulary) const;

    // Normalized output of each active generator, keyed by generator name.
    std::map<std::string, std::vector<float>> generate_all(const std::string& schema_text,
                                                           const SchemaMetadata& metadata,
                                                           WordIndex& vocabulary) const;

    const EmbeddingConfig& config() const { return config_; }
    size_t dimensions() const { return config_.embedding_size; }

private:
    EmbeddingConfig config_;
    std::vector<std::unique_ptr<EmbeddingGenerator>> generators_;
    std::unique_ptr<LearnedEmbeddingAdapter> learned_;
};
