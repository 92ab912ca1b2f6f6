#pragma once

#include <memory>
#include <string>
#include <vector>

#include "embedding_config.hpp"
#include "embedding_generator.hpp"

// General-purpose signal. Every accumulation is smoothed over neighbouring
// slots by a sliding window.
class EnhancedEmbeddingGenerator : public EmbeddingGenerator {
public:
    explicit EnhancedEmbeddingGenerator(const EmbeddingConfig& config);
    std::string name() const override { return GEN_ENHANCED; }
};

// Emphasizes the primary key, key vocabulary and typical key types.
class PrimaryKeyAwareEmbeddingGenerator : public EmbeddingGenerator {
public:
    explicit PrimaryKeyAwareEmbeddingGenerator(const EmbeddingConfig& config);
    std::string name() const override { return GEN_PRIMARY_KEY; }
};

// Emphasizes foreign keys, their referenced entities and relationship clauses.
class ForeignKeyAwareEmbeddingGenerator : public EmbeddingGenerator {
public:
    explicit ForeignKeyAwareEmbeddingGenerator(const EmbeddingConfig& config);
    std::string name() const override { return GEN_FOREIGN_KEY; }
};

// Throws ConfigurationError for a name that is not a hash generator.
std::unique_ptr<EmbeddingGenerator> make_generator(const std::string& name,
                                                   const EmbeddingConfig& config);
