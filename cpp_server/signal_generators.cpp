#include "signal_generators.hpp"
#include "errors.hpp"

EnhancedEmbeddingGenerator::EnhancedEmbeddingGenerator(const EmbeddingConfig& config)
    : EmbeddingGenerator(config.weight_table(GEN_ENHANCED),
                         KeywordLists{},
                         config.embedding_size,
                         config.remove_stop_words,
                         std::make_unique<WindowedHashProjector>(config.window_decay,
                                                                 config.window_radius)) {
    if (config.window_radius > (config.embedding_size - 1) / 2) {
        throw ConfigurationError("window_radius must be less than half of embedding_size");
    }
}

PrimaryKeyAwareEmbeddingGenerator::PrimaryKeyAwareEmbeddingGenerator(const EmbeddingConfig& config)
    : EmbeddingGenerator(config.weight_table(GEN_PRIMARY_KEY),
                         KeywordLists{
                             {"primary", "key", "id", "identifier"},
                             {"int", "bigint", "uuid", "guid"},
                             {}
                         },
                         config.embedding_size,
                         config.remove_stop_words,
                         std::make_unique<HashProjector>()) {}

ForeignKeyAwareEmbeddingGenerator::ForeignKeyAwareEmbeddingGenerator(const EmbeddingConfig& config)
    : EmbeddingGenerator(config.weight_table(GEN_FOREIGN_KEY),
                         KeywordLists{
                             {"foreign", "key", "references", "constraint"},
                             {"on", "delete", "cascade", "set", "null", "update"},
                             {"_id", "_fk"}
                         },
                         config.embedding_size,
                         config.remove_stop_words,
                         std::make_unique<HashProjector>()) {}

std::unique_ptr<EmbeddingGenerator> make_generator(const std::string& name,
                                                   const EmbeddingConfig& config) {
    if (name == GEN_ENHANCED) {
        return std::make_unique<EnhancedEmbeddingGenerator>(config);
    } else if (name == GEN_PRIMARY_KEY) {
        return std::make_unique<PrimaryKeyAwareEmbeddingGenerator>(config);
    } else if (name == GEN_FOREIGN_KEY) {
        return std::make_unique<ForeignKeyAwareEmbeddingGenerator>(config);
    }
    throw ConfigurationError("Unknown hash generator '" + name + "'");
}
