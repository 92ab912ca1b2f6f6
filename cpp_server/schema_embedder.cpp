#include "schema_embedder.hpp"
#include "combiner.hpp"
#include "errors.hpp"
#include "signal_generators.hpp"

#include <utility>

SchemaEmbedder::SchemaEmbedder(EmbeddingConfig config, std::unique_ptr<TextEmbedder> text_model)
    : config_(std::move(config)) {
    config_.validate();

    for (const auto& [name, weight] : config_.generator_weights) {
        if (weight <= 0.0f) {
            continue;
        }
        if (name == GEN_LEARNED) {
            if (!text_model) {
                throw ConfigurationError("Generator 'learned' is weighted but no text model is configured");
            }
            learned_ = std::make_unique<LearnedEmbeddingAdapter>(std::move(text_model),
                                                                 config_.embedding_size);
        } else {
            generators_.push_back(make_generator(name, config_));
        }
    }
}

std::map<std::string, std::vector<float>> SchemaEmbedder::generate_all(const std::string& schema_text,
                                                                       const SchemaMetadata& metadata,
                                                                       WordIndex& vocabulary) const {
    std::map<std::string, std::vector<float>> outputs;

    for (const auto& gen : generators_) {
        outputs[gen->name()] = gen->generate(schema_text, metadata, vocabulary);
    }
    if (learned_) {
        outputs[GEN_LEARNED] = learned_->embed(schema_text);
    }

    return outputs;
}

std::vector<float> SchemaEmbedder::embed(const std::string& schema_text, const SchemaMetadata& metadata) const {
    WordIndex vocabulary;
    return embed(schema_text, metadata, vocabulary);
}

std::vector<float> SchemaEmbedder::embed(const std::string& schema_text, const SchemaMetadata& metadata,
                                         WordIndex& vocabulary) const {
    return combine(generate_all(schema_text, metadata, vocabulary), config_.generator_weights);
}
