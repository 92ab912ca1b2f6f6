#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "embedding_config.hpp"
#include "hash_projector.hpp"
#include "schema_metadata.hpp"
#include "word_index.hpp"

// Word lists a generator weights on top of the schema text.
struct KeywordLists {
    // Weighted unconditionally, whether or not they occur in the text.
    std::vector<std::string> domain;
    // Weighted at their own slot only when present as a token.
    std::vector<std::string> conditional;
    // Substrings of foreign key columns; a match weights the foreign key once.
    std::vector<std::string> join_patterns;
};

// Projects schema text and metadata into a fixed-size vector. Variants differ
// only in their weight table, keyword lists and projector.
class EmbeddingGenerator {
public:
    virtual ~EmbeddingGenerator() = default;

    virtual std::string name() const = 0;

    // Pre-normalization weighted sums. Registers every weighted word in index.
    // Text without tokens yields the zero vector; no signal is added.
    std::vector<float> accumulate_signals(const std::string& schema_text,
                                          const SchemaMetadata& metadata,
                                          WordIndex& index) const;

    // Unit-length embedding, or the zero vector for empty input.
    std::vector<float> generate(const std::string& schema_text,
                                const SchemaMetadata& metadata,
                                WordIndex& index) const;

    const WeightTable& weights() const { return weights_; }
    const KeywordLists& keywords() const { return keywords_; }
    size_t dimensions() const { return embedding_size_; }

protected:
    EmbeddingGenerator(const WeightTable& weights, KeywordLists keywords,
                       size_t embedding_size, bool remove_stop_words,
                       std::unique_ptr<HashProjector> projector);

private:
    void add(std::vector<float>& vec, WordIndex& index,
             const std::string& word, float weight) const;

    WeightTable weights_;
    KeywordLists keywords_;
    size_t embedding_size_;
    bool remove_stop_words_;
    std::unique_ptr<HashProjector> projector_;
};
