#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Output size of the default text model.
constexpr size_t DEFAULT_TEXT_MODEL_DIM = 4096;

// Opaque text -> vector model. Implementations must be deterministic for a
// fixed model version and always return dimensions() values.
class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;

    virtual std::string name() const = 0;
    virtual size_t dimensions() const = 0;
    virtual std::vector<float> embed(const std::string& text) const = 0;
};

// Hash-based bag-of-words embedder (hashing trick).
// Tokenizes text, hashes each token into a fixed-size vector, then L2-normalizes.
// Buckets come from std::hash, so output is stable within one build and one
// standard library, not across them. Vectors meant to be compared must be
// produced by the same binary.
class HashingTextEmbedder : public TextEmbedder {
public:
    explicit HashingTextEmbedder(size_t dims = DEFAULT_TEXT_MODEL_DIM);

    std::string name() const override { return "hashing_bow"; }
    size_t dimensions() const override { return dims_; }
    std::vector<float> embed(const std::string& text) const override;

private:
    size_t dims_;
};

// Wraps a text model so its output matches the generator contract: length
// target_size (reduced by averaging contiguous buckets), unit length, finite.
class LearnedEmbeddingAdapter : public TextEmbedder {
public:
    // target_size 0 keeps the model's own dimensionality.
    // Throws ConfigurationError if target_size exceeds the model's dimensions.
    LearnedEmbeddingAdapter(std::unique_ptr<TextEmbedder> model, size_t target_size = 0);

    std::string name() const override;
    size_t dimensions() const override { return target_size_; }

    // Throws DimensionMismatchError if the model returns the wrong length and
    // std::runtime_error on a non-finite value.
    std::vector<float> embed(const std::string& text) const override;

private:
    std::vector<float> reduce(const std::vector<float>& vec) const;

    std::unique_ptr<TextEmbedder> model_;
    size_t target_size_;
};
