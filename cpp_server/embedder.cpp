#include "embedder.hpp"
#include "errors.hpp"
#include "hash_projector.hpp"

#include <cctype>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <utility>

HashingTextEmbedder::HashingTextEmbedder(size_t dims)
    : dims_(dims) {
    if (dims_ == 0) {
        throw ConfigurationError("HashingTextEmbedder needs at least one dimension");
    }
}

std::vector<float> HashingTextEmbedder::embed(const std::string& text) const {
    std::vector<float> vec(dims_, 0.0f);

    // Tokenize: lowercase, split on non-alphanumeric
    std::string token;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!token.empty()) {
            vec[std::hash<std::string>{}(token) % dims_] += 1.0f;
            token.clear();
        }
    }
    if (!token.empty()) {
        vec[std::hash<std::string>{}(token) % dims_] += 1.0f;
    }

    return normalize(std::move(vec));
}

LearnedEmbeddingAdapter::LearnedEmbeddingAdapter(std::unique_ptr<TextEmbedder> model, size_t target_size)
    : model_(std::move(model)), target_size_(target_size) {
    if (!model_) {
        throw ConfigurationError("LearnedEmbeddingAdapter requires a model");
    }
    if (target_size_ == 0) {
        target_size_ = model_->dimensions();
    }
    if (target_size_ > model_->dimensions()) {
        throw ConfigurationError("Cannot reduce " + model_->name() + " output of " +
                                 std::to_string(model_->dimensions()) + " dimensions to " +
                                 std::to_string(target_size_));
    }
}

std::string LearnedEmbeddingAdapter::name() const {
    return "learned(" + model_->name() + ")";
}

std::vector<float> LearnedEmbeddingAdapter::reduce(const std::vector<float>& vec) const {
    size_t dims = vec.size();
    if (dims == target_size_) {
        return vec;
    }

    // Bucket i averages [i*dims/target, (i+1)*dims/target); never empty since dims > target.
    std::vector<float> out(target_size_, 0.0f);
    for (size_t i = 0; i < target_size_; ++i) {
        size_t begin = i * dims / target_size_;
        size_t end = (i + 1) * dims / target_size_;
        double sum = 0.0;
        for (size_t k = begin; k < end; ++k) {
            sum += vec[k];
        }
        out[i] = static_cast<float>(sum / static_cast<double>(end - begin));
    }
    return out;
}

std::vector<float> LearnedEmbeddingAdapter::embed(const std::string& text) const {
    std::vector<float> raw = model_->embed(text);
    if (raw.size() != model_->dimensions()) {
        throw DimensionMismatchError(model_->name() + " returned " + std::to_string(raw.size()) +
                                     " values, expected " + std::to_string(model_->dimensions()));
    }
    for (float v : raw) {
        if (!std::isfinite(v)) {
            throw std::runtime_error(model_->name() + " returned a non-finite value");
        }
    }
    return normalize(reduce(raw));
}
