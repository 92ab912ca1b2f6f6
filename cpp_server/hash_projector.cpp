#include "hash_projector.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

size_t slot_for(size_t word_index, size_t size) {
    if (size == 0) {
        throw DimensionMismatchError("Cannot project into a zero-length vector");
    }
    return word_index % size;
}

float magnitude(const std::vector<float>& vec) {
    double sum = 0.0;
    for (float v : vec) {
        sum += static_cast<double>(v) * static_cast<double>(v);
    }
    return static_cast<float>(std::sqrt(sum));
}

std::vector<float> normalize(std::vector<float> vec) {
    float norm = magnitude(vec);
    if (norm == 0.0f) {
        return vec;
    }
    for (float& v : vec) {
        v /= norm;
    }
    return vec;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError("Cosine similarity of vectors with lengths " +
                                     std::to_string(a.size()) + " and " + std::to_string(b.size()));
    }

    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    float denom = magnitude(a) * magnitude(b);
    if (denom == 0.0f) {
        return 0.0f;
    }
    return static_cast<float>(dot / denom);
}

void HashProjector::accumulate(std::vector<float>& vec, size_t word_index, float weight) const {
    vec[slot_for(word_index, vec.size())] += weight;
}

WindowedHashProjector::WindowedHashProjector(float decay, size_t radius)
    : decay_(decay), radius_(radius) {}

void WindowedHashProjector::accumulate(std::vector<float>& vec, size_t word_index, float weight) const {
    size_t n = vec.size();
    size_t slot = slot_for(word_index, n);
    vec[slot] += weight;

    float spread = weight;
    for (size_t d = 1; d <= radius_; ++d) {
        spread *= decay_;
        size_t offset = d % n;
        vec[(slot + offset) % n] += spread;
        vec[(slot + n - offset) % n] += spread;
    }
}
