#pragma once

#include <cstddef>
#include <vector>

// Hashing trick: a word index lands in slot (index mod size). Collisions are
// accepted, not corrected.
size_t slot_for(size_t word_index, size_t size);

float magnitude(const std::vector<float>& vec);

// Divides every element by the Euclidean magnitude. A zero-magnitude vector
// is returned unchanged.
std::vector<float> normalize(std::vector<float> vec);

// Throws DimensionMismatchError on unequal lengths. Zero vectors score 0.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

class HashProjector {
public:
    virtual ~HashProjector() = default;

    // vec[word_index mod vec.size()] += weight
    virtual void accumulate(std::vector<float>& vec, size_t word_index, float weight) const;
};

// Also spreads decay^d * weight to the slots d = 1..radius on either side of
// the target slot, wrapping around the vector.
class WindowedHashProjector : public HashProjector {
public:
    WindowedHashProjector(float decay, size_t radius);

    void accumulate(std::vector<float>& vec, size_t word_index, float weight) const override;

    float decay() const { return decay_; }
    size_t radius() const { return radius_; }

private:
    float decay_;
    size_t radius_;
};
