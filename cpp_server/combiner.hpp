#pragma once

#include <map>
#include <string>
#include <vector>

struct WeightedVector {
    std::vector<float> vector;
    float weight;
};

// result[i] = sum_g weight_g * vector_g[i], then normalized.
// Throws DimensionMismatchError if the inputs are empty or differ in length.
std::vector<float> combine(const std::vector<WeightedVector>& inputs);

// Generators missing from weights contribute with weight 0.
// Throws ConfigurationError if weights names a generator with no output.
std::vector<float> combine(const std::map<std::string, std::vector<float>>& outputs,
                           const std::map<std::string, float>& weights);
