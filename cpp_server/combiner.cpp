#include "combiner.hpp"
#include "errors.hpp"
#include "hash_projector.hpp"

#include <utility>

std::vector<float> combine(const std::vector<WeightedVector>& inputs) {
    if (inputs.empty()) {
        throw DimensionMismatchError("Nothing to combine");
    }

    size_t dims = inputs.front().vector.size();
    for (const auto& in : inputs) {
        if (in.vector.size() != dims) {
            throw DimensionMismatchError("Cannot combine vectors of lengths " + std::to_string(dims) +
                                         " and " + std::to_string(in.vector.size()));
        }
    }

    std::vector<float> result(dims, 0.0f);
    for (const auto& in : inputs) {
        if (in.weight == 0.0f) {
            continue;
        }
        for (size_t i = 0; i < dims; ++i) {
            result[i] += in.weight * in.vector[i];
        }
    }

    return normalize(std::move(result));
}

std::vector<float> combine(const std::map<std::string, std::vector<float>>& outputs,
                           const std::map<std::string, float>& weights) {
    for (const auto& [name, weight] : weights) {
        if (weight != 0.0f && outputs.count(name) == 0) {
            throw ConfigurationError("Weight given for generator '" + name + "' without output");
        }
    }

    std::vector<WeightedVector> inputs;
    inputs.reserve(outputs.size());
    for (const auto& [name, vec] : outputs) {
        auto it = weights.find(name);
        inputs.push_back({vec, it == weights.end() ? 0.0f : it->second});
    }
    return combine(inputs);
}
