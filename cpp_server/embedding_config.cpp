#include "embedding_config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace {

bool is_known_generator(const std::string& name) {
    const auto& names = generator_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

float read_weight(const nlohmann::json& value, const std::string& what) {
    if (!value.is_number()) {
        throw ConfigurationError(what + " must be a number");
    }
    float w = value.get<float>();
    if (!std::isfinite(w)) {
        throw ConfigurationError(what + " must be finite");
    }
    return w;
}

void apply_weight_table(WeightTable& table, const nlohmann::json& j, const std::string& generator) {
    if (!j.is_object()) {
        throw ConfigurationError("weight_tables." + generator + " must be an object");
    }

    const std::map<std::string, float WeightTable::*> fields = {
        {"base", &WeightTable::base},
        {"primary_key_token", &WeightTable::primary_key_token},
        {"foreign_key_token", &WeightTable::foreign_key_token},
        {"primary_key_extra", &WeightTable::primary_key_extra},
        {"foreign_key_extra", &WeightTable::foreign_key_extra},
        {"referenced_extra", &WeightTable::referenced_extra},
        {"domain_keyword", &WeightTable::domain_keyword},
        {"conditional", &WeightTable::conditional},
        {"entity", &WeightTable::entity},
    };

    for (const auto& [key, value] : j.items()) {
        auto it = fields.find(key);
        if (it == fields.end()) {
            throw ConfigurationError("Unknown weight '" + key + "' for generator " + generator);
        }
        table.*(it->second) = read_weight(value, "weight_tables." + generator + "." + key);
    }
}

}  // namespace

const std::vector<std::string>& generator_names() {
    static const std::vector<std::string> names = {
        GEN_ENHANCED, GEN_PRIMARY_KEY, GEN_FOREIGN_KEY, GEN_LEARNED
    };
    return names;
}

WeightTable default_weight_table(const std::string& generator) {
    WeightTable t;
    if (generator == GEN_ENHANCED) {
        t.primary_key_token = 3.0f;
        t.foreign_key_token = 2.0f;
        t.primary_key_extra = 5.0f;
        t.foreign_key_extra = 3.0f;
        t.entity = 4.0f;
    } else if (generator == GEN_PRIMARY_KEY) {
        t.primary_key_token = 10.0f;
        t.foreign_key_token = 3.0f;
        t.primary_key_extra = 15.0f;
        t.domain_keyword = 5.0f;
        t.conditional = 3.0f;
        t.entity = 2.0f;
    } else if (generator == GEN_FOREIGN_KEY) {
        t.primary_key_token = 3.0f;
        t.foreign_key_token = 10.0f;
        t.foreign_key_extra = 15.0f;
        t.referenced_extra = 5.0f;
        t.domain_keyword = 5.0f;
        t.conditional = 3.0f;
        t.entity = 2.0f;
    } else {
        throw ConfigurationError("No weight table for generator '" + generator + "'");
    }
    return t;
}

EmbeddingConfig::EmbeddingConfig() {
    for (const char* name : {GEN_ENHANCED, GEN_PRIMARY_KEY, GEN_FOREIGN_KEY}) {
        generator_weights[name] = 1.0f;
        weight_tables[name] = default_weight_table(name);
    }
}

float EmbeddingConfig::weight_for(const std::string& generator) const {
    auto it = generator_weights.find(generator);
    return it == generator_weights.end() ? 0.0f : it->second;
}

const WeightTable& EmbeddingConfig::weight_table(const std::string& generator) const {
    auto it = weight_tables.find(generator);
    if (it == weight_tables.end()) {
        throw ConfigurationError("No weight table for generator '" + generator + "'");
    }
    return it->second;
}

void EmbeddingConfig::validate() const {
    if (embedding_size == 0) {
        throw ConfigurationError("embedding_size must be positive");
    }
    if (!std::isfinite(window_decay) || window_decay < 0.0f || window_decay > 1.0f) {
        throw ConfigurationError("window_decay must be within [0, 1]");
    }
    // 2 * radius < size keeps the two sides of the window on distinct slots.
    if (window_radius > (embedding_size - 1) / 2) {
        throw ConfigurationError("window_radius " + std::to_string(window_radius) +
                                 " must be less than half of embedding_size " +
                                 std::to_string(embedding_size));
    }

    bool any_positive = false;
    for (const auto& [name, weight] : generator_weights) {
        if (!is_known_generator(name)) {
            throw ConfigurationError("Unknown generator '" + name + "'");
        }
        if (!std::isfinite(weight) || weight < 0.0f) {
            throw ConfigurationError("Weight of generator '" + name + "' must be a finite non-negative number");
        }
        any_positive = any_positive || weight > 0.0f;
    }
    if (!any_positive) {
        throw ConfigurationError("At least one generator needs a positive weight");
    }
}

EmbeddingConfig parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Configuration must be a JSON object");
    }

    EmbeddingConfig config;
    for (const auto& [key, value] : j.items()) {
        if (key == "embedding_size") {
            if (!value.is_number_integer() || value.get<long long>() <= 0) {
                throw ConfigurationError("embedding_size must be a positive integer");
            }
            config.embedding_size = value.get<size_t>();
        } else if (key == "generator_weights") {
            if (!value.is_object()) {
                throw ConfigurationError("generator_weights must be an object");
            }
            config.generator_weights.clear();
            for (const auto& [name, w] : value.items()) {
                config.generator_weights[name] = read_weight(w, "generator_weights." + name);
            }
        } else if (key == "weight_tables") {
            if (!value.is_object()) {
                throw ConfigurationError("weight_tables must be an object");
            }
            for (const auto& [name, table] : value.items()) {
                // Throws for unknown generators and for "learned".
                WeightTable base = config.weight_table(name);
                apply_weight_table(base, table, name);
                config.weight_tables[name] = base;
            }
        } else if (key == "remove_stop_words") {
            if (!value.is_boolean()) {
                throw ConfigurationError("remove_stop_words must be a boolean");
            }
            config.remove_stop_words = value.get<bool>();
        } else if (key == "window_decay") {
            config.window_decay = read_weight(value, "window_decay");
        } else if (key == "window_radius") {
            if (!value.is_number_integer() || value.get<long long>() < 0) {
                throw ConfigurationError("window_radius must be a non-negative integer");
            }
            config.window_radius = value.get<size_t>();
        } else {
            throw ConfigurationError("Unknown configuration key '" + key + "'");
        }
    }

    config.validate();
    return config;
}

EmbeddingConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open config " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Config " + path + " is not valid JSON: " + e.what());
    }
    return parse_config(j);
}
