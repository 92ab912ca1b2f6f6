#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Bidirectional word <-> index mapping. Indices are handed out in first-seen
// order starting at 0. Not thread-safe: one writer per instance.
class WordIndex {
public:
    // Returns the existing index for word, or assigns the next one.
    size_t get_or_add(const std::string& word);

    // Throws NotFoundError if index was never assigned.
    const std::string& get_word(size_t index) const;

    std::optional<size_t> find(const std::string& word) const;

    size_t count() const { return id_to_word_.size(); }

private:
    std::unordered_map<std::string, size_t> word_to_id_;
    std::vector<std::string> id_to_word_;
};
