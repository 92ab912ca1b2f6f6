#include "word_index.hpp"
#include "errors.hpp"

size_t WordIndex::get_or_add(const std::string& word) {
    auto it = word_to_id_.find(word);
    if (it != word_to_id_.end()) {
        return it->second;
    }

    size_t index = id_to_word_.size();
    word_to_id_.emplace(word, index);
    id_to_word_.push_back(word);
    return index;
}

const std::string& WordIndex::get_word(size_t index) const {
    if (index >= id_to_word_.size()) {
        throw NotFoundError("No word assigned to index " + std::to_string(index) +
                            " (vocabulary size " + std::to_string(id_to_word_.size()) + ")");
    }
    return id_to_word_[index];
}

std::optional<size_t> WordIndex::find(const std::string& word) const {
    auto it = word_to_id_.find(word);
    if (it == word_to_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}
