#include "tokenizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

// Keep SQL words the generators key on (on, set, null, key, ...) out of this list.
constexpr std::array<const char*, 14> STOP_WORDS = {
    "a", "an", "and", "as", "at", "by", "for", "in", "is", "of", "or", "the", "to", "with"
};

bool is_split_punct(char c) {
    return c == '(' || c == ')' || c == ',' || c == ';';
}

}  // namespace

std::string to_lower(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_stop_word(const std::string& token) {
    return std::find_if(STOP_WORDS.begin(), STOP_WORDS.end(),
                        [&](const char* w) { return token == w; }) != STOP_WORDS.end();
}

std::vector<std::string> tokenize(const std::string& text, bool remove_stop_words) {
    std::vector<std::string> tokens;
    std::string token;

    auto flush = [&]() {
        if (!token.empty()) {
            if (!remove_stop_words || !is_stop_word(token)) {
                tokens.push_back(token);
            }
            token.clear();
        }
    };

    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            flush();
        } else if (is_split_punct(c)) {
            flush();
            tokens.emplace_back(1, c);
        } else {
            token += static_cast<char>(std::tolower(uc));
        }
    }
    flush();

    return tokens;
}
