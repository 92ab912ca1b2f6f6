#pragma once

#include <string>
#include <vector>

// Lowercases text, splits on whitespace and splits off the punctuation
// characters ( ) , ; as standalone tokens. Empty tokens are dropped.
// With remove_stop_words, tokens from a fixed English stop list are removed
// after splitting.
std::vector<std::string> tokenize(const std::string& text, bool remove_stop_words = false);

bool is_stop_word(const std::string& token);

std::string to_lower(const std::string& text);
