#include "tokenizer.hpp"

namespace {

bool is_word_byte(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c >= 0x80;
}

} // namespace

std::vector<std::string> Tokenizer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<unsigned char>(c + ('a' - 'A'));
        }

        if (is_word_byte(c)) {
            current += static_cast<char>(c);
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }

    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::string Tokenizer::normalize(const std::string& text) {
    std::string joined;
    for (const auto& token : tokenize(text)) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += token;
    }
    return joined;
}
