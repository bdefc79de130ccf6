#pragma once

#include <string>
#include <vector>

class Tokenizer {
public:
    // Lowercases ASCII, splits on anything that is not a letter or digit.
    // Bytes of multi-byte UTF-8 sequences are kept as word characters.
    static std::vector<std::string> tokenize(const std::string& text);

    // Tokens joined by single spaces; the canonical form of a lexicon term.
    static std::string normalize(const std::string& text);
};
