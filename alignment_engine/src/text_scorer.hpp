#pragma once

#include "config.hpp"
#include "lexicon_store.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

struct TextScore {
    double score = 0.0;      // [-1, 1]
    double coverage = 0.0;   // matched tokens / total tokens
    std::size_t matched_tokens = 0;
    std::size_t total_tokens = 0;
};

class TextScorer {
public:
    TextScorer(const Config& config, std::shared_ptr<const LexiconStore> lexicon);

    // Scores one document on one axis. Unknown axes and documents without
    // matches yield score 0 and coverage 0.
    TextScore score_document(const Document& document, const std::string& axis) const;
    TextScore score_tokens(const std::vector<std::string>& tokens, const std::string& axis) const;

    // Coverage-weighted mean of per-document scores for each author
    // (primary sponsor and co-sponsors). Confidence grows with summed coverage.
    std::map<std::string, SubScore> score_members(
        const std::vector<Document>& documents,
        const std::vector<TextScore>& document_scores) const;

private:
    const Config& config_;
    std::shared_ptr<const LexiconStore> lexicon_;
};
