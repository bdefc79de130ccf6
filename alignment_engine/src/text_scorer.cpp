#include "text_scorer.hpp"
#include "tokenizer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <set>

TextScorer::TextScorer(const Config& config, std::shared_ptr<const LexiconStore> lexicon)
    : config_(config), lexicon_(std::move(lexicon)) {}

TextScore TextScorer::score_document(const Document& document, const std::string& axis) const {
    return score_tokens(Tokenizer::tokenize(document.text), axis);
}

TextScore TextScorer::score_tokens(const std::vector<std::string>& tokens, const std::string& axis) const {
    TextScore result;
    result.total_tokens = tokens.size();

    const AxisLexicon* lexicon = lexicon_ ? lexicon_->axis(axis) : nullptr;
    if (!lexicon || tokens.empty()) {
        return result;
    }

    std::vector<double> matched_weights;
    std::size_t i = 0;
    while (i < tokens.size()) {
        // Greedy longest-first so a matched n-gram's tokens are not counted again
        std::size_t longest = std::min(lexicon->max_ngram(), tokens.size() - i);
        std::size_t consumed = 0;
        for (std::size_t n = longest; n >= 1; --n) {
            std::string candidate = tokens[i];
            for (std::size_t k = 1; k < n; ++k) {
                candidate += ' ';
                candidate += tokens[i + k];
            }
            auto weight = lexicon->lookup(candidate);
            if (weight) {
                matched_weights.push_back(*weight);
                consumed = n;
                break;
            }
        }

        if (consumed > 0) {
            result.matched_tokens += consumed;
            i += consumed;
        } else {
            ++i;
        }
    }

    if (result.matched_tokens == 0) {
        return result;
    }

    // Summation order must not depend on token order
    std::sort(matched_weights.begin(), matched_weights.end());
    double sum = 0.0;
    for (double w : matched_weights) {
        sum += w;
    }

    result.score = util::clamp_unit(sum / std::sqrt(static_cast<double>(result.matched_tokens)));
    result.coverage = util::clamp_confidence(
        static_cast<double>(result.matched_tokens) / static_cast<double>(result.total_tokens));
    return result;
}

std::map<std::string, SubScore> TextScorer::score_members(
    const std::vector<Document>& documents,
    const std::vector<TextScore>& document_scores) const {

    struct Accumulator {
        double weighted_sum = 0.0;
        double coverage_sum = 0.0;
    };
    std::map<std::string, Accumulator> accumulators;

    std::size_t count = std::min(documents.size(), document_scores.size());
    for (std::size_t i = 0; i < count; ++i) {
        const auto& doc = documents[i];
        const auto& scored = document_scores[i];

        std::set<std::string> authors(doc.cosponsors.begin(), doc.cosponsors.end());
        authors.insert(doc.primary_sponsor);
        for (const auto& author : authors) {
            auto& acc = accumulators[author];
            acc.weighted_sum += scored.coverage * scored.score;
            acc.coverage_sum += scored.coverage;
        }
    }

    std::map<std::string, SubScore> scores;
    for (const auto& [member_id, acc] : accumulators) {
        SubScore sub;
        if (acc.coverage_sum > 0.0) {
            sub.value = util::clamp_unit(acc.weighted_sum / acc.coverage_sum);
            sub.confidence = util::clamp_confidence(acc.coverage_sum / config_.text_full_coverage);
        }
        scores[member_id] = sub;
    }

    spdlog::debug("Text scores computed for {} members from {} documents", scores.size(), count);
    return scores;
}
