#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// Weighted terms for one axis. Terms are stored in normalized form
// (lowercase tokens joined by single spaces); multi-token terms are n-grams.
class AxisLexicon {
public:
    AxisLexicon(std::string name, std::unordered_map<std::string, double> terms);

    const std::string& name() const { return name_; }
    std::optional<double> lookup(const std::string& term) const;
    std::size_t size() const { return terms_.size(); }
    std::size_t max_ngram() const { return max_ngram_; }

private:
    std::string name_;
    std::unordered_map<std::string, double> terms_;
    std::size_t max_ngram_ = 0;
};

// Immutable, versioned set of axis lexicons. Every term is validated before
// a store is created, so a failed load leaves no partially queryable store.
class LexiconStore {
public:
    using TermList = std::vector<std::pair<std::string, double>>;

    // Throw ValidationError on a weight outside [-1, 1], a duplicate term
    // (after normalization), an empty term or an empty axis name.
    static std::shared_ptr<const LexiconStore> from_terms(
        const std::string& version,
        const std::map<std::string, TermList>& axes);

    // {"version": "...", "axes": {axis: {term: weight} | [{"term": t, "weight": w}]}}
    static std::shared_ptr<const LexiconStore> from_json(const nlohmann::json& j);

    // Parse lexicon text; a key repeated inside any JSON object is rejected
    // instead of keeping its last value.
    static std::shared_ptr<const LexiconStore> from_text(const std::string& text,
                                                         const std::string& source = "lexicon");
    static std::shared_ptr<const LexiconStore> load_file(const std::string& path);

    std::optional<double> lookup(const std::string& axis, const std::string& term) const;
    const AxisLexicon* axis(const std::string& name) const;
    std::vector<std::string> axes() const;
    const std::string& version() const { return version_; }

    LexiconStore(const LexiconStore&) = delete;
    LexiconStore& operator=(const LexiconStore&) = delete;

private:
    LexiconStore(std::string version, std::map<std::string, AxisLexicon> axes);

    std::string version_;
    std::map<std::string, AxisLexicon> axes_;
};
