#include "lexicon_store.hpp"
#include "errors.hpp"
#include "tokenizer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <set>

AxisLexicon::AxisLexicon(std::string name, std::unordered_map<std::string, double> terms)
    : name_(std::move(name)), terms_(std::move(terms)) {
    for (const auto& entry : terms_) {
        std::size_t n = static_cast<std::size_t>(std::count(entry.first.begin(), entry.first.end(), ' ')) + 1;
        max_ngram_ = std::max(max_ngram_, n);
    }
}

std::optional<double> AxisLexicon::lookup(const std::string& term) const {
    auto it = terms_.find(term);
    if (it == terms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

LexiconStore::LexiconStore(std::string version, std::map<std::string, AxisLexicon> axes)
    : version_(std::move(version)), axes_(std::move(axes)) {}

std::shared_ptr<const LexiconStore> LexiconStore::from_terms(
    const std::string& version,
    const std::map<std::string, TermList>& axes) {

    std::map<std::string, AxisLexicon> validated;

    for (const auto& [axis_name, terms] : axes) {
        if (axis_name.empty()) {
            throw ValidationError("lexicon " + version + ": empty axis name");
        }

        std::unordered_map<std::string, double> normalized;
        for (const auto& [raw_term, weight] : terms) {
            if (!std::isfinite(weight) || weight < -1.0 || weight > 1.0) {
                throw ValidationError("lexicon " + version + ", axis " + axis_name + ": weight " +
                                      std::to_string(weight) + " for term '" + raw_term +
                                      "' is outside [-1, 1]");
            }
            std::string term = Tokenizer::normalize(raw_term);
            if (term.empty()) {
                throw ValidationError("lexicon " + version + ", axis " + axis_name + ": term '" +
                                      raw_term + "' has no word characters");
            }
            if (!normalized.emplace(term, weight).second) {
                throw ValidationError("lexicon " + version + ", axis " + axis_name +
                                      ": duplicate term '" + term + "'");
            }
        }
        validated.emplace(axis_name, AxisLexicon(axis_name, std::move(normalized)));
    }

    spdlog::info("Lexicon {} loaded with {} axes", version, validated.size());
    return std::shared_ptr<const LexiconStore>(new LexiconStore(version, std::move(validated)));
}

std::shared_ptr<const LexiconStore> LexiconStore::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("axes") || !j.at("axes").is_object()) {
        throw ValidationError("lexicon must be an object with an 'axes' object");
    }

    std::string version = j.value("version", "unversioned");
    std::map<std::string, TermList> axes;

    try {
        for (const auto& [axis_name, entries] : j.at("axes").items()) {
            TermList terms;
            if (entries.is_object()) {
                for (const auto& [term, weight] : entries.items()) {
                    terms.emplace_back(term, weight.get<double>());
                }
            } else if (entries.is_array()) {
                for (const auto& entry : entries) {
                    terms.emplace_back(entry.at("term").get<std::string>(), entry.at("weight").get<double>());
                }
            } else {
                throw ValidationError("axis " + axis_name + " must be an object or an array of terms");
            }
            axes[axis_name] = std::move(terms);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("malformed lexicon " + version + ": " + e.what());
    }

    return from_terms(version, axes);
}

std::shared_ptr<const LexiconStore> LexiconStore::from_text(const std::string& text, const std::string& source) {
    // One key set per open object, innermost last
    std::vector<std::set<std::string>> open_objects;
    auto reject_duplicate_keys = [&](int /*depth*/, nlohmann::json::parse_event_t event, nlohmann::json& parsed) {
        switch (event) {
            case nlohmann::json::parse_event_t::object_start:
                open_objects.emplace_back();
                break;
            case nlohmann::json::parse_event_t::object_end:
                if (!open_objects.empty()) {
                    open_objects.pop_back();
                }
                break;
            case nlohmann::json::parse_event_t::key:
                if (!open_objects.empty() && !open_objects.back().insert(parsed.get<std::string>()).second) {
                    throw ValidationError(source + " repeats key '" + parsed.get<std::string>() + "'");
                }
                break;
            default:
                break;
        }
        return true;
    };

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text, reject_duplicate_keys);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(source + " is not valid JSON: " + e.what());
    }
    return from_json(j);
}

std::shared_ptr<const LexiconStore> LexiconStore::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ValidationError("cannot open lexicon " + path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return from_text(text, "lexicon " + path);
}

std::optional<double> LexiconStore::lookup(const std::string& axis_name, const std::string& term) const {
    const AxisLexicon* lexicon = axis(axis_name);
    if (!lexicon) {
        return std::nullopt;
    }
    return lexicon->lookup(term);
}

const AxisLexicon* LexiconStore::axis(const std::string& name) const {
    auto it = axes_.find(name);
    return it == axes_.end() ? nullptr : &it->second;
}

std::vector<std::string> LexiconStore::axes() const {
    std::vector<std::string> names;
    names.reserve(axes_.size());
    for (const auto& entry : axes_) {
        names.push_back(entry.first);
    }
    return names;
}
