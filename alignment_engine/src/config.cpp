#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fstream>

namespace {

SignalWeights parse_weights(const nlohmann::json& j, const SignalWeights& defaults) {
    SignalWeights weights = defaults;
    weights.text = j.value("text", weights.text);
    weights.coalition = j.value("coalition", weights.coalition);
    weights.vote = j.value("vote", weights.vote);
    return weights;
}

void check_weights(const std::string& where, const SignalWeights& w) {
    for (double value : {w.text, w.coalition, w.vote}) {
        if (!std::isfinite(value) || value < 0.0) {
            throw ValidationError(where + ": signal weights must be finite and non-negative");
        }
    }
    if (w.text + w.coalition + w.vote <= 0.0) {
        throw ValidationError(where + ": at least one signal weight must be positive");
    }
}

} // namespace

void Config::load_from_env() {
    service_name = util::get_env_var("SERVICE_NAME", service_name);
    log_level = util::get_env_var("LOG_LEVEL", log_level);
    worker_threads = util::get_env_int("WORKER_THREADS", worker_threads);

    lexicon_path = util::get_env_var("LEXICON_PATH", lexicon_path);
    axes_path = util::get_env_var("AXES_PATH", axes_path);
    pg_dsn = util::get_env_var("PG_DSN", pg_dsn);

    vote_edge_weight = util::get_env_double("VOTE_EDGE_WEIGHT", vote_edge_weight);

    propagation_tolerance = util::get_env_double("PROPAGATION_TOLERANCE", propagation_tolerance);
    propagation_max_iterations = util::get_env_int("PROPAGATION_MAX_ITERATIONS", propagation_max_iterations);
    propagation_step = util::get_env_double("PROPAGATION_STEP", propagation_step);
    nonconverged_confidence_factor = util::get_env_double("NONCONVERGED_CONFIDENCE_FACTOR", nonconverged_confidence_factor);
    coalition_confidence_half_weight = util::get_env_double("COALITION_CONFIDENCE_HALF_WEIGHT", coalition_confidence_half_weight);

    min_vote_count = util::get_env_int("MIN_VOTE_COUNT", min_vote_count);
    vote_full_confidence_count = util::get_env_int("VOTE_FULL_CONFIDENCE_COUNT", vote_full_confidence_count);

    text_full_coverage = util::get_env_double("TEXT_FULL_COVERAGE", text_full_coverage);

    ideology_threshold = util::get_env_double("IDEOLOGY_THRESHOLD", ideology_threshold);
}

void Config::load_axes_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ValidationError("cannot open axes configuration " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("axes configuration " + path + " is not valid JSON: " + e.what());
    }
    apply_axes_json(j);
    spdlog::info("Loaded configuration for {} axes from {}", axes.size(), path);
}

// {"default_weights": {...}, "axes": {"economic": {"anchors": {...},
//  "pole_a": [...], "pole_b": [...] | "complement", "weights": {...},
//  "labels": {"positive": ..., "neutral": ..., "negative": ...}}}}
void Config::apply_axes_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("axes configuration must be a JSON object");
    }

    try {
        if (j.contains("default_weights")) {
            default_weights = parse_weights(j.at("default_weights"), default_weights);
        }

        std::map<std::string, AxisConfig> parsed;
        if (j.contains("axes")) {
            for (const auto& [name, entry] : j.at("axes").items()) {
                AxisConfig axis;
                axis.weights = default_weights;

                if (entry.contains("anchors")) {
                    for (const auto& [member_id, position] : entry.at("anchors").items()) {
                        double p = position.get<double>();
                        if (!std::isfinite(p) || p < -1.0 || p > 1.0) {
                            throw ValidationError("axis " + name + ": anchor " + member_id +
                                                  " position outside [-1, 1]");
                        }
                        axis.anchors[member_id] = p;
                    }
                }
                axis.pole_a = entry.value("pole_a", std::vector<std::string>{});
                if (entry.contains("pole_b")) {
                    const auto& pole_b = entry.at("pole_b");
                    if (pole_b.is_string() && pole_b.get<std::string>() == "complement") {
                        axis.pole_b_is_complement = true;
                    } else {
                        axis.pole_b = pole_b.get<std::vector<std::string>>();
                    }
                }
                if (entry.contains("weights")) {
                    axis.weights = parse_weights(entry.at("weights"), default_weights);
                }
                if (entry.contains("labels")) {
                    const auto& labels = entry.at("labels");
                    axis.positive_label = labels.value("positive", axis.positive_label);
                    axis.neutral_label = labels.value("neutral", axis.neutral_label);
                    axis.negative_label = labels.value("negative", axis.negative_label);
                }
                parsed[name] = axis;
            }
        }
        axes = std::move(parsed);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("malformed axes configuration: ") + e.what());
    }
}

void Config::validate() const {
    if (!std::isfinite(vote_edge_weight) || vote_edge_weight < 0.0) {
        throw ValidationError("vote_edge_weight must be non-negative");
    }
    if (!(propagation_tolerance > 0.0)) {
        throw ValidationError("propagation_tolerance must be positive");
    }
    if (propagation_max_iterations < 1) {
        throw ValidationError("propagation_max_iterations must be at least 1");
    }
    if (!(propagation_step > 0.0 && propagation_step <= 1.0)) {
        throw ValidationError("propagation_step must be within (0, 1]");
    }
    if (!(nonconverged_confidence_factor >= 0.0 && nonconverged_confidence_factor <= 1.0)) {
        throw ValidationError("nonconverged_confidence_factor must be within [0, 1]");
    }
    if (!(coalition_confidence_half_weight > 0.0)) {
        throw ValidationError("coalition_confidence_half_weight must be positive");
    }
    if (min_vote_count < 0) {
        throw ValidationError("min_vote_count must be non-negative");
    }
    if (vote_full_confidence_count < 1) {
        throw ValidationError("vote_full_confidence_count must be at least 1");
    }
    if (!(text_full_coverage > 0.0)) {
        throw ValidationError("text_full_coverage must be positive");
    }
    if (!(ideology_threshold > 0.0 && ideology_threshold < 1.0)) {
        throw ValidationError("ideology_threshold must be within (0, 1)");
    }

    check_weights("default_weights", default_weights);
    for (const auto& [name, axis] : axes) {
        check_weights("axis " + name, axis.weights);
        for (const auto& member_id : axis.pole_a) {
            if (std::find(axis.pole_b.begin(), axis.pole_b.end(), member_id) != axis.pole_b.end()) {
                throw ValidationError("axis " + name + ": member " + member_id + " is in both poles");
            }
        }
    }
}

AxisConfig Config::axis_config(const std::string& axis) const {
    auto it = axes.find(axis);
    if (it != axes.end()) {
        return it->second;
    }
    AxisConfig defaults;
    defaults.weights = default_weights;
    return defaults;
}
