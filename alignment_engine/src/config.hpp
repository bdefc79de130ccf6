#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct SignalWeights {
    double text = 1.0 / 3.0;
    double coalition = 1.0 / 3.0;
    double vote = 1.0 / 3.0;
};

struct AxisConfig {
    // Coalition scorer anchors: member id -> reference position
    std::map<std::string, double> anchors;

    // Vote pattern scorer poles
    std::vector<std::string> pole_a;
    std::vector<std::string> pole_b;
    bool pole_b_is_complement = false;

    SignalWeights weights;

    // Ideology labels
    std::string positive_label = "liberal";
    std::string neutral_label = "moderate";
    std::string negative_label = "conservative";
};

struct Config {
    // Service configuration
    std::string service_name = "alignment_engine";
    std::string log_level = "info";
    int worker_threads = 4;

    // Inputs and persistence
    std::string lexicon_path = "lexicon.json";
    std::string axes_path = "axes.json";
    std::string pg_dsn;

    // Coalition graph
    double vote_edge_weight = 1.0;

    // Coalition scorer
    double propagation_tolerance = 1e-4;
    int propagation_max_iterations = 100;
    // Share of the neighbor average taken per iteration; the rest is the
    // member's previous estimate. Below 1 it stops two-step oscillation.
    double propagation_step = 0.45;
    double nonconverged_confidence_factor = 0.5;
    double coalition_confidence_half_weight = 1.0;

    // Vote pattern scorer. A member needs at least min_vote_count yea/nay
    // votes in the window (count < min_vote_count fails the guard).
    int min_vote_count = 5;
    int vote_full_confidence_count = 20;

    // Text scorer: summed coverage at which text confidence saturates
    double text_full_coverage = 0.25;

    // Aggregation
    SignalWeights default_weights;
    double ideology_threshold = 0.3;
    std::map<std::string, AxisConfig> axes;

    // Load from environment variables
    void load_from_env();

    // Per-axis settings
    void load_axes_file(const std::string& path);
    void apply_axes_json(const nlohmann::json& j);

    // Throws ValidationError
    void validate() const;

    // Settings for an axis; axes without explicit config get defaults.
    AxisConfig axis_config(const std::string& axis) const;
};
