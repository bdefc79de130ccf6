#include "score_aggregator.hpp"
#include "util.hpp"
#include <cmath>

namespace {

// Non-finite sub-scores carry no evidence
SubScore sanitize(const SubScore& s) {
    if (!std::isfinite(s.value) || !std::isfinite(s.confidence)) {
        return SubScore{};
    }
    return SubScore{util::clamp_unit(s.value), util::clamp_confidence(s.confidence)};
}

} // namespace

ScoreAggregator::ScoreAggregator(const Config& config) : config_(config) {}

AlignmentScore ScoreAggregator::aggregate(const std::string& member_id,
                                          const std::string& axis,
                                          const TimeWindow& window,
                                          const SignalSet& signals,
                                          const TimePoint& computed_at) const {
    AxisConfig axis_config = config_.axis_config(axis);
    const SignalWeights& w = axis_config.weights;

    AlignmentScore result;
    result.member_id = member_id;
    result.axis = axis;
    result.window = window;
    result.computed_at = computed_at;
    result.text = sanitize(signals.text);
    result.coalition = sanitize(signals.coalition);
    result.vote = sanitize(signals.vote);

    const double weights[3] = {w.text, w.coalition, w.vote};
    const SubScore* parts[3] = {&result.text, &result.coalition, &result.vote};

    double multiplier_sum = 0.0;
    double weighted_value = 0.0;
    double weight_sum = 0.0;
    double weighted_confidence = 0.0;
    for (int k = 0; k < 3; ++k) {
        double multiplier = weights[k] * parts[k]->confidence;
        multiplier_sum += multiplier;
        weighted_value += multiplier * parts[k]->value;
        weight_sum += weights[k];
        weighted_confidence += multiplier;
    }

    if (multiplier_sum > 0.0) {
        result.value = util::clamp_unit(weighted_value / multiplier_sum);
        result.confidence = util::clamp_confidence(util::safe_divide(weighted_confidence, weight_sum));
    }

    result.label = label_for(axis_config, result.value, result.confidence);
    return result;
}

std::string ScoreAggregator::label_for(const AxisConfig& axis, double value, double confidence) const {
    if (confidence <= 0.0) {
        return "insufficient data";
    }
    if (value > config_.ideology_threshold) {
        return axis.positive_label;
    }
    if (value < -config_.ideology_threshold) {
        return axis.negative_label;
    }
    return axis.neutral_label;
}
