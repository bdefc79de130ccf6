#pragma once

#include "config.hpp"
#include "types.hpp"
#include <string>

struct SignalSet {
    SubScore text;
    SubScore coalition;
    SubScore vote;
};

class ScoreAggregator {
public:
    explicit ScoreAggregator(const Config& config);

    // Weighted mean of the three sub-scores with multiplier
    // weight * confidence, renormalized per member. Signals with zero
    // confidence drop out; if all do, the result is 0 with confidence 0.
    AlignmentScore aggregate(const std::string& member_id,
                             const std::string& axis,
                             const TimeWindow& window,
                             const SignalSet& signals,
                             const TimePoint& computed_at) const;

    std::string label_for(const AxisConfig& axis, double value, double confidence) const;

private:
    const Config& config_;
};
