#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PartySummary {
    std::string party;
    std::string axis;
    int member_count = 0;
    int scored_member_count = 0;    // confidence > 0
    double mean_score = 0.0;        // confidence-weighted
    double mean_confidence = 0.0;

    nlohmann::json to_json() const;
};

// Ordered by (party, axis). Members without a party are grouped under
// "independent"; scores for unknown members are ignored.
std::vector<PartySummary> summarize_by_party(const std::vector<AlignmentScore>& scores,
                                             const std::vector<Member>& members);

// Scores of the requested members on one axis, highest value first
// (ties by member id). Members without a score are omitted.
std::vector<AlignmentScore> compare_members(const std::vector<AlignmentScore>& scores,
                                            const std::vector<std::string>& member_ids,
                                            const std::string& axis);
