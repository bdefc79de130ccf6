#include "party_summary.hpp"
#include "util.hpp"
#include <algorithm>
#include <map>
#include <set>

nlohmann::json PartySummary::to_json() const {
    return {
        {"party", party},
        {"axis", axis},
        {"member_count", member_count},
        {"scored_member_count", scored_member_count},
        {"mean_score", mean_score},
        {"mean_confidence", mean_confidence}
    };
}

std::vector<PartySummary> summarize_by_party(const std::vector<AlignmentScore>& scores,
                                             const std::vector<Member>& members) {
    std::map<std::string, std::string> party_of;
    for (const auto& member : members) {
        party_of[member.id] = member.party.value_or("independent");
    }

    struct Accumulator {
        int members = 0;
        int scored = 0;
        double weighted_value = 0.0;
        double confidence_sum = 0.0;
    };
    std::map<std::pair<std::string, std::string>, Accumulator> groups;

    for (const auto& score : scores) {
        auto it = party_of.find(score.member_id);
        if (it == party_of.end()) {
            continue;
        }
        auto& acc = groups[{it->second, score.axis}];
        ++acc.members;
        if (score.confidence > 0.0) {
            ++acc.scored;
        }
        acc.weighted_value += score.confidence * score.value;
        acc.confidence_sum += score.confidence;
    }

    std::vector<PartySummary> summaries;
    for (const auto& [key, acc] : groups) {
        PartySummary summary;
        summary.party = key.first;
        summary.axis = key.second;
        summary.member_count = acc.members;
        summary.scored_member_count = acc.scored;
        summary.mean_score = util::clamp_unit(util::safe_divide(acc.weighted_value, acc.confidence_sum));
        summary.mean_confidence = util::safe_divide(acc.confidence_sum, acc.members);
        summaries.push_back(summary);
    }
    return summaries;
}

std::vector<AlignmentScore> compare_members(const std::vector<AlignmentScore>& scores,
                                            const std::vector<std::string>& member_ids,
                                            const std::string& axis) {
    std::set<std::string> wanted(member_ids.begin(), member_ids.end());
    std::vector<AlignmentScore> selected;
    for (const auto& score : scores) {
        if (score.axis == axis && wanted.count(score.member_id)) {
            selected.push_back(score);
        }
    }
    std::sort(selected.begin(), selected.end(), [](const AlignmentScore& a, const AlignmentScore& b) {
        if (a.value != b.value) {
            return a.value > b.value;
        }
        return a.member_id < b.member_id;
    });
    return selected;
}
