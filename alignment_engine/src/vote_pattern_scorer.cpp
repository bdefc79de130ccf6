#include "vote_pattern_scorer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <optional>

namespace {

struct PoleTally {
    int yea = 0;
    int nay = 0;
};

PoleTally tally(const Vote& vote, const std::set<std::string>& pole) {
    PoleTally t;
    for (const auto& member_id : pole) {
        auto it = vote.positions.find(member_id);
        if (it == vote.positions.end()) {
            continue;
        }
        if (it->second == VoteValue::Yea) {
            ++t.yea;
        } else if (it->second == VoteValue::Nay) {
            ++t.nay;
        }
    }
    return t;
}

// Majority position of a pole with the scored member's own vote removed
std::optional<VoteValue> pole_position(PoleTally t, bool member_in_pole, VoteValue member_vote) {
    if (member_in_pole) {
        if (member_vote == VoteValue::Yea) {
            --t.yea;
        } else {
            --t.nay;
        }
    }
    if (t.yea > t.nay) return VoteValue::Yea;
    if (t.nay > t.yea) return VoteValue::Nay;
    return std::nullopt;
}

} // namespace

ReferenceBloc ReferenceBloc::with_complement(const std::set<std::string>& pole_a,
                                             const std::vector<std::string>& members) {
    ReferenceBloc bloc;
    bloc.pole_a = pole_a;
    for (const auto& member_id : members) {
        if (!pole_a.count(member_id)) {
            bloc.pole_b.insert(member_id);
        }
    }
    return bloc;
}

VotePatternScorer::VotePatternScorer(const Config& config) : config_(config) {}

std::map<std::string, VotePattern> VotePatternScorer::score(const std::vector<Vote>& votes,
                                                            const ReferenceBloc& bloc,
                                                            const std::vector<std::string>& members) const {
    std::map<std::string, VotePattern> patterns;
    for (const auto& member_id : members) {
        patterns[member_id] = VotePattern{};
    }

    for (const auto& vote : votes) {
        PoleTally tally_a = tally(vote, bloc.pole_a);
        PoleTally tally_b = tally(vote, bloc.pole_b);

        for (auto& [member_id, pattern] : patterns) {
            auto it = vote.positions.find(member_id);
            if (it == vote.positions.end()) {
                continue;
            }
            VoteValue cast = it->second;
            if (cast != VoteValue::Yea && cast != VoteValue::Nay) {
                continue;
            }
            ++pattern.votes_cast;

            auto position_a = pole_position(tally_a, bloc.pole_a.count(member_id) > 0, cast);
            if (position_a) {
                ++pattern.comparable_a;
                if (*position_a == cast) {
                    ++pattern.agreements_a;
                }
            }
            auto position_b = pole_position(tally_b, bloc.pole_b.count(member_id) > 0, cast);
            if (position_b) {
                ++pattern.comparable_b;
                if (*position_b == cast) {
                    ++pattern.agreements_b;
                }
            }
        }
    }

    for (auto& [member_id, pattern] : patterns) {
        double rate_a = util::safe_divide(pattern.agreements_a, pattern.comparable_a);
        double rate_b = util::safe_divide(pattern.agreements_b, pattern.comparable_b);
        pattern.score.value = util::clamp_unit(rate_a - rate_b);

        bool comparable = pattern.comparable_a + pattern.comparable_b > 0;
        if (pattern.votes_cast < config_.min_vote_count || !comparable) {
            // Value is still reported; the aggregator drops it via confidence
            pattern.score.confidence = 0.0;
        } else {
            pattern.score.confidence = util::clamp_confidence(
                static_cast<double>(pattern.votes_cast) / config_.vote_full_confidence_count);
        }
    }

    spdlog::debug("Vote patterns computed for {} members over {} roll calls", patterns.size(), votes.size());
    return patterns;
}
