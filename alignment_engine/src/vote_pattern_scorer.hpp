#pragma once

#include "config.hpp"
#include "types.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

// Two disjoint member sets representing the poles of an axis
struct ReferenceBloc {
    std::set<std::string> pole_a;
    std::set<std::string> pole_b;

    // pole_b = all members not in pole_a
    static ReferenceBloc with_complement(const std::set<std::string>& pole_a,
                                         const std::vector<std::string>& members);
};

struct VotePattern {
    SubScore score;
    int votes_cast = 0;         // yea/nay only
    int comparable_a = 0;       // roll calls where pole A took a position
    int agreements_a = 0;
    int comparable_b = 0;
    int agreements_b = 0;
};

class VotePatternScorer {
public:
    explicit VotePatternScorer(const Config& config);

    // value = agreement rate with pole A - agreement rate with pole B.
    // A pole's position on a roll call is the majority of its members'
    // yea/nay votes, excluding the member being scored; ties take no
    // position. An undefined rate contributes 0.
    std::map<std::string, VotePattern> score(const std::vector<Vote>& votes,
                                             const ReferenceBloc& bloc,
                                             const std::vector<std::string>& members) const;

private:
    const Config& config_;
};
