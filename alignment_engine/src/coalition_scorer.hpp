#pragma once

#include "coalition_graph.hpp"
#include "config.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <vector>

struct CoalitionScoreResult {
    std::map<std::string, SubScore> scores;
    int iterations = 0;
    bool converged = false;
    // Largest per-member change observed in each iteration
    std::vector<double> max_change_history;
};

class CoalitionScorer {
public:
    explicit CoalitionScorer(const Config& config);

    // Propagates anchor positions over the graph. Anchors are clamped;
    // every other member converges to the weighted mean of its neighbors.
    // Members with no path to an anchor score 0 with confidence 0.
    CoalitionScoreResult score(const CoalitionGraph& graph,
                               const std::map<std::string, double>& anchors) const;

private:
    std::vector<bool> reachable_from(const CoalitionGraph& graph, const std::vector<bool>& is_anchor) const;

    const Config& config_;
};
