#include "coalition_scorer.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <cmath>
#include <queue>

CoalitionScorer::CoalitionScorer(const Config& config) : config_(config) {}

std::vector<bool> CoalitionScorer::reachable_from(const CoalitionGraph& graph,
                                                  const std::vector<bool>& is_anchor) const {
    std::vector<bool> reached(graph.size(), false);
    std::queue<std::size_t> frontier;
    for (std::size_t i = 0; i < graph.size(); ++i) {
        if (is_anchor[i]) {
            reached[i] = true;
            frontier.push(i);
        }
    }
    while (!frontier.empty()) {
        std::size_t current = frontier.front();
        frontier.pop();
        for (const auto& n : graph.neighbors(current)) {
            if (!reached[n.index]) {
                reached[n.index] = true;
                frontier.push(n.index);
            }
        }
    }
    return reached;
}

CoalitionScoreResult CoalitionScorer::score(const CoalitionGraph& graph,
                                            const std::map<std::string, double>& anchors) const {
    CoalitionScoreResult result;
    const std::size_t n = graph.size();

    std::vector<double> estimate(n, 0.0);
    std::vector<bool> is_anchor(n, false);
    std::size_t anchor_count = 0;

    for (const auto& [member_id, position] : anchors) {
        auto index = graph.index_of(member_id);
        if (!index) {
            spdlog::debug("Anchor {} is not part of the coalition graph", member_id);
            continue;
        }
        is_anchor[*index] = true;
        estimate[*index] = util::clamp_unit(position);
        ++anchor_count;
    }

    if (anchor_count == 0) {
        for (const auto& member_id : graph.members()) {
            result.scores[member_id] = SubScore{};
        }
        result.converged = true;
        return result;
    }

    std::vector<bool> reachable = reachable_from(graph, is_anchor);

    // Damped synchronous update: each iteration reads only the previous
    // estimates, so the members of one iteration are independent.
    std::vector<double> next = estimate;
    std::vector<double> change(n, 0.0);
    for (int iter = 0; iter < config_.propagation_max_iterations; ++iter) {
        util::parallel_for(n, config_.worker_threads, [&](std::size_t i) {
            change[i] = 0.0;
            if (is_anchor[i] || !reachable[i]) {
                next[i] = estimate[i];
                return;
            }
            double weighted = 0.0;
            double total = 0.0;
            for (const auto& neighbor : graph.neighbors(i)) {
                weighted += neighbor.weight * estimate[neighbor.index];
                total += neighbor.weight;
            }
            if (total > 0.0) {
                double average = weighted / total;
                next[i] = util::clamp_unit(estimate[i] + config_.propagation_step * (average - estimate[i]));
            } else {
                next[i] = estimate[i];
            }
            change[i] = std::fabs(next[i] - estimate[i]);
        });

        double max_change = 0.0;
        for (double c : change) {
            max_change = std::max(max_change, c);
        }
        estimate.swap(next);
        result.iterations = iter + 1;
        result.max_change_history.push_back(max_change);
        spdlog::debug("Propagation iteration {}: max change {:.6f}", result.iterations, max_change);

        if (max_change < config_.propagation_tolerance) {
            result.converged = true;
            break;
        }
    }

    if (!result.converged) {
        spdlog::warn("Coalition propagation did not converge within {} iterations (last max change {:.6f})",
                     config_.propagation_max_iterations,
                     result.max_change_history.empty() ? 0.0 : result.max_change_history.back());
    }

    for (std::size_t i = 0; i < n; ++i) {
        SubScore sub;
        if (is_anchor[i]) {
            sub.value = estimate[i];
            sub.confidence = 1.0;
        } else if (reachable[i]) {
            double degree = graph.weighted_degree(i);
            sub.value = util::clamp_unit(estimate[i]);
            sub.confidence = util::clamp_confidence(
                degree / (degree + config_.coalition_confidence_half_weight));
            if (!result.converged) {
                sub.confidence *= config_.nonconverged_confidence_factor;
            }
        }
        result.scores[graph.member_at(i)] = sub;
    }

    return result;
}
