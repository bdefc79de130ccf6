#include "coalition_graph.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <set>

std::optional<std::size_t> CoalitionGraph::index_of(const std::string& member_id) const {
    auto it = index_.find(member_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double CoalitionGraph::weight(const std::string& a, const std::string& b) const {
    auto ia = index_of(a);
    auto ib = index_of(b);
    if (!ia || !ib || *ia == *ib) {
        return 0.0;
    }
    const auto& list = adjacency_[*ia];
    auto it = std::lower_bound(list.begin(), list.end(), *ib,
                               [](const Neighbor& n, std::size_t idx) { return n.index < idx; });
    if (it == list.end() || it->index != *ib) {
        return 0.0;
    }
    return it->weight;
}

double CoalitionGraph::weighted_degree(std::size_t index) const {
    double total = 0.0;
    for (const auto& n : adjacency_.at(index)) {
        total += n.weight;
    }
    return total;
}

CoalitionGraphBuilder::CoalitionGraphBuilder(const Config& config, const TimeWindow& window,
                                             const std::vector<std::string>& members)
    : config_(config), window_(window) {
    std::set<std::string> unique(members.begin(), members.end());
    members_.assign(unique.begin(), unique.end());
    for (std::size_t i = 0; i < members_.size(); ++i) {
        index_[members_[i]] = i;
    }
}

std::optional<std::uint64_t> CoalitionGraphBuilder::pair_key(const std::string& a, const std::string& b) const {
    auto ia = index_.find(a);
    auto ib = index_.find(b);
    if (ia == index_.end() || ib == index_.end() || ia->second == ib->second) {
        return std::nullopt;
    }
    std::uint64_t lo = std::min(ia->second, ib->second);
    std::uint64_t hi = std::max(ia->second, ib->second);
    return (lo << 32) | hi;
}

CoalitionGraphBuilder::Shard& CoalitionGraphBuilder::shard_for(std::uint64_t key) {
    return shards_[(key ^ (key >> 32)) % kShardCount];
}

void CoalitionGraphBuilder::add_cosponsorship(const std::string& a, const std::string& b) {
    auto key = pair_key(a, b);
    if (!key) {
        return;
    }
    auto& shard = shard_for(*key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.pairs[*key].cosponsorships += 1;
}

void CoalitionGraphBuilder::add_matching_vote(const std::string& a, const std::string& b) {
    auto key = pair_key(a, b);
    if (!key) {
        return;
    }
    auto& shard = shard_for(*key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.pairs[*key].matching_votes += 1;
}

bool CoalitionGraphBuilder::add_document(const Document& document) {
    if (!window_.contains(document.timestamp)) {
        return false;
    }
    std::set<std::string> cosponsors(document.cosponsors.begin(), document.cosponsors.end());
    for (const auto& cosponsor : cosponsors) {
        add_cosponsorship(document.primary_sponsor, cosponsor);
    }
    return true;
}

void CoalitionGraphBuilder::add_votes_within(const std::vector<std::size_t>& group) {
    for (std::size_t x = 0; x < group.size(); ++x) {
        for (std::size_t y = x + 1; y < group.size(); ++y) {
            std::uint64_t key = (static_cast<std::uint64_t>(group[x]) << 32) | group[y];
            auto& shard = shard_for(key);
            std::lock_guard<std::mutex> lock(shard.mutex);
            shard.pairs[key].matching_votes += 1;
        }
    }
}

bool CoalitionGraphBuilder::add_vote(const Vote& vote) {
    if (!window_.contains(vote.timestamp)) {
        return false;
    }

    // positions is ordered by member id and so is the arena, so each group
    // comes out sorted by index
    std::vector<std::size_t> yeas;
    std::vector<std::size_t> nays;
    for (const auto& [member_id, value] : vote.positions) {
        auto it = index_.find(member_id);
        if (it == index_.end()) {
            continue;
        }
        if (value == VoteValue::Yea) {
            yeas.push_back(it->second);
        } else if (value == VoteValue::Nay) {
            nays.push_back(it->second);
        }
    }

    add_votes_within(yeas);
    add_votes_within(nays);
    return true;
}

CoalitionGraph CoalitionGraphBuilder::build() const {
    std::map<std::uint64_t, PairCounts> merged;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& entry : shard.pairs) {
            merged[entry.first] = entry.second;
        }
    }

    CoalitionGraph graph;
    graph.members_ = members_;
    graph.index_ = index_;
    graph.adjacency_.resize(members_.size());

    for (const auto& [key, counts] : merged) {
        double weight = counts.cosponsorships + config_.vote_edge_weight * counts.matching_votes;
        if (!(weight > 0.0)) {
            continue;
        }
        std::size_t lo = static_cast<std::size_t>(key >> 32);
        std::size_t hi = static_cast<std::size_t>(key & 0xffffffffULL);

        CoalitionEdge edge;
        edge.member_a = members_[lo];
        edge.member_b = members_[hi];
        edge.weight = weight;
        edge.cosponsorships = counts.cosponsorships;
        edge.matching_votes = counts.matching_votes;
        graph.edges_.push_back(edge);

        graph.adjacency_[lo].push_back({hi, weight});
        graph.adjacency_[hi].push_back({lo, weight});
    }

    // Keys are visited in (lo, hi) order, so adjacency lists are already
    // sorted by neighbor index and edges by (member_a, member_b).
    spdlog::debug("Coalition graph built: {} members, {} edges", graph.size(), graph.edge_count());
    return graph;
}
