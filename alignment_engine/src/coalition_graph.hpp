#pragma once

#include "config.hpp"
#include "types.hpp"
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct CoalitionEdge {
    std::string member_a;   // member_a < member_b
    std::string member_b;
    double weight = 0.0;
    int cosponsorships = 0;
    int matching_votes = 0;
};

// Undirected weighted graph over an arena of members indexed 0..size()-1 in
// member id order. Each unordered pair is stored once; only edges with
// positive weight exist.
class CoalitionGraph {
public:
    struct Neighbor {
        std::size_t index;
        double weight;
    };

    CoalitionGraph() = default;

    std::size_t size() const { return members_.size(); }
    std::size_t edge_count() const { return edges_.size(); }

    std::optional<std::size_t> index_of(const std::string& member_id) const;
    const std::string& member_at(std::size_t index) const { return members_.at(index); }
    const std::vector<std::string>& members() const { return members_; }

    // Sorted by neighbor index
    const std::vector<Neighbor>& neighbors(std::size_t index) const { return adjacency_.at(index); }

    double weight(const std::string& a, const std::string& b) const;
    double weighted_degree(std::size_t index) const;

    // Sorted by (member_a, member_b)
    const std::vector<CoalitionEdge>& edges() const { return edges_; }

private:
    friend class CoalitionGraphBuilder;

    std::vector<std::string> members_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::vector<Neighbor>> adjacency_;
    std::vector<CoalitionEdge> edges_;
};

// Accumulates co-sponsorship and co-voting evidence for one window. The add_*
// methods may be called concurrently: each unordered pair lives in exactly
// one lock-protected shard, and evidence is kept as integer counts so the
// final weights do not depend on the order of accumulation.
class CoalitionGraphBuilder {
public:
    // members: ids of the members active in the window. Evidence naming any
    // other member is ignored.
    CoalitionGraphBuilder(const Config& config, const TimeWindow& window,
                          const std::vector<std::string>& members);

    // Adds 1 to (primary sponsor, co-sponsor) for each distinct co-sponsor.
    // Returns false if the document lies outside the window.
    bool add_document(const Document& document);

    // Adds one matching vote for every pair casting the same yea/nay value.
    // Returns false if the roll call lies outside the window.
    bool add_vote(const Vote& vote);

    void add_cosponsorship(const std::string& a, const std::string& b);
    void add_matching_vote(const std::string& a, const std::string& b);

    CoalitionGraph build() const;

private:
    struct PairCounts {
        int cosponsorships = 0;
        int matching_votes = 0;
    };

    struct Shard {
        std::mutex mutex;
        std::unordered_map<std::uint64_t, PairCounts> pairs;
    };

    static constexpr std::size_t kShardCount = 16;

    std::optional<std::uint64_t> pair_key(const std::string& a, const std::string& b) const;
    Shard& shard_for(std::uint64_t key);
    void add_votes_within(const std::vector<std::size_t>& group);

    const Config& config_;
    TimeWindow window_;
    std::vector<std::string> members_;
    std::unordered_map<std::string, std::size_t> index_;
    mutable std::array<Shard, kShardCount> shards_;
};
