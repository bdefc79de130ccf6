#pragma once

#include "config.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Append-only persistence of AlignmentScore versions. A rerun adds rows keyed
// by (member, axis, window, computed_at) and never overwrites earlier ones.
class PostgresStore {
public:
    explicit PostgresStore(const Config& config);
    ~PostgresStore();

    // Connects once on construction; a failed connection makes every call fail
    bool is_connected() const;

    bool initialize_schema();

    // Inserts one run's scores in a single transaction
    bool save_scores(const std::vector<AlignmentScore>& scores);

    // Every stored version for a member on an axis, oldest computation first;
    // nullopt when the query fails
    std::optional<std::vector<AlignmentScore>> get_score_history(const std::string& member_id, const std::string& axis);

    // Non-copyable
    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
