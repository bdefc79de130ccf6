#pragma once

#include "coalition_graph.hpp"
#include "coalition_scorer.hpp"
#include "config.hpp"
#include "lexicon_store.hpp"
#include "score_aggregator.hpp"
#include "text_scorer.hpp"
#include "types.hpp"
#include "vote_pattern_scorer.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct AxisRunStats {
    std::string axis;
    int propagation_iterations = 0;
    bool converged = false;
};

struct RunStats {
    int documents_in_window = 0;
    int votes_in_window = 0;
    int skipped_documents = 0;          // rejected by the engine checks
    int skipped_votes = 0;
    int undecodable_members = 0;        // dropped while decoding the batch
    int undecodable_documents = 0;
    int undecodable_votes = 0;
    std::size_t members_scored = 0;
    std::size_t graph_edges = 0;
    std::vector<AxisRunStats> axes;

    nlohmann::json to_json() const;
};

struct WindowResult {
    TimeWindow window;
    std::vector<AlignmentScore> scores;   // ordered by (axis, member id)
    RunStats stats;
};

// Runs all scorers for one window and merges their outputs. The lexicon is
// an immutable, versioned snapshot shared by every call.
class AlignmentEngine {
public:
    AlignmentEngine(const Config& config, std::shared_ptr<const LexiconStore> lexicon);

    // computed_at stamps the produced score version; it never affects values.
    WindowResult score_window(const RecordBatch& batch,
                              const TimeWindow& window,
                              const TimePoint& computed_at) const;

    // Lexicon axes plus configured axes, sorted
    std::vector<std::string> axes() const;

    const std::string& lexicon_version() const { return lexicon_->version(); }

private:
    bool check_document(const Document& document, std::string& reason) const;
    bool check_vote(const Vote& vote, std::string& reason) const;

    std::vector<std::string> active_members(const RecordBatch& batch,
                                            const TimeWindow& window,
                                            const std::vector<Document>& documents,
                                            const std::vector<Vote>& votes) const;

    CoalitionGraph build_graph(const TimeWindow& window,
                               const std::vector<std::string>& members,
                               const std::vector<Document>& documents,
                               const std::vector<Vote>& votes) const;

    ReferenceBloc reference_bloc(const AxisConfig& axis, const std::vector<std::string>& members) const;

    const Config& config_;
    std::shared_ptr<const LexiconStore> lexicon_;
    TextScorer text_scorer_;
    CoalitionScorer coalition_scorer_;
    VotePatternScorer vote_scorer_;
    ScoreAggregator aggregator_;
};
