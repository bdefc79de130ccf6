#include "alignment_engine.hpp"
#include "errors.hpp"
#include "tokenizer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <set>

nlohmann::json RunStats::to_json() const {
    nlohmann::json axis_stats = nlohmann::json::array();
    for (const auto& axis : axes) {
        axis_stats.push_back({
            {"axis", axis.axis},
            {"propagation_iterations", axis.propagation_iterations},
            {"converged", axis.converged}
        });
    }
    return {
        {"documents_in_window", documents_in_window},
        {"votes_in_window", votes_in_window},
        {"skipped_documents", skipped_documents},
        {"skipped_votes", skipped_votes},
        {"undecodable_members", undecodable_members},
        {"undecodable_documents", undecodable_documents},
        {"undecodable_votes", undecodable_votes},
        {"members_scored", members_scored},
        {"graph_edges", graph_edges},
        {"axes", axis_stats}
    };
}

AlignmentEngine::AlignmentEngine(const Config& config, std::shared_ptr<const LexiconStore> lexicon)
    : config_(config),
      lexicon_(std::move(lexicon)),
      text_scorer_(config_, lexicon_),
      coalition_scorer_(config_),
      vote_scorer_(config_),
      aggregator_(config_) {
    if (!lexicon_) {
        throw ValidationError("alignment engine requires a lexicon");
    }
}

std::vector<std::string> AlignmentEngine::axes() const {
    std::set<std::string> names;
    for (const auto& name : lexicon_->axes()) {
        names.insert(name);
    }
    for (const auto& entry : config_.axes) {
        names.insert(entry.first);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

bool AlignmentEngine::check_document(const Document& document, std::string& reason) const {
    if (document.id.empty()) {
        reason = "missing document id";
        return false;
    }
    if (document.primary_sponsor.empty()) {
        reason = "missing primary sponsor";
        return false;
    }
    for (const auto& cosponsor : document.cosponsors) {
        if (cosponsor.empty()) {
            reason = "empty co-sponsor id";
            return false;
        }
        if (cosponsor == document.primary_sponsor) {
            reason = "primary sponsor listed as co-sponsor";
            return false;
        }
    }
    return true;
}

bool AlignmentEngine::check_vote(const Vote& vote, std::string& reason) const {
    if (vote.roll_call_id.empty()) {
        reason = "missing roll call id";
        return false;
    }
    if (vote.positions.empty()) {
        reason = "no recorded positions";
        return false;
    }
    for (const auto& entry : vote.positions) {
        if (entry.first.empty()) {
            reason = "empty member id in positions";
            return false;
        }
    }
    return true;
}

std::vector<std::string> AlignmentEngine::active_members(const RecordBatch& batch,
                                                         const TimeWindow& window,
                                                         const std::vector<Document>& documents,
                                                         const std::vector<Vote>& votes) const {
    std::set<std::string> ids;
    if (!batch.members.empty()) {
        for (const auto& member : batch.members) {
            if (member.active_in(window)) {
                ids.insert(member.id);
            }
        }
        return std::vector<std::string>(ids.begin(), ids.end());
    }

    // No roster supplied: everyone appearing in the window's records
    for (const auto& doc : documents) {
        ids.insert(doc.primary_sponsor);
        ids.insert(doc.cosponsors.begin(), doc.cosponsors.end());
    }
    for (const auto& vote : votes) {
        for (const auto& entry : vote.positions) {
            ids.insert(entry.first);
        }
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

CoalitionGraph AlignmentEngine::build_graph(const TimeWindow& window,
                                            const std::vector<std::string>& members,
                                            const std::vector<Document>& documents,
                                            const std::vector<Vote>& votes) const {
    CoalitionGraphBuilder builder(config_, window, members);
    util::parallel_for(documents.size(), config_.worker_threads, [&](std::size_t i) {
        builder.add_document(documents[i]);
    });
    util::parallel_for(votes.size(), config_.worker_threads, [&](std::size_t i) {
        builder.add_vote(votes[i]);
    });
    return builder.build();
}

ReferenceBloc AlignmentEngine::reference_bloc(const AxisConfig& axis,
                                              const std::vector<std::string>& members) const {
    std::set<std::string> pole_a(axis.pole_a.begin(), axis.pole_a.end());
    if (axis.pole_b_is_complement) {
        return ReferenceBloc::with_complement(pole_a, members);
    }
    ReferenceBloc bloc;
    bloc.pole_a = pole_a;
    bloc.pole_b.insert(axis.pole_b.begin(), axis.pole_b.end());
    return bloc;
}

WindowResult AlignmentEngine::score_window(const RecordBatch& batch,
                                           const TimeWindow& window,
                                           const TimePoint& computed_at) const {
    WindowResult result;
    result.window = window;
    result.stats.undecodable_members = batch.skipped_members;
    result.stats.undecodable_documents = batch.skipped_documents;
    result.stats.undecodable_votes = batch.skipped_votes;

    if (!window.valid()) {
        spdlog::warn("Window {} is empty; nothing to score", window.label());
        return result;
    }

    // Select and check the window's records; a bad record is skipped alone
    std::vector<Document> documents;
    std::set<std::string> document_ids;
    for (const auto& doc : batch.documents) {
        if (!window.contains(doc.timestamp)) {
            continue;
        }
        std::string reason;
        if (!check_document(doc, reason) || !document_ids.insert(doc.id).second) {
            if (reason.empty()) {
                reason = "duplicate document id";
            }
            ++result.stats.skipped_documents;
            spdlog::warn("Skipping document '{}': {}", doc.id, reason);
            continue;
        }
        documents.push_back(doc);
    }

    std::vector<Vote> votes;
    std::set<std::string> roll_call_ids;
    for (const auto& vote : batch.votes) {
        if (!window.contains(vote.timestamp)) {
            continue;
        }
        std::string reason;
        if (!check_vote(vote, reason) || !roll_call_ids.insert(vote.roll_call_id).second) {
            if (reason.empty()) {
                reason = "duplicate roll call id";
            }
            ++result.stats.skipped_votes;
            spdlog::warn("Skipping roll call '{}': {}", vote.roll_call_id, reason);
            continue;
        }
        votes.push_back(vote);
    }

    result.stats.documents_in_window = static_cast<int>(documents.size());
    result.stats.votes_in_window = static_cast<int>(votes.size());

    if (documents.empty() && votes.empty()) {
        spdlog::info("Window {} has no records; no scores produced", window.label());
        return result;
    }

    std::vector<std::string> members = active_members(batch, window, documents, votes);
    std::vector<std::string> axis_names = axes();

    CoalitionGraph graph = build_graph(window, members, documents, votes);
    result.stats.graph_edges = graph.edge_count();

    // Tokenize once, score each document on every axis
    std::vector<std::vector<TextScore>> text_by_axis(axis_names.size(),
                                                     std::vector<TextScore>(documents.size()));
    util::parallel_for(documents.size(), config_.worker_threads, [&](std::size_t i) {
        std::vector<std::string> tokens = Tokenizer::tokenize(documents[i].text);
        for (std::size_t a = 0; a < axis_names.size(); ++a) {
            text_by_axis[a][i] = text_scorer_.score_tokens(tokens, axis_names[a]);
        }
    });

    for (std::size_t a = 0; a < axis_names.size(); ++a) {
        const std::string& axis = axis_names[a];
        AxisConfig axis_config = config_.axis_config(axis);

        auto text_scores = text_scorer_.score_members(documents, text_by_axis[a]);
        auto coalition = coalition_scorer_.score(graph, axis_config.anchors);
        auto patterns = vote_scorer_.score(votes, reference_bloc(axis_config, members), members);

        result.stats.axes.push_back({axis, coalition.iterations, coalition.converged});

        for (const auto& member_id : members) {
            SignalSet signals;
            auto text_it = text_scores.find(member_id);
            if (text_it != text_scores.end()) {
                signals.text = text_it->second;
            }
            auto coalition_it = coalition.scores.find(member_id);
            if (coalition_it != coalition.scores.end()) {
                signals.coalition = coalition_it->second;
            }
            auto vote_it = patterns.find(member_id);
            if (vote_it != patterns.end()) {
                signals.vote = vote_it->second.score;
            }
            result.scores.push_back(aggregator_.aggregate(member_id, axis, window, signals, computed_at));
        }
    }

    result.stats.members_scored = members.size();
    spdlog::info("Window {}: {} documents, {} roll calls, {} members, {} edges, {} scores (lexicon {})",
                 window.label(), documents.size(), votes.size(), members.size(),
                 graph.edge_count(), result.scores.size(), lexicon_->version());
    return result;
}
