#include "pg_store.hpp"
#include "util.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>

class PostgresStore::Impl {
public:
    // A failed connection is logged; every later call then reports failure
    explicit Impl(const std::string& dsn) {
        try {
            conn_ = std::make_unique<pqxx::connection>(dsn);
            spdlog::info("Connected to PostgreSQL database {}", conn_->dbname());
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
            conn_.reset();
        }
    }

    bool is_connected() const {
        return conn_ && conn_->is_open();
    }

    bool initialize_schema() {
        if (!is_connected()) {
            return false;
        }

        try {
            pqxx::work txn(*conn_);
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS alignment_scores (
                    member_id TEXT NOT NULL,
                    axis TEXT NOT NULL,
                    window_start TIMESTAMP WITH TIME ZONE NOT NULL,
                    window_end TIMESTAMP WITH TIME ZONE NOT NULL,
                    computed_at TIMESTAMP WITH TIME ZONE NOT NULL,
                    value DOUBLE PRECISION NOT NULL,
                    confidence DOUBLE PRECISION NOT NULL,
                    label TEXT NOT NULL,
                    text_value DOUBLE PRECISION NOT NULL,
                    text_confidence DOUBLE PRECISION NOT NULL,
                    coalition_value DOUBLE PRECISION NOT NULL,
                    coalition_confidence DOUBLE PRECISION NOT NULL,
                    vote_value DOUBLE PRECISION NOT NULL,
                    vote_confidence DOUBLE PRECISION NOT NULL,
                    PRIMARY KEY (member_id, axis, window_start, window_end, computed_at)
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_alignment_scores_member_axis "
                     "ON alignment_scores(member_id, axis)");
            txn.commit();
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Error initializing alignment_scores schema: {}", e.what());
            return false;
        }
    }

    bool save_scores(const std::vector<AlignmentScore>& scores) {
        if (scores.empty()) {
            spdlog::debug("No alignment scores to save");
            return true;
        }
        if (!is_connected()) {
            return false;
        }

        try {
            pqxx::work txn(*conn_);
            for (const auto& s : scores) {
                txn.exec_params(
                    "INSERT INTO alignment_scores (member_id, axis, window_start, window_end, computed_at, "
                    "value, confidence, label, text_value, text_confidence, coalition_value, "
                    "coalition_confidence, vote_value, vote_confidence) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14) "
                    "ON CONFLICT DO NOTHING",
                    s.member_id,
                    s.axis,
                    util::format_iso8601(s.window.start),
                    util::format_iso8601(s.window.end),
                    util::format_iso8601(s.computed_at),
                    s.value,
                    s.confidence,
                    s.label,
                    s.text.value,
                    s.text.confidence,
                    s.coalition.value,
                    s.coalition.confidence,
                    s.vote.value,
                    s.vote.confidence
                );
            }
            txn.commit();
            spdlog::info("Saved {} alignment scores", scores.size());
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Error saving alignment scores: {}", e.what());
            return false;
        }
    }

    std::optional<std::vector<AlignmentScore>> get_score_history(const std::string& member_id, const std::string& axis) {
        if (!is_connected()) {
            return std::nullopt;
        }

        try {
            pqxx::work txn(*conn_);
            pqxx::result result = txn.exec_params(
                "SELECT to_char(window_start AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS') AS window_start, "
                "to_char(window_end AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS') AS window_end, "
                "to_char(computed_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS') AS computed_at, "
                "value, confidence, label, text_value, text_confidence, coalition_value, "
                "coalition_confidence, vote_value, vote_confidence "
                "FROM alignment_scores "
                "WHERE member_id = $1 AND axis = $2 "
                "ORDER BY computed_at, window_start",
                member_id,
                axis
            );

            std::vector<AlignmentScore> history;
            for (const auto& row : result) {
                AlignmentScore score;
                score.member_id = member_id;
                score.axis = axis;
                score.window.start = util::parse_iso8601(row["window_start"].as<std::string>());
                score.window.end = util::parse_iso8601(row["window_end"].as<std::string>());
                score.computed_at = util::parse_iso8601(row["computed_at"].as<std::string>());
                score.value = row["value"].as<double>();
                score.confidence = row["confidence"].as<double>();
                score.label = row["label"].as<std::string>();
                score.text = {row["text_value"].as<double>(), row["text_confidence"].as<double>()};
                score.coalition = {row["coalition_value"].as<double>(), row["coalition_confidence"].as<double>()};
                score.vote = {row["vote_value"].as<double>(), row["vote_confidence"].as<double>()};
                history.push_back(score);
            }

            txn.commit();
            return history;
        } catch (const std::exception& e) {
            spdlog::error("Error fetching score history for {} on {}: {}", member_id, axis, e.what());
            return std::nullopt;
        }
    }

private:
    std::unique_ptr<pqxx::connection> conn_;
};

PostgresStore::PostgresStore(const Config& config) : impl_(std::make_unique<Impl>(config.pg_dsn)) {}

PostgresStore::~PostgresStore() = default;

bool PostgresStore::is_connected() const {
    return impl_->is_connected();
}

bool PostgresStore::initialize_schema() {
    return impl_->initialize_schema();
}

bool PostgresStore::save_scores(const std::vector<AlignmentScore>& scores) {
    return impl_->save_scores(scores);
}

std::optional<std::vector<AlignmentScore>> PostgresStore::get_score_history(const std::string& member_id, const std::string& axis) {
    return impl_->get_score_history(member_id, axis);
}
