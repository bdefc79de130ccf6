#include "alignment_engine.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "lexicon_store.hpp"
#include "party_summary.hpp"
#include "pg_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>

namespace {

void print_usage(const char* program) {
    std::cerr << "usage: " << program << " <batch.json> <window-start> <window-end> [output.json]\n"
              << "       " << program << " --history <member-id> <axis>\n"
              << "  window bounds are ISO-8601 UTC timestamps or dates; the window is [start, end)\n"
              << "  --history prints the stored score versions of a member (needs PG_DSN)\n";
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ValidationError("cannot open " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(path + " is not valid JSON: " + e.what());
    }
    return j;
}

int print_history(const Config& config, const std::string& member_id, const std::string& axis) {
    if (config.pg_dsn.empty()) {
        spdlog::error("--history needs PG_DSN");
        return 1;
    }
    PostgresStore store(config);
    auto history = store.get_score_history(member_id, axis);
    if (!history) {
        spdlog::error("Could not read score history for {} on {}", member_id, axis);
        return 1;
    }

    nlohmann::json versions = nlohmann::json::array();
    for (const auto& score : *history) {
        versions.push_back(score.to_json());
    }
    std::cout << versions.dump(2) << std::endl;
    spdlog::info("{} stored versions for {} on {}", history->size(), member_id, axis);
    return 0;
}

int score_window(const Config& config,
                 const std::shared_ptr<const LexiconStore>& lexicon,
                 const TimeWindow& window,
                 const std::string& batch_path,
                 const std::string& output_path) {
    RecordBatch batch = RecordBatch::from_json(read_json_file(batch_path));

    AlignmentEngine engine(config, lexicon);
    WindowResult result = engine.score_window(batch, window, std::chrono::system_clock::now());

    nlohmann::json scores = nlohmann::json::array();
    for (const auto& score : result.scores) {
        scores.push_back(score.to_json());
    }
    nlohmann::json parties = nlohmann::json::array();
    for (const auto& summary : summarize_by_party(result.scores, batch.members)) {
        parties.push_back(summary.to_json());
    }

    nlohmann::json output = {
        {"window_start", util::format_iso8601(window.start)},
        {"window_end", util::format_iso8601(window.end)},
        {"lexicon_version", lexicon->version()},
        {"scores", scores},
        {"party_summary", parties},
        {"stats", result.stats.to_json()}
    };

    if (output_path.empty()) {
        std::cout << output.dump(2) << std::endl;
    } else {
        std::ofstream out(output_path);
        if (!out.is_open()) {
            spdlog::error("Cannot write output file {}", output_path);
            return 1;
        }
        out << output.dump(2) << std::endl;
        spdlog::info("Wrote {} scores to {}", result.scores.size(), output_path);
    }

    if (!config.pg_dsn.empty()) {
        PostgresStore store(config);
        if (!store.initialize_schema() || !store.save_scores(result.scores)) {
            spdlog::error("Scores computed but could not be persisted");
            return 1;
        }
    }
    return 0;
}

int run(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 2;
    }
    const bool history_mode = std::string(argv[1]) == "--history";

    Config config;
    std::shared_ptr<const LexiconStore> lexicon;
    TimeWindow window;
    try {
        config.load_from_env();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        if (history_mode) {
            return print_history(config, argv[2], argv[3]);
        }

        std::ifstream axes_file(config.axes_path);
        if (axes_file.good()) {
            config.load_axes_file(config.axes_path);
        } else {
            spdlog::warn("Axes configuration {} not found; using default weights and no anchors or poles",
                         config.axes_path);
        }
        config.validate();

        lexicon = LexiconStore::load_file(config.lexicon_path);

        window.start = util::parse_iso8601(argv[2]);
        window.end = util::parse_iso8601(argv[3]);
        if (!window.valid()) {
            throw ValidationError("window end must be after window start");
        }
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    spdlog::info("Starting {} (lexicon {}, window {})", config.service_name, lexicon->version(), window.label());

    int status = 0;
    try {
        status = score_window(config, lexicon, window, argv[1], argc > 4 ? argv[4] : "");
    } catch (const std::exception& e) {
        spdlog::critical("Scoring run failed: {}", e.what());
        return 1;
    }

    if (status == 0) {
        spdlog::info("{} finished", config.service_name);
    }
    return status;
}

} // namespace

int main(int argc, char* argv[]) {
    // Set up logger on stderr so score JSON on stdout stays clean
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("alignment_engine", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);

    int status = run(argc, argv);

    spdlog::shutdown();
    return status;
}
