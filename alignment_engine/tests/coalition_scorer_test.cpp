#include <gtest/gtest.h>
#include "coalition_scorer.hpp"
#include "test_support.hpp"

class CoalitionScorerTest : public ::testing::Test {
protected:
    Config config;
    TimeWindow window = test_support::window(0, 30);

    // Adds `times` co-sponsorships between a and b
    static void link(CoalitionGraphBuilder& builder, const std::string& a, const std::string& b, int times = 1) {
        for (int i = 0; i < times; ++i) {
            builder.add_cosponsorship(a, b);
        }
    }
};

TEST_F(CoalitionScorerTest, ConvergesMonotonicallyOnConnectedComponent) {
    CoalitionGraphBuilder builder(config, window, {"A", "B", "C"});
    link(builder, "A", "B");
    link(builder, "A", "C");
    link(builder, "B", "C");
    auto graph = builder.build();

    CoalitionScorer scorer(config);
    auto result = scorer.score(graph, {{"A", 1.0}});

    EXPECT_TRUE(result.converged);
    ASSERT_GE(result.max_change_history.size(), 2u);
    for (std::size_t i = 1; i < result.max_change_history.size(); ++i) {
        EXPECT_LT(result.max_change_history[i], result.max_change_history[i - 1]);
    }
    EXPECT_LT(result.max_change_history.back(), config.propagation_tolerance);
    EXPECT_NEAR(result.scores["B"].value, 1.0, 1e-3);
    EXPECT_NEAR(result.scores["C"].value, 1.0, 1e-3);
}

TEST_F(CoalitionScorerTest, MaxChangeStrictlyDecreasesAlongChain) {
    CoalitionGraphBuilder builder(config, window, {"A", "B", "C"});
    link(builder, "A", "B");
    link(builder, "B", "C");
    auto graph = builder.build();

    auto result = CoalitionScorer(config).score(graph, {{"A", 1.0}});

    EXPECT_TRUE(result.converged);
    ASSERT_GE(result.max_change_history.size(), 3u);
    for (std::size_t i = 1; i < result.max_change_history.size(); ++i) {
        EXPECT_LT(result.max_change_history[i], result.max_change_history[i - 1]) << "iteration " << i + 1;
    }
    EXPECT_NEAR(result.scores["C"].value, 1.0, 1e-3);
}

TEST_F(CoalitionScorerTest, MaxChangeStrictlyDecreasesAlongLongerPath) {
    config.propagation_max_iterations = 1000;
    std::vector<std::string> ids = {"M0", "M1", "M2", "M3", "M4", "M5"};
    CoalitionGraphBuilder builder(config, window, ids);
    for (std::size_t i = 0; i + 1 < ids.size(); ++i) {
        link(builder, ids[i], ids[i + 1]);
    }
    auto graph = builder.build();
    CoalitionScorer scorer(config);

    // One anchor at the end, then anchors of opposite sign at both ends
    for (const auto& anchors : {std::map<std::string, double>{{"M0", 1.0}},
                                std::map<std::string, double>{{"M0", 1.0}, {"M5", -1.0}}}) {
        auto result = scorer.score(graph, anchors);
        EXPECT_TRUE(result.converged);
        for (std::size_t i = 1; i < result.max_change_history.size(); ++i) {
            EXPECT_LT(result.max_change_history[i], result.max_change_history[i - 1]) << "iteration " << i + 1;
        }
    }

    auto two_anchors = scorer.score(graph, {{"M0", 1.0}, {"M5", -1.0}});
    // Harmonic solution on a path is linear between the anchors
    EXPECT_NEAR(two_anchors.scores["M1"].value, 0.6, 1e-3);
    EXPECT_NEAR(two_anchors.scores["M2"].value, 0.2, 1e-3);
    EXPECT_NEAR(two_anchors.scores["M3"].value, -0.2, 1e-3);
}

TEST_F(CoalitionScorerTest, AnchorsAreClampedAndFullyConfident) {
    CoalitionGraphBuilder builder(config, window, {"A", "B", "C"});
    link(builder, "A", "B", 3);
    link(builder, "B", "C", 1);
    auto graph = builder.build();

    CoalitionScorer scorer(config);
    auto result = scorer.score(graph, {{"A", 1.0}, {"C", -1.0}});

    EXPECT_TRUE(result.converged);
    EXPECT_DOUBLE_EQ(result.scores["A"].value, 1.0);
    EXPECT_DOUBLE_EQ(result.scores["A"].confidence, 1.0);
    EXPECT_DOUBLE_EQ(result.scores["C"].value, -1.0);
    // Weighted mean of neighbors: (3 * 1 + 1 * -1) / 4
    EXPECT_NEAR(result.scores["B"].value, 0.5, 1e-3);
    EXPECT_DOUBLE_EQ(result.scores["B"].confidence, 4.0 / 5.0);
}

TEST_F(CoalitionScorerTest, UnreachableMembersGetZeroWithZeroConfidence) {
    CoalitionGraphBuilder builder(config, window, {"A", "B", "C", "D", "E"});
    link(builder, "A", "B");
    link(builder, "C", "D");   // component without an anchor
    auto graph = builder.build();

    CoalitionScorer scorer(config);
    auto result = scorer.score(graph, {{"A", 0.8}});

    EXPECT_NEAR(result.scores["B"].value, 0.8, 1e-3);
    EXPECT_GT(result.scores["B"].confidence, 0.0);
    for (const std::string id : {"C", "D", "E"}) {
        EXPECT_EQ(result.scores[id].value, 0.0) << id;
        EXPECT_EQ(result.scores[id].confidence, 0.0) << id;
    }
}

TEST_F(CoalitionScorerTest, NoAnchorsMeansNoCoalitionSignal) {
    CoalitionGraphBuilder builder(config, window, {"A", "B"});
    link(builder, "A", "B");
    auto graph = builder.build();

    CoalitionScorer scorer(config);
    auto result = scorer.score(graph, {{"Z", 1.0}});   // not in the graph

    ASSERT_EQ(result.scores.size(), 2u);
    EXPECT_EQ(result.scores["A"].confidence, 0.0);
    EXPECT_EQ(result.scores["B"].confidence, 0.0);
    EXPECT_EQ(result.iterations, 0);
}

TEST_F(CoalitionScorerTest, IterationCapReducesConfidenceInsteadOfFailing) {
    config.propagation_max_iterations = 3;
    CoalitionGraphBuilder builder(config, window, {"A", "B", "C", "D", "E"});
    link(builder, "A", "B");
    link(builder, "B", "C");
    link(builder, "C", "D");
    link(builder, "D", "E");
    auto graph = builder.build();

    CoalitionScorer scorer(config);
    auto result = scorer.score(graph, {{"A", 1.0}});

    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.iterations, 3);
    // B has weighted degree 2: 2 / (2 + 1), halved for not converging
    EXPECT_DOUBLE_EQ(result.scores["B"].confidence, (2.0 / 3.0) * config.nonconverged_confidence_factor);
    for (const auto& entry : result.scores) {
        EXPECT_GE(entry.second.value, -1.0);
        EXPECT_LE(entry.second.value, 1.0);
    }
}

TEST_F(CoalitionScorerTest, ResultsAreBitIdenticalAcrossRunsAndThreadCounts) {
    std::vector<std::string> ids;
    for (int i = 0; i < 40; ++i) {
        ids.push_back("M" + std::to_string(i));
    }
    CoalitionGraphBuilder builder(config, window, ids);
    for (int i = 0; i < 40; ++i) {
        link(builder, ids[i], ids[(i + 1) % 40], 1 + i % 3);
        link(builder, ids[i], ids[(i * 7 + 3) % 40], 1);
    }
    auto graph = builder.build();
    std::map<std::string, double> anchors = {{"M0", 1.0}, {"M20", -1.0}, {"M33", 0.25}};

    config.worker_threads = 1;
    auto serial = CoalitionScorer(config).score(graph, anchors);
    config.worker_threads = 4;
    auto parallel = CoalitionScorer(config).score(graph, anchors);
    auto repeat = CoalitionScorer(config).score(graph, anchors);

    ASSERT_EQ(serial.scores.size(), parallel.scores.size());
    EXPECT_EQ(serial.iterations, parallel.iterations);
    for (const auto& [id, sub] : serial.scores) {
        EXPECT_EQ(sub.value, parallel.scores[id].value) << id;
        EXPECT_EQ(sub.confidence, parallel.scores[id].confidence) << id;
        EXPECT_EQ(sub.value, repeat.scores[id].value) << id;
    }
}
