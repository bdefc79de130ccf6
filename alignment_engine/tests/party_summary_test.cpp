#include <gtest/gtest.h>
#include "party_summary.hpp"
#include "test_support.hpp"

namespace {

AlignmentScore make_score(const std::string& member, const std::string& axis, double value, double confidence) {
    AlignmentScore s;
    s.member_id = member;
    s.axis = axis;
    s.value = value;
    s.confidence = confidence;
    return s;
}

} // namespace

TEST(PartySummaryTest, GroupsByPartyAndAxis) {
    std::vector<Member> members = {
        test_support::member("d1", "D"),
        test_support::member("d2", "D"),
        test_support::member("r1", "R"),
    };
    Member independent = test_support::member("i1", "");
    independent.party.reset();
    members.push_back(independent);

    std::vector<AlignmentScore> scores = {
        make_score("d1", "economic", 0.8, 1.0),
        make_score("d2", "economic", 0.2, 0.5),
        make_score("r1", "economic", -0.6, 0.5),
        make_score("i1", "economic", 0.1, 0.0),
        make_score("d1", "social", 0.4, 1.0),
        make_score("ghost", "economic", 1.0, 1.0),
    };

    auto summaries = summarize_by_party(scores, members);
    ASSERT_EQ(summaries.size(), 4u);

    EXPECT_EQ(summaries[0].party, "D");
    EXPECT_EQ(summaries[0].axis, "economic");
    EXPECT_EQ(summaries[0].member_count, 2);
    EXPECT_EQ(summaries[0].scored_member_count, 2);
    EXPECT_NEAR(summaries[0].mean_score, (0.8 + 0.1) / 1.5, 1e-12);
    EXPECT_NEAR(summaries[0].mean_confidence, 0.75, 1e-12);

    EXPECT_EQ(summaries[1].party, "D");
    EXPECT_EQ(summaries[1].axis, "social");

    EXPECT_EQ(summaries[2].party, "R");
    EXPECT_NEAR(summaries[2].mean_score, -0.6, 1e-12);

    EXPECT_EQ(summaries[3].party, "independent");
    EXPECT_EQ(summaries[3].scored_member_count, 0);
    EXPECT_EQ(summaries[3].mean_score, 0.0);
}

TEST(PartySummaryTest, EmptyScoresGiveNoSummaries) {
    EXPECT_TRUE(summarize_by_party({}, {test_support::member("d1", "D")}).empty());
}

TEST(PartySummaryTest, CompareMembersOrdersByValue) {
    std::vector<AlignmentScore> scores = {
        make_score("a", "economic", 0.1, 1.0),
        make_score("b", "economic", 0.7, 1.0),
        make_score("c", "economic", 0.1, 1.0),
        make_score("b", "social", -0.9, 1.0),
        make_score("d", "economic", 0.9, 1.0),
    };

    auto compared = compare_members(scores, {"c", "a", "b", "zz"}, "economic");
    ASSERT_EQ(compared.size(), 3u);
    EXPECT_EQ(compared[0].member_id, "b");
    EXPECT_EQ(compared[1].member_id, "a");
    EXPECT_EQ(compared[2].member_id, "c");
}
