#include <gtest/gtest.h>
#include "errors.hpp"
#include "lexicon_store.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>

TEST(LexiconStoreTest, LooksUpNormalizedTerms) {
    auto store = LexiconStore::from_terms("v1", {
        {"economic", {{"Tax Cut", -0.6}, {"minimum-wage", 0.5}, {"union", 0.4}}},
        {"social", {{"choice", 0.7}}}
    });

    EXPECT_EQ(store->version(), "v1");
    EXPECT_EQ(store->axes(), (std::vector<std::string>{"economic", "social"}));
    ASSERT_TRUE(store->lookup("economic", "tax cut").has_value());
    EXPECT_DOUBLE_EQ(*store->lookup("economic", "tax cut"), -0.6);
    EXPECT_DOUBLE_EQ(*store->lookup("economic", "minimum wage"), 0.5);
    EXPECT_FALSE(store->lookup("economic", "choice").has_value());
    EXPECT_FALSE(store->lookup("defense", "union").has_value());

    const AxisLexicon* economic = store->axis("economic");
    ASSERT_NE(economic, nullptr);
    EXPECT_EQ(economic->size(), 3u);
    EXPECT_EQ(economic->max_ngram(), 2u);
}

TEST(LexiconStoreTest, BoundaryWeightsAreAccepted) {
    auto store = LexiconStore::from_terms("v1", {{"economic", {{"left", -1.0}, {"right", 1.0}}}});
    EXPECT_DOUBLE_EQ(*store->lookup("economic", "left"), -1.0);
    EXPECT_DOUBLE_EQ(*store->lookup("economic", "right"), 1.0);
}

TEST(LexiconStoreTest, RejectsWeightOutsideRange) {
    EXPECT_THROW(LexiconStore::from_terms("v1", {{"economic", {{"tax", 1.5}}}}), ValidationError);
    EXPECT_THROW(LexiconStore::from_terms("v1", {{"economic", {{"tax", -1.01}}}}), ValidationError);
    EXPECT_THROW(LexiconStore::from_terms("v1", {{"economic", {{"tax", std::nan("")}}}}), ValidationError);
}

TEST(LexiconStoreTest, RejectsDuplicateTermAfterNormalization) {
    EXPECT_THROW(LexiconStore::from_terms("v1", {{"economic", {{"tax cut", -0.5}, {"Tax-Cut", -0.4}}}}),
                 ValidationError);
}

TEST(LexiconStoreTest, SameTermOnDifferentAxesIsAllowed) {
    auto store = LexiconStore::from_terms("v1", {
        {"economic", {{"rights", 0.2}}},
        {"social", {{"rights", 0.6}}}
    });
    EXPECT_DOUBLE_EQ(*store->lookup("economic", "rights"), 0.2);
    EXPECT_DOUBLE_EQ(*store->lookup("social", "rights"), 0.6);
}

TEST(LexiconStoreTest, RejectsTermWithoutWordCharacters) {
    EXPECT_THROW(LexiconStore::from_terms("v1", {{"economic", {{"--", 0.1}}}}), ValidationError);
}

TEST(LexiconStoreTest, LoadsObjectAndArrayJsonForms) {
    nlohmann::json j = {
        {"version", "2024.1"},
        {"axes", {
            {"economic", {{"wage", 0.5}, {"deregulation", -0.7}}},
            {"social", nlohmann::json::array({
                {{"term", "pathway to citizenship"}, {"weight", 0.6}},
                {{"term", "border wall"}, {"weight", -0.6}}
            })}
        }}
    };

    auto store = LexiconStore::from_json(j);
    EXPECT_EQ(store->version(), "2024.1");
    EXPECT_DOUBLE_EQ(*store->lookup("economic", "deregulation"), -0.7);
    EXPECT_DOUBLE_EQ(*store->lookup("social", "pathway to citizenship"), 0.6);
    EXPECT_EQ(store->axis("social")->max_ngram(), 3u);
}

TEST(LexiconStoreTest, JsonArrayDuplicatesAreRejected) {
    nlohmann::json j = {
        {"axes", {
            {"economic", nlohmann::json::array({
                {{"term", "wage"}, {"weight", 0.5}},
                {{"term", "wage"}, {"weight", 0.3}}
            })}
        }}
    };
    EXPECT_THROW(LexiconStore::from_json(j), ValidationError);
}

TEST(LexiconStoreTest, RepeatedTermKeyIsRejectedNotOverwritten) {
    EXPECT_THROW(LexiconStore::from_text(R"({"version": "v", "axes": {"economic": {"wage": 0.4, "wage": 0.9}}})"),
                 ValidationError);
    EXPECT_THROW(LexiconStore::from_text(R"({"axes": {"social": {"choice": 0.5}, "social": {"life": -0.5}}})"),
                 ValidationError);

    // The same term under different axes is not a repeat
    auto store = LexiconStore::from_text(R"({"version": "v", "axes": {"economic": {"wage": 0.4}, "social": {"wage": -0.1}}})");
    EXPECT_DOUBLE_EQ(*store->lookup("economic", "wage"), 0.4);
    EXPECT_DOUBLE_EQ(*store->lookup("social", "wage"), -0.1);
}

TEST(LexiconStoreTest, LoadFileRejectsRepeatedTermKey) {
    const std::string path = ::testing::TempDir() + "lexicon_repeated_term.json";
    {
        std::ofstream out(path);
        out << R"({"version": "v", "axes": {"economic": {"wage": 0.4, "wage": 0.9}}})";
    }
    EXPECT_THROW(LexiconStore::load_file(path), ValidationError);

    {
        std::ofstream out(path);
        out << R"({"version": "v2", "axes": {"economic": {"wage": 0.4, "tax cut": -0.6}}})";
    }
    auto store = LexiconStore::load_file(path);
    EXPECT_EQ(store->version(), "v2");
    EXPECT_EQ(store->axis("economic")->size(), 2u);
    std::remove(path.c_str());
}

TEST(LexiconStoreTest, MalformedJsonIsRejected) {
    EXPECT_THROW(LexiconStore::from_json(nlohmann::json::array()), ValidationError);
    EXPECT_THROW(LexiconStore::from_json({{"version", "x"}}), ValidationError);
    EXPECT_THROW(LexiconStore::from_json({{"axes", {{"economic", {{"wage", "high"}}}}}}), ValidationError);
    EXPECT_THROW(LexiconStore::from_json({{"axes", {{"economic", 3}}}}), ValidationError);
}

// One bad term anywhere rejects the whole load; an existing store is untouched
TEST(LexiconStoreTest, FailedLoadLeavesExistingStoreIntact) {
    auto current = LexiconStore::from_terms("v1", {{"economic", {{"wage", 0.5}}}});

    std::shared_ptr<const LexiconStore> replacement;
    try {
        replacement = LexiconStore::from_terms("v2", {
            {"economic", {{"wage", 0.6}}},
            {"social", {{"choice", 0.5}, {"life", 2.0}}}
        });
    } catch (const ValidationError&) {
    }

    EXPECT_EQ(replacement, nullptr);
    EXPECT_EQ(current->version(), "v1");
    EXPECT_DOUBLE_EQ(*current->lookup("economic", "wage"), 0.5);
}

TEST(LexiconStoreTest, MissingFileIsValidationError) {
    EXPECT_THROW(LexiconStore::load_file("/nonexistent/lexicon.json"), ValidationError);
}
