#include <gtest/gtest.h>
#include <cmath>
#include <lore/search/rank_fusion.h>

using namespace lore;
using namespace lore::search;

namespace {

SearchHit makeHit(EntryId id, const std::string& type, double rrf, int64_t accessCount = 0) {
    SearchHit hit;
    hit.entry.id = id;
    hit.entry.type = type;
    hit.entry.accessCount = accessCount;
    hit.rrfScore = rrf;
    return hit;
}

} // namespace

TEST(ReciprocalRankFusionTest, SumsContributionsAcrossLists) {
    std::vector<RankedList> lists{
        {SearchSource::Keyword, {10, 20, 30}},
        {SearchSource::Vector, {20, 40}},
    };

    auto fused = fuseReciprocalRank(lists, 60.0);
    ASSERT_EQ(fused.size(), 4u);

    EXPECT_EQ(fused[0].id, 20);
    EXPECT_NEAR(fused[0].rrfScore, 1.0 / 62 + 1.0 / 61, 1e-12);
    EXPECT_EQ(fused[0].sources,
              (std::vector<SearchSource>{SearchSource::Keyword, SearchSource::Vector}));

    // 10 and 40 both sit at rank one of a single list
    EXPECT_EQ(fused[1].id, 10);
    EXPECT_EQ(fused[2].id, 40);
    EXPECT_DOUBLE_EQ(fused[1].rrfScore, fused[2].rrfScore);
    EXPECT_EQ(fused[3].id, 30);
    EXPECT_NEAR(fused[3].rrfScore, 1.0 / 63, 1e-12);
}

TEST(ReciprocalRankFusionTest, RepeatedIdCountsOnce) {
    std::vector<RankedList> lists{{SearchSource::Keyword, {5, 5, 6}}};
    auto fused = fuseReciprocalRank(lists, 60.0);
    ASSERT_EQ(fused.size(), 2u);
    EXPECT_EQ(fused[0].id, 5);
    EXPECT_NEAR(fused[0].rrfScore, 1.0 / 61, 1e-12);
    EXPECT_NEAR(fused[1].rrfScore, 1.0 / 63, 1e-12);
}

TEST(ReciprocalRankFusionTest, EmptyInputs) {
    EXPECT_TRUE(fuseReciprocalRank({}).empty());
    EXPECT_TRUE(
        fuseReciprocalRank(std::vector<RankedList>{RankedList{SearchSource::Vector, {}}}).empty());
}

TEST(RankWeightsTest, DefaultsFavourDurableKnowledge) {
    auto weights = RankWeights::defaults();
    EXPECT_DOUBLE_EQ(weights.weightFor("decision"), 2.0);
    EXPECT_DOUBLE_EQ(weights.weightFor("lesson"), 2.0);
    EXPECT_DOUBLE_EQ(weights.weightFor("summary"), 0.5);
    EXPECT_DOUBLE_EQ(weights.weightFor("temp_note"), 0.3);
    EXPECT_DOUBLE_EQ(weights.weightFor("snippet"), 1.0);
}

TEST(RerankTest, TypeWeightingScenario) {
    std::vector<SearchHit> hits{makeHit(1, "temp_note", 0.5), makeHit(2, "decision", 0.5),
                                makeHit(3, "lesson", 0.5)};

    auto ranked = rerank(hits, RankWeights::defaults(), 10);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].entry.id, 2);
    EXPECT_EQ(ranked[1].entry.id, 3);
    EXPECT_EQ(ranked[2].entry.id, 1);
    EXPECT_NEAR(ranked[0].finalScore, 1.0, 1e-12);
    EXPECT_NEAR(ranked[1].finalScore, 1.0, 1e-12);
    EXPECT_NEAR(ranked[2].finalScore, 0.15, 1e-12);
}

TEST(RerankTest, MidRankedDecisionBeatsTopRankedNote) {
    std::vector<SearchHit> hits{makeHit(1, "temp_note", 1.0 / 61), makeHit(2, "summary", 1.0 / 62),
                                makeHit(3, "decision", 1.0 / 63)};
    auto ranked = rerank(hits, RankWeights::defaults(), 10);
    EXPECT_EQ(ranked.front().entry.id, 3);
    EXPECT_EQ(ranked.back().entry.id, 1);
}

TEST(RerankTest, AccessBoostIsMonotonic) {
    EXPECT_DOUBLE_EQ(accessBoost(0), 1.0);
    EXPECT_DOUBLE_EQ(accessBoost(-3), 1.0);
    double previous = accessBoost(0);
    for (int64_t n = 1; n < 2000; n += 37) {
        const double boost = accessBoost(n);
        EXPECT_GT(boost, previous);
        previous = boost;
    }

    std::vector<SearchHit> hits{makeHit(1, "lesson", 0.02, 0), makeHit(2, "lesson", 0.02, 9)};
    auto ranked = rerank(hits, RankWeights::defaults(), 10);
    EXPECT_EQ(ranked[0].entry.id, 2);
    EXPECT_NEAR(ranked[0].accessBoost, 1.0 + std::log(10.0), 1e-12);
}

TEST(RerankTest, TiesBreakByIdAndLimitTruncates) {
    std::vector<SearchHit> hits{makeHit(9, "lesson", 0.1), makeHit(4, "lesson", 0.1),
                                makeHit(6, "lesson", 0.1)};
    auto ranked = rerank(hits, RankWeights::defaults(), 2);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].entry.id, 4);
    EXPECT_EQ(ranked[1].entry.id, 6);

    RankWeights custom;
    custom.defaultWeight = 0.0;
    auto zeroed = rerank(hits, custom, 5);
    for (const auto& hit : zeroed) {
        EXPECT_DOUBLE_EQ(hit.finalScore, 0.0);
    }
}
