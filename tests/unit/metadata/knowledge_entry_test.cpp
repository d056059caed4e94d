#include "test_helpers.h"
#include <gtest/gtest.h>
#include <lore/metadata/knowledge_entry.h>

using namespace lore;
using namespace lore::metadata;
using namespace lore::test;
using namespace std::chrono_literals;

TEST(TtlCategoryTest, DefaultsPerType) {
    EXPECT_EQ(defaultTtlForType("lesson"), TtlCategory::Permanent);
    EXPECT_EQ(defaultTtlForType("decision"), TtlCategory::LongTerm);
    EXPECT_EQ(defaultTtlForType("summary"), TtlCategory::ShortTerm);
    EXPECT_EQ(defaultTtlForType("temp_note"), TtlCategory::Ephemeral);
    EXPECT_EQ(defaultTtlForType("snippet"), TtlCategory::ShortTerm);
}

TEST(TtlCategoryTest, ExpiryWindows) {
    const auto now = fromEpochMillis(1'700'000'000'000);
    EXPECT_FALSE(computeExpiry(TtlCategory::Permanent, now).has_value());
    EXPECT_EQ(computeExpiry(TtlCategory::Ephemeral, now), now + 24h);
    EXPECT_EQ(computeExpiry(TtlCategory::ShortTerm, now), now + 24h * 7);
    EXPECT_EQ(computeExpiry(TtlCategory::LongTerm, now), now + 24h * 90);
}

TEST(TtlCategoryTest, NamesRoundTrip) {
    for (auto category : {TtlCategory::Permanent, TtlCategory::LongTerm, TtlCategory::ShortTerm,
                          TtlCategory::Ephemeral}) {
        EXPECT_EQ(ttlCategoryFromString(ttlCategoryToString(category)), category);
    }
    EXPECT_FALSE(ttlCategoryFromString("forever").has_value());
    EXPECT_EQ(scopeFromString("project"), Scope::Project);
    EXPECT_FALSE(scopeFromString("team").has_value());
}

TEST(EntryMetadataTest, ParseRejectsNonObjects) {
    EXPECT_TRUE(EntryMetadata::parse("").has_value());
    EXPECT_TRUE(EntryMetadata::parse("{}").has_value());
    EXPECT_THAT(EntryMetadata::parse("[1,2]"), HasErrorCode(ErrorCode::InvalidData));
    EXPECT_THAT(EntryMetadata::parse("{broken"), HasErrorCode(ErrorCode::InvalidData));
}

TEST(EntryMetadataTest, TypedAccessorsAndUnknownKeys) {
    auto parsed = EntryMetadata::parse(
        R"({"confidence":0.8,"source":"review","tags":["db","perf"],"ticket":"OPS-12"})");
    ASSERT_TRUE(parsed.has_value());
    auto meta = std::move(parsed).value();

    EXPECT_DOUBLE_EQ(meta.confidence().value(), 0.8);
    EXPECT_EQ(meta.source(), "review");
    EXPECT_EQ(meta.tags(), (std::vector<std::string>{"db", "perf"}));
    EXPECT_FALSE(meta.projectSlug().has_value());
    EXPECT_EQ(meta.evolutionCount(), 0);

    meta.setProjectSlug("alpha");
    auto reparsed = EntryMetadata::parse(meta.serialize());
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_EQ(reparsed.value().projectSlug(), "alpha");
    ASSERT_NE(reparsed.value().get("ticket"), nullptr);
    EXPECT_EQ(reparsed.value().get("ticket")->get<std::string>(), "OPS-12");
}

TEST(EntryMetadataTest, WrongTypedValuesReadAsAbsent) {
    auto meta = EntryMetadata::parse(R"({"confidence":"high","source":3})").value();
    EXPECT_FALSE(meta.confidence().has_value());
    EXPECT_FALSE(meta.source().has_value());
}

TEST(EntryMetadataTest, EvolutionHistoryIsCapped) {
    EntryMetadata meta;
    for (int i = 0; i < 12; ++i) {
        EvolutionRecord record;
        record.date = "2024-01-01";
        record.contentPreview = "merge " + std::to_string(i);
        record.contentHash = "h" + std::to_string(i);
        record.similarity = 0.7;
        meta.appendEvolution(record);
    }

    auto history = meta.evolutionHistory();
    ASSERT_EQ(history.size(), EntryMetadata::kMaxEvolutionHistory);
    EXPECT_EQ(history.front().contentHash, "h2");
    EXPECT_EQ(history.back().contentHash, "h11");
}

TEST(KnowledgeEntryTest, ExpiredAtBoundary) {
    KnowledgeEntry entry;
    const auto now = fromEpochMillis(1'700'000'000'000);
    EXPECT_FALSE(entry.isExpired(now));

    entry.expiresAt = now;
    EXPECT_TRUE(entry.isExpired(now));
    EXPECT_FALSE(entry.isExpired(now - 1ms));
}
