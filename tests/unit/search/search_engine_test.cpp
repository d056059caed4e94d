#include "test_helpers.h"
#include <gtest/gtest.h>
#include <lore/metadata/record_store.h>
#include <lore/search/search_engine.h>
#include <lore/vector/vector_index.h>

using namespace lore;
using namespace lore::metadata;
using namespace lore::search;
using namespace lore::test;
using namespace std::chrono_literals;

namespace {

// Scan index whose nearest-neighbour query always fails
class FailingSearchIndex : public vector::ScanVectorIndex {
public:
    using ScanVectorIndex::ScanVectorIndex;

    Result<std::vector<vector::VectorMatch>> search(std::span<const float>, std::size_t) override {
        return Error{ErrorCode::Timeout, "vector table locked"};
    }
};

} // namespace

class SearchEngineTest : public StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        conn_ = openGlobal();
        ASSERT_NE(conn_, nullptr);
        records_ = std::make_unique<RecordStore>(conn_);
    }

    void TearDown() override {
        records_.reset();
        conn_.reset();
        StoreTest::TearDown();
    }

    EntryId add(RecordStore& store, const std::string& content, const std::string& type,
                std::optional<std::vector<float>> embedding = std::nullopt,
                std::optional<std::string> projectSlug = std::nullopt) {
        NewEntry entry;
        entry.content = content;
        entry.type = type;
        entry.embedding = std::move(embedding);
        entry.projectSlug = std::move(projectSlug);
        auto result = store.insert(entry);
        if (!result) {
            ADD_FAILURE() << "insert failed: " << result.error().message;
            return 0;
        }
        return result.value().id;
    }

    EntryId add(const std::string& content, const std::string& type,
                std::optional<std::vector<float>> embedding = std::nullopt,
                std::optional<std::string> projectSlug = std::nullopt) {
        return add(*records_, content, type, std::move(embedding), std::move(projectSlug));
    }

    static std::vector<EntryId> ids(const std::vector<ScoredEntry>& rows) {
        std::vector<EntryId> out;
        for (const auto& row : rows) {
            out.push_back(row.entry.id);
        }
        return out;
    }

    std::shared_ptr<StoreConnection> conn_;
    std::unique_ptr<RecordStore> records_;
};

TEST_F(SearchEngineTest, KeywordSearchMatchesAllTokens) {
    auto both = add("enable WAL journal mode for concurrent readers", "lesson");
    add("journal entries are rotated weekly", "summary");
    add("concurrent writers need busy timeouts", "lesson");

    SearchEngine engine(conn_);
    auto rows = engine.keywordSearch("journal concurrent", 10);
    ASSERT_TRUE(rows.has_value()) << rows.error().message;
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(rows.value()[0].entry.id, both);
    EXPECT_EQ(rows.value()[0].rank, 1u);
    EXPECT_LT(rows.value()[0].score, 0.0);
}

TEST_F(SearchEngineTest, KeywordSearchTreatsOperatorsLiterally) {
    auto id = add("use NOT NULL constraints on foreign keys", "lesson");
    add("keys rotate monthly", "summary");

    SearchEngine engine(conn_);
    auto rows = engine.keywordSearch("NOT NULL (keys*", 10);
    ASSERT_TRUE(rows.has_value()) << rows.error().message;
    EXPECT_EQ(ids(rows.value()), std::vector<EntryId>{id});

    auto empty = engine.keywordSearch("** () \"", 10);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(SearchEngineTest, KeywordSearchAppliesFilters) {
    auto lesson = add("index the created_at column", "lesson", std::nullopt, "alpha");
    auto note = add("index rebuild running tonight", "temp_note", std::nullopt, "beta");
    SearchEngine engine(conn_);

    SearchFilter byType;
    byType.types = {"lesson"};
    EXPECT_EQ(ids(engine.keywordSearch("index", 10, byType).value()), std::vector<EntryId>{lesson});

    SearchFilter bySlug;
    bySlug.projectSlug = "beta";
    EXPECT_EQ(ids(engine.keywordSearch("index", 10, bySlug).value()), std::vector<EntryId>{note});

    SearchFilter byScope;
    byScope.scope = Scope::Project;
    EXPECT_TRUE(engine.keywordSearch("index", 10, byScope).value().empty());

    clock.advance(25h);
    EXPECT_EQ(ids(engine.keywordSearch("index", 10).value()), std::vector<EntryId>{lesson});

    SearchFilter withExpired;
    withExpired.includeExpired = true;
    EXPECT_EQ(engine.keywordSearch("index", 10, withExpired).value().size(), 2u);
}

TEST_F(SearchEngineTest, VectorSearchOrdersByCosine) {
    auto exact = add("exact neighbour", "lesson", axisVector(0));
    auto close = add("close neighbour", "lesson", vectorWithCosine(0.8));
    auto far = add("far neighbour", "lesson", axisVector(5));
    add("no vector at all", "lesson");

    SearchEngine engine(conn_);
    auto rows = engine.vectorSearch(axisVector(0), 10);
    ASSERT_TRUE(rows.has_value()) << rows.error().message;
    EXPECT_EQ(ids(rows.value()), (std::vector<EntryId>{exact, close, far}));
    EXPECT_NEAR(rows.value()[1].score, 0.2, 1e-5);

    auto limited = engine.vectorSearch(axisVector(0), 1);
    EXPECT_EQ(ids(limited.value()), std::vector<EntryId>{exact});
}

TEST_F(SearchEngineTest, VectorSearchFiltersAfterRetrieval) {
    add("nearest but ephemeral", "temp_note", axisVector(0));
    auto kept = add("second nearest decision", "decision", vectorWithCosine(0.9));

    SearchEngine engine(conn_);
    SearchFilter filter;
    filter.types = {"decision"};
    auto rows = engine.vectorSearch(axisVector(0), 1, filter);
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(ids(rows.value()), std::vector<EntryId>{kept});

    std::vector<float> wrong(kTestDim + 2, 1.0f);
    EXPECT_THAT(engine.vectorSearch(wrong, 5), HasErrorCode(ErrorCode::InvalidArgument));
}

TEST_F(SearchEngineTest, HybridFusesBothPasses) {
    auto both = add("rollback migrations inside a transaction", "lesson", axisVector(0));
    auto keywordOnly = add("migrations run at startup", "lesson", axisVector(6));
    auto vectorOnly = add("schema changes are atomic", "lesson", vectorWithCosine(0.95));

    SearchEngine engine(conn_);
    SearchRequest request;
    request.query = "migrations";
    request.embedding = axisVector(0);
    request.limit = 3;

    auto outcome = engine.hybridSearch(request);
    EXPECT_FALSE(outcome.degraded);
    EXPECT_TRUE(outcome.warnings.empty());
    ASSERT_EQ(outcome.hits.size(), 3u);
    EXPECT_EQ(outcome.hits[0].entry.id, both);
    EXPECT_EQ(outcome.hits[0].sources.size(), 2u);

    std::vector<EntryId> rest{outcome.hits[1].entry.id, outcome.hits[2].entry.id};
    EXPECT_THAT(rest, ::testing::UnorderedElementsAre(keywordOnly, vectorOnly));
    for (const auto& hit : outcome.hits) {
        EXPECT_DOUBLE_EQ(hit.finalScore, hit.rrfScore * hit.typeWeight * hit.accessBoost);
    }
}

TEST_F(SearchEngineTest, DecisionOutranksTopKeywordNote) {
    add("deploy deploy deploy checklist", "temp_note");
    add("deploy window notes", "summary");
    auto decision = add("we deploy with blue green switching across the whole fleet", "decision");

    SearchEngine engine(conn_);
    SearchRequest request;
    request.query = "deploy";
    auto outcome = engine.hybridSearch(request);
    ASSERT_EQ(outcome.hits.size(), 3u);
    EXPECT_EQ(outcome.hits[0].entry.id, decision);
    EXPECT_EQ(outcome.hits[2].entry.type, "temp_note");
}

TEST_F(SearchEngineTest, HybridIsDeterministic) {
    for (int i = 0; i < 6; ++i) {
        add("shared term entry " + std::to_string(i), i % 2 ? "lesson" : "decision",
            vectorWithCosine(0.5 + 0.05 * i));
    }
    SearchEngine engine(conn_);
    SearchRequest request;
    request.query = "shared term";
    request.embedding = axisVector(0);
    request.limit = 4;

    auto first = engine.hybridSearch(request);
    auto second = engine.hybridSearch(request);
    ASSERT_EQ(first.hits.size(), second.hits.size());
    for (std::size_t i = 0; i < first.hits.size(); ++i) {
        EXPECT_EQ(first.hits[i].entry.id, second.hits[i].entry.id);
        EXPECT_DOUBLE_EQ(first.hits[i].finalScore, second.hits[i].finalScore);
    }
}

TEST_F(SearchEngineTest, FailingVectorPassDegradesToKeyword) {
    auto cfg = makeConfig();
    cfg.globalDir = testDir / "degraded";
    cfg.vectorIndexFactory = [](Database& db, const config::StoreConfig&)
        -> Result<std::unique_ptr<vector::IVectorIndex>> {
        return std::unique_ptr<vector::IVectorIndex>(std::make_unique<FailingSearchIndex>(db));
    };
    StoreManager degradedManager(cfg);
    auto conn = degradedManager.open(Scope::Global);
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    ASSERT_TRUE(conn.value()->vectorEnabled);

    RecordStore store(conn.value());
    auto id = add(store, "retry on SQLITE_BUSY with backoff", "lesson", axisVector(0));

    SearchEngine engine(conn.value());
    SearchRequest request;
    request.query = "backoff";
    request.embedding = axisVector(0);

    auto outcome = engine.hybridSearch(request);
    EXPECT_TRUE(outcome.degraded);
    ASSERT_EQ(outcome.warnings.size(), 1u);
    EXPECT_NE(outcome.warnings[0].find("vector"), std::string::npos);
    ASSERT_EQ(outcome.hits.size(), 1u);
    EXPECT_EQ(outcome.hits[0].entry.id, id);
    EXPECT_EQ(outcome.hits[0].sources, std::vector<SearchSource>{SearchSource::Keyword});
}

TEST_F(SearchEngineTest, MissingKeywordIndexDegradesToVector) {
    auto id = add("vector only survivor", "lesson", axisVector(0));
    conn_->ftsEnabled = false;

    SearchEngine engine(conn_);
    EXPECT_THAT(engine.keywordSearch("survivor", 5), HasErrorCode(ErrorCode::NotSupported));

    SearchRequest request;
    request.query = "survivor";
    request.embedding = axisVector(0);
    auto outcome = engine.hybridSearch(request);
    EXPECT_TRUE(outcome.degraded);
    ASSERT_EQ(outcome.hits.size(), 1u);
    EXPECT_EQ(outcome.hits[0].entry.id, id);
}

TEST_F(SearchEngineTest, EmptyRequestsReturnNothing) {
    add("something searchable", "lesson", axisVector(0));
    SearchEngine engine(conn_);

    SearchRequest blank;
    blank.query = "   ";
    auto outcome = engine.hybridSearch(blank);
    EXPECT_TRUE(outcome.hits.empty());
    EXPECT_FALSE(outcome.degraded);

    SearchRequest zero;
    zero.query = "something";
    zero.limit = 0;
    EXPECT_TRUE(engine.hybridSearch(zero).hits.empty());
}
