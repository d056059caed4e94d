#include "test_helpers.h"
#include <gtest/gtest.h>
#include <lore/crypto/hasher.h>
#include <lore/lifecycle/lifecycle_manager.h>
#include <lore/metadata/record_store.h>
#include <lore/vector/vector_index.h>

using namespace lore;
using namespace lore::metadata;
using namespace lore::test;
using namespace std::chrono_literals;

namespace {

int64_t countRows(Database& db, const std::string& table) {
    auto prepared = db.prepare("SELECT COUNT(*) FROM " + table);
    if (!prepared) {
        ADD_FAILURE() << "prepare failed for " << table << ": " << prepared.error().message;
        return -1;
    }
    auto stmt = std::move(prepared).value();
    if (!stmt.step().value_or(false)) {
        ADD_FAILURE() << "count query returned no row for " << table;
        return -1;
    }
    return stmt.getInt64(0);
}

// Accepts the write but never stores the row
class DroppingVectorIndex : public vector::ScanVectorIndex {
public:
    using ScanVectorIndex::ScanVectorIndex;
    Result<void> insert(EntryId, std::span<const float>) override { return {}; }
};

class RejectingVectorIndex : public vector::ScanVectorIndex {
public:
    using ScanVectorIndex::ScanVectorIndex;
    Result<void> insert(EntryId, std::span<const float>) override {
        return Error{ErrorCode::DatabaseError, "vector table is read-only"};
    }
};

template <typename Index> config::StoreConfig withIndex(config::StoreConfig cfg) {
    cfg.vectorIndexFactory = [](Database& db, const config::StoreConfig&)
        -> Result<std::unique_ptr<vector::IVectorIndex>> {
        return std::unique_ptr<vector::IVectorIndex>(std::make_unique<Index>(db));
    };
    return cfg;
}

} // namespace

class RecordStoreTest : public StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        conn_ = openGlobal();
        ASSERT_NE(conn_, nullptr);
        store_ = std::make_unique<RecordStore>(conn_);
    }

    void TearDown() override {
        store_.reset();
        conn_.reset();
        StoreTest::TearDown();
    }

    EntryId add(const std::string& content, const std::string& type,
                std::optional<std::vector<float>> embedding = std::nullopt) {
        NewEntry entry;
        entry.content = content;
        entry.type = type;
        entry.embedding = std::move(embedding);
        auto result = store_->insert(entry);
        if (!result) {
            ADD_FAILURE() << "insert failed: " << result.error().message;
            return 0;
        }
        return result.value().id;
    }

    std::shared_ptr<StoreConnection> conn_;
    std::unique_ptr<RecordStore> store_;
};

TEST_F(RecordStoreTest, InsertAndGet) {
    NewEntry entry;
    entry.content = "Use BEGIN IMMEDIATE for writers";
    entry.type = "lesson";
    entry.metadata.setConfidence(0.9);
    entry.metadata.setTags({"sqlite"});
    entry.projectSlug = "alpha";
    entry.embedding = axisVector(2);

    auto inserted = store_->insert(entry);
    ASSERT_TRUE(inserted.has_value()) << inserted.error().message;
    EXPECT_GT(inserted.value().id, 0);
    EXPECT_TRUE(inserted.value().vectorStored);
    EXPECT_EQ(inserted.value().contentHash,
              crypto::sha256Hex("Use BEGIN IMMEDIATE for writers").value());

    auto fetched = store_->get(inserted.value().id);
    ASSERT_TRUE(fetched.has_value());
    ASSERT_TRUE(fetched.value().has_value());
    const auto& stored = *fetched.value();
    EXPECT_EQ(stored.content, entry.content);
    EXPECT_EQ(stored.type, "lesson");
    EXPECT_EQ(stored.scope, Scope::Global);
    EXPECT_EQ(stored.createdAt, clock.now());
    EXPECT_FALSE(stored.expiresAt.has_value());
    EXPECT_EQ(stored.ttlCategory, TtlCategory::Permanent);
    EXPECT_EQ(stored.accessCount, 0);
    EXPECT_FALSE(stored.lastAccessed.has_value());
    EXPECT_EQ(stored.projectSlug, "alpha");
    EXPECT_EQ(stored.metadata.projectSlug(), "alpha");
    EXPECT_DOUBLE_EQ(stored.metadata.confidence().value(), 0.9);
    EXPECT_EQ(stored.metadata.tags(), std::vector<std::string>{"sqlite"});

    EXPECT_TRUE(conn_->vectorIndex->contains(stored.id).value());
}

TEST_F(RecordStoreTest, GetMissingIsEmpty) {
    auto fetched = store_->get(4242);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_FALSE(fetched.value().has_value());
}

TEST_F(RecordStoreTest, RejectsInvalidSubmissions) {
    NewEntry empty;
    empty.type = "lesson";
    EXPECT_THAT(store_->insert(empty), HasErrorCode(ErrorCode::InvalidArgument));

    NewEntry untyped;
    untyped.content = "text";
    EXPECT_THAT(store_->insert(untyped), HasErrorCode(ErrorCode::InvalidArgument));

    NewEntry wrongDim;
    wrongDim.content = "text";
    wrongDim.type = "lesson";
    wrongDim.embedding = std::vector<float>(kTestDim + 1, 0.5f);
    EXPECT_THAT(store_->insert(wrongDim), HasErrorCode(ErrorCode::InvalidArgument));
    EXPECT_EQ(store_->count().value(), 0);
}

TEST_F(RecordStoreTest, EphemeralEntriesExpireAfterADay) {
    auto id = add("retry the deploy after lunch", "temp_note");
    auto stored = store_->get(id).value();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->ttlCategory, TtlCategory::Ephemeral);
    EXPECT_EQ(stored->expiresAt, clock.now() + 24h);
}

TEST_F(RecordStoreTest, ExplicitCategoryOverridesTypeDefault) {
    NewEntry entry;
    entry.content = "freeze API until release";
    entry.type = "decision";
    entry.ttlCategory = TtlCategory::ShortTerm;
    auto id = store_->insert(entry).value().id;
    auto stored = store_->get(id).value();
    EXPECT_EQ(stored->ttlCategory, TtlCategory::ShortTerm);
    EXPECT_EQ(stored->expiresAt, clock.now() + 24h * 7);
}

TEST_F(RecordStoreTest, HashLookupsAndExpiryFilter) {
    auto id = add("cache warms in ten minutes", "temp_note");
    auto hash = crypto::sha256Hex("cache warms in ten minutes").value();

    auto byHash = store_->getByHash(hash);
    ASSERT_TRUE(byHash.has_value());
    ASSERT_TRUE(byHash.value().has_value());
    EXPECT_EQ(byHash.value()->id, id);

    auto meta = store_->get(id).value()->metadata;
    meta.setCanonicalHash("canon-1");
    EntryUpdate update;
    update.metadata = meta;
    ASSERT_TRUE(store_->update(id, update).has_value());

    EXPECT_TRUE(store_->getByCanonicalHash("canon-1").value().has_value());

    clock.advance(25h);
    EXPECT_FALSE(store_->getByCanonicalHash("canon-1").value().has_value());
    // Exact-hash reads still see expired rows until cleanup runs
    EXPECT_TRUE(store_->getByHash(hash).value().has_value());
}

TEST_F(RecordStoreTest, FindsEvolvedHashes) {
    auto id = add("prefer small pull requests", "lesson");
    auto meta = store_->get(id).value()->metadata;
    EvolutionRecord record;
    record.date = "2024-03-01";
    record.contentPreview = "keep PRs small";
    record.contentHash = "merged-content";
    record.canonicalHash = "merged-canonical";
    record.similarity = 0.7;
    meta.appendEvolution(record);

    EntryUpdate update;
    update.metadata = meta;
    ASSERT_TRUE(store_->update(id, update).has_value());

    auto byContent = store_->findByEvolvedHash("merged-content");
    ASSERT_TRUE(byContent.has_value());
    ASSERT_TRUE(byContent.value().has_value());
    EXPECT_EQ(byContent.value()->id, id);
    EXPECT_TRUE(store_->findByEvolvedHash("merged-canonical").value().has_value());
    EXPECT_FALSE(store_->findByEvolvedHash("unrelated").value().has_value());
}

TEST_F(RecordStoreTest, GetByTypeOrdersByAccessThenRecency) {
    auto older = add("decision one", "decision");
    clock.advance(1min);
    auto newer = add("decision two", "decision");
    clock.advance(1min);
    auto popular = add("decision three", "decision");
    add("unrelated lesson", "lesson");

    ASSERT_TRUE(conn_->db.execute("UPDATE knowledge SET access_count = 5 WHERE id = " +
                                  std::to_string(popular)));

    auto entries = store_->getByType("decision");
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries.value().size(), 3u);
    EXPECT_EQ(entries.value()[0].id, popular);
    EXPECT_EQ(entries.value()[1].id, newer);
    EXPECT_EQ(entries.value()[2].id, older);

    TypeQuery limited;
    limited.limit = 1;
    EXPECT_EQ(store_->getByType("decision", limited).value().size(), 1u);

    TypeQuery projectOnly;
    projectOnly.scope = Scope::Project;
    EXPECT_TRUE(store_->getByType("decision", projectOnly).value().empty());
}

TEST_F(RecordStoreTest, UpdateRecomputesHashAndExpiry) {
    auto id = add("initial summary", "summary");
    clock.advance(2h);

    EntryUpdate update;
    update.content = "revised summary";
    update.type = "temp_note";
    auto updated = store_->update(id, update);
    ASSERT_TRUE(updated.has_value()) << updated.error().message;
    EXPECT_EQ(updated.value().content, "revised summary");
    EXPECT_EQ(updated.value().contentHash, crypto::sha256Hex("revised summary").value());
    EXPECT_EQ(updated.value().ttlCategory, TtlCategory::Ephemeral);
    EXPECT_EQ(updated.value().expiresAt, clock.now() + 24h);

    EntryUpdate promote;
    promote.ttlCategory = TtlCategory::Permanent;
    auto promoted = store_->update(id, promote);
    ASSERT_TRUE(promoted.has_value());
    EXPECT_FALSE(promoted.value().expiresAt.has_value());
    EXPECT_EQ(promoted.value().type, "temp_note");
}

TEST_F(RecordStoreTest, UpdateRejections) {
    auto id = add("immutable vector", "lesson", axisVector(1));

    EntryUpdate withEmbedding;
    withEmbedding.embedding = axisVector(3);
    EXPECT_THAT(store_->update(id, withEmbedding), HasErrorCode(ErrorCode::NotSupported));

    EntryUpdate blank;
    blank.content = "";
    EXPECT_THAT(store_->update(id, blank), HasErrorCode(ErrorCode::InvalidArgument));

    EntryUpdate content;
    content.content = "anything";
    EXPECT_THAT(store_->update(9999, content), HasErrorCode(ErrorCode::NotFound));
}

TEST_F(RecordStoreTest, RemoveDeletesRecordAndVector) {
    auto id = add("drop me", "lesson", axisVector(0));
    ASSERT_TRUE(conn_->vectorIndex->contains(id).value());

    auto removed = store_->remove(id);
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(removed.value());
    EXPECT_FALSE(store_->get(id).value().has_value());
    EXPECT_FALSE(conn_->vectorIndex->contains(id).value());

    auto again = store_->remove(id);
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again.value());
}

TEST_F(RecordStoreTest, RefreshTTLExtendsFromNow) {
    auto id = add("short lived", "summary");
    clock.advance(24h * 3);

    auto refreshed = store_->refreshTTL(id);
    ASSERT_TRUE(refreshed.has_value());
    EXPECT_EQ(refreshed.value(), clock.now() + 24h * 7);

    auto permanent = store_->refreshTTL(id, TtlCategory::Permanent);
    ASSERT_TRUE(permanent.has_value());
    EXPECT_FALSE(permanent.value().has_value());
    EXPECT_EQ(store_->get(id).value()->ttlCategory, TtlCategory::Permanent);

    EXPECT_THAT(store_->refreshTTL(777), HasErrorCode(ErrorCode::NotFound));
}

TEST_F(RecordStoreTest, BackfillMissingEmbeddings) {
    auto withVector = add("has vector", "lesson", axisVector(0));
    auto without = add("needs vector", "lesson");

    auto missing = store_->listMissingEmbeddings();
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing.value(), std::vector<EntryId>{without});

    ASSERT_TRUE(store_->attachEmbedding(without, axisVector(4)));
    EXPECT_TRUE(store_->listMissingEmbeddings().value().empty());

    EXPECT_THAT(store_->attachEmbedding(withVector, axisVector(5)),
                HasErrorCode(ErrorCode::NotSupported));
    EXPECT_THAT(store_->attachEmbedding(31337, axisVector(5)), HasErrorCode(ErrorCode::NotFound));
}

TEST_F(RecordStoreTest, KeywordOnlyStoreDropsEmbeddings) {
    auto cfg = makeConfig();
    cfg.globalDir = testDir / "keyword-only";
    cfg.vectorBackend = config::VectorBackendType::None;
    StoreManager keywordOnly(cfg);
    auto conn = keywordOnly.open(Scope::Global);
    ASSERT_TRUE(conn.has_value());

    RecordStore store(conn.value());
    NewEntry entry;
    entry.content = "vectors unavailable";
    entry.type = "lesson";
    entry.embedding = axisVector(0);
    auto inserted = store.insert(entry);
    ASSERT_TRUE(inserted.has_value());
    EXPECT_FALSE(inserted.value().vectorStored);
    EXPECT_TRUE(store.listMissingEmbeddings().value().empty());
    EXPECT_THAT(store.attachEmbedding(inserted.value().id, axisVector(0)),
                HasErrorCode(ErrorCode::NotSupported));
}

TEST_F(RecordStoreTest, RemoveWithoutVectorIndexDropsStoredVector) {
    auto id = add("vector written by an earlier session", "lesson", axisVector(4));
    ASSERT_EQ(countRows(conn_->db, "knowledge_vec_scan"), 1);
    store_.reset();
    conn_.reset();
    manager->closeAll();

    auto cfg = makeConfig();
    cfg.vectorBackend = config::VectorBackendType::None;
    StoreManager keywordOnly(cfg);
    auto conn = keywordOnly.open(Scope::Global);
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    ASSERT_FALSE(conn.value()->vectorEnabled);

    RecordStore records(conn.value());
    auto removed = records.remove(id);
    ASSERT_TRUE(removed.has_value()) << removed.error().message;
    EXPECT_TRUE(removed.value());
    EXPECT_EQ(countRows(conn.value()->db, "knowledge"), 0);
    EXPECT_EQ(countRows(conn.value()->db, "knowledge_vec_scan"), 0);
}

TEST_F(RecordStoreTest, SweepWithoutVectorIndexDropsStoredVector) {
    add("scratch vector note", "temp_note", axisVector(5));
    ASSERT_EQ(countRows(conn_->db, "knowledge_vec_scan"), 1);
    store_.reset();
    conn_.reset();
    manager->closeAll();
    clock.advance(25h);

    auto cfg = makeConfig();
    cfg.vectorBackend = config::VectorBackendType::None;
    cfg.cleanupOnOpen = false;
    StoreManager keywordOnly(cfg);
    auto conn = keywordOnly.open(Scope::Global);
    ASSERT_TRUE(conn.has_value()) << conn.error().message;

    lifecycle::LifecycleManager lifecycle(conn.value());
    auto swept = lifecycle.cleanupExpired();
    ASSERT_TRUE(swept.has_value()) << swept.error().message;
    EXPECT_EQ(countRows(conn.value()->db, "knowledge"), 0);
    EXPECT_EQ(countRows(conn.value()->db, "knowledge_vec_scan"), 0);
}

TEST_F(RecordStoreTest, SilentlyDroppedVectorRollsBackInsert) {
    auto cfg = withIndex<DroppingVectorIndex>(makeConfig());
    cfg.username = "dropping";
    StoreManager other(cfg);
    auto conn = other.open(Scope::Global);
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    RecordStore records(conn.value());

    NewEntry entry;
    entry.content = "vector never lands";
    entry.type = "lesson";
    entry.embedding = axisVector(1);
    EXPECT_THAT(records.insert(entry), HasErrorCode(ErrorCode::CorruptedData));
    EXPECT_EQ(records.count().value(), 0);
    EXPECT_EQ(countRows(conn.value()->db, "knowledge_fts"), 0);
}

TEST_F(RecordStoreTest, FailingVectorWriteRollsBackInsert) {
    auto cfg = withIndex<RejectingVectorIndex>(makeConfig());
    cfg.username = "rejecting";
    StoreManager other(cfg);
    auto conn = other.open(Scope::Global);
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    RecordStore records(conn.value());

    NewEntry entry;
    entry.content = "vector write refused";
    entry.type = "lesson";
    entry.embedding = axisVector(1);
    EXPECT_THAT(records.insert(entry), HasErrorCode(ErrorCode::DatabaseError));
    EXPECT_EQ(records.count().value(), 0);

    entry.embedding.reset();
    auto plain = records.insert(entry);
    ASSERT_TRUE(plain.has_value()) << plain.error().message;
    EXPECT_FALSE(plain.value().vectorStored);
    EXPECT_EQ(records.count().value(), 1);
}

TEST_F(RecordStoreTest, UnexpiredHashLookupSkipsExpiredCopies) {
    auto expired = add("same text twice", "temp_note");
    clock.advance(25h);
    auto live = add("same text twice", "decision");
    const auto hash = crypto::sha256Hex("same text twice").value();

    auto any = store_->getByHash(hash);
    ASSERT_TRUE(any.has_value());
    ASSERT_TRUE(any.value().has_value());
    EXPECT_EQ(any.value()->id, expired);

    auto unexpired = store_->getUnexpiredByHash(hash);
    ASSERT_TRUE(unexpired.has_value());
    ASSERT_TRUE(unexpired.value().has_value());
    EXPECT_EQ(unexpired.value()->id, live);

    clock.advance(24h * 91);
    EXPECT_FALSE(store_->getUnexpiredByHash(hash).value().has_value());
}
