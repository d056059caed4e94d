#include "test_helpers.h"
#include <gtest/gtest.h>
#include <lore/metadata/database.h>
#include <lore/vector/vector_index.h>

using namespace lore;
using namespace lore::vector;
using namespace lore::test;

TEST(VectorMathTest, NormalizeProducesUnitLength) {
    std::vector<float> v{3.0f, 4.0f};
    auto unit = normalizeEmbedding(v);
    EXPECT_FLOAT_EQ(unit[0], 0.6f);
    EXPECT_FLOAT_EQ(unit[1], 0.8f);

    std::vector<float> zero{0.0f, 0.0f};
    EXPECT_EQ(normalizeEmbedding(zero), zero);
}

TEST(VectorMathTest, CosineSimilarity) {
    auto a = axisVector(0);
    auto b = axisVector(1);
    EXPECT_NEAR(cosineSimilarity(a, a), 1.0, 1e-9);
    EXPECT_NEAR(cosineSimilarity(a, b), 0.0, 1e-9);
    EXPECT_NEAR(cosineSimilarity(a, vectorWithCosine(0.75)), 0.75, 1e-6);

    std::vector<float> shorter{1.0f};
    EXPECT_DOUBLE_EQ(cosineSimilarity(a, shorter), 0.0);
}

TEST(VectorMathTest, BlobRoundTripPreservesFloats) {
    std::vector<float> v{0.25f, -1.5f, 3.0f};
    auto bytes = asBlob(v);
    std::vector<std::byte> blob(bytes.begin(), bytes.end());
    EXPECT_EQ(blob.size(), v.size() * sizeof(float));
    EXPECT_EQ(fromBlob(blob), v);
}

class ScanVectorIndexTest : public LoreTest {
protected:
    void SetUp() override {
        LoreTest::SetUp();
        ASSERT_TRUE(db_.open((testDir / "vectors.db").string(), metadata::ConnectionMode::Create));
        index_ = std::make_unique<ScanVectorIndex>(db_);
        ASSERT_TRUE(index_->initialize(kTestDim));
    }

    void TearDown() override {
        index_.reset();
        db_.close();
        LoreTest::TearDown();
    }

    metadata::Database db_;
    std::unique_ptr<ScanVectorIndex> index_;
};

TEST_F(ScanVectorIndexTest, RejectsZeroDimension) {
    ScanVectorIndex other(db_);
    EXPECT_THAT(other.initialize(0), HasErrorCode(ErrorCode::InvalidArgument));
}

TEST_F(ScanVectorIndexTest, InsertContainsRemove) {
    ASSERT_TRUE(index_->insert(7, axisVector(0)));
    EXPECT_TRUE(index_->contains(7).value());
    EXPECT_FALSE(index_->contains(8).value());

    EXPECT_TRUE(index_->remove(7).value());
    EXPECT_FALSE(index_->remove(7).value());
    EXPECT_FALSE(index_->contains(7).value());
}

TEST_F(ScanVectorIndexTest, DuplicateIdFails) {
    ASSERT_TRUE(index_->insert(1, axisVector(0)));
    EXPECT_FALSE(index_->insert(1, axisVector(1)).has_value());
}

TEST_F(ScanVectorIndexTest, DimensionMismatch) {
    std::vector<float> wrong(kTestDim - 1, 1.0f);
    EXPECT_THAT(index_->insert(1, wrong), HasErrorCode(ErrorCode::InvalidArgument));
    EXPECT_THAT(index_->search(wrong, 3), HasErrorCode(ErrorCode::InvalidArgument));
}

TEST_F(ScanVectorIndexTest, SearchOrdersByDistanceThenId) {
    ASSERT_TRUE(index_->insert(1, vectorWithCosine(0.5)));
    ASSERT_TRUE(index_->insert(2, vectorWithCosine(0.9)));
    ASSERT_TRUE(index_->insert(3, axisVector(0)));
    ASSERT_TRUE(index_->insert(4, axisVector(0)));
    ASSERT_TRUE(index_->insert(5, axisVector(3)));

    auto hits = index_->search(axisVector(0), 4);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits.value().size(), 4u);
    EXPECT_EQ(hits.value()[0].id, 3);
    EXPECT_EQ(hits.value()[1].id, 4);
    EXPECT_EQ(hits.value()[2].id, 2);
    EXPECT_EQ(hits.value()[3].id, 1);
    EXPECT_NEAR(hits.value()[0].similarity(), 1.0, 1e-6);
    EXPECT_NEAR(hits.value()[2].similarity(), 0.9, 1e-6);

    EXPECT_TRUE(index_->search(axisVector(0), 0).value().empty());
}

TEST(VectorIndexFactoryTest, SelectsBackend) {
    metadata::Database db;
    config::StoreConfig cfg;

    cfg.vectorBackend = config::VectorBackendType::Scan;
    auto scan = createVectorIndex(db, cfg);
    ASSERT_TRUE(scan.has_value());
    EXPECT_STREQ(scan.value()->backendName(), "scan");
    EXPECT_EQ(scan.value()->tableName(), "knowledge_vec_scan");

    cfg.vectorBackend = config::VectorBackendType::SqliteVec;
    auto vec = createVectorIndex(db, cfg);
    ASSERT_TRUE(vec.has_value());
    EXPECT_STREQ(vec.value()->backendName(), "sqlite_vec");

    cfg.vectorBackend = config::VectorBackendType::None;
    EXPECT_THAT(createVectorIndex(db, cfg), HasErrorCode(ErrorCode::NotSupported));
}

TEST_F(ScanVectorIndexTest, MissingExtensionIsNotSupported) {
    SqliteVecIndex vec(db_, (testDir / "no-such-extension.so").string());
    auto result = vec.initialize(kTestDim);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotSupported);
}
