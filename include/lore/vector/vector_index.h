#pragma once

#include <lore/config/store_config.h>
#include <lore/core/types.h>
#include <lore/metadata/database.h>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace lore::vector {

/**
 * @brief Nearest-neighbour hit; distance is cosine distance in [0, 2]
 */
struct VectorMatch {
    EntryId id = 0;
    double distance = 0.0;

    double similarity() const { return 1.0 - distance; }
};

/**
 * @brief Vector rows keyed by the knowledge row id
 *
 * Implementations share the connection owned by the store. They never open
 * transactions themselves; callers pair vector writes with record writes.
 */
class IVectorIndex {
public:
    virtual ~IVectorIndex() = default;

    /**
     * @brief Register the backend with the connection and create its table
     */
    virtual Result<void> initialize(std::size_t dimension) = 0;

    virtual Result<void> insert(EntryId id, std::span<const float> embedding) = 0;
    virtual Result<bool> remove(EntryId id) = 0;
    virtual Result<bool> contains(EntryId id) = 0;

    /**
     * @brief k nearest rows ordered by ascending distance, ties by id
     */
    virtual Result<std::vector<VectorMatch>> search(std::span<const float> query,
                                                    std::size_t k) = 0;

    /**
     * @brief Table whose rowid mirrors knowledge.id
     */
    virtual std::string tableName() const = 0;

    virtual const char* backendName() const = 0;

    virtual std::size_t dimension() const = 0;
};

/**
 * @brief sqlite-vec vec0 virtual table, extension loaded at runtime
 */
class SqliteVecIndex : public IVectorIndex {
public:
    SqliteVecIndex(metadata::Database& db, std::string extensionPath);

    Result<void> initialize(std::size_t dimension) override;
    Result<void> insert(EntryId id, std::span<const float> embedding) override;
    Result<bool> remove(EntryId id) override;
    Result<bool> contains(EntryId id) override;
    Result<std::vector<VectorMatch>> search(std::span<const float> query, std::size_t k) override;

    std::string tableName() const override { return "knowledge_vec"; }
    const char* backendName() const override { return "sqlite_vec"; }
    std::size_t dimension() const override { return dimension_; }

private:
    Result<void> loadExtension();
    Result<bool> moduleRegistered();

    metadata::Database& db_;
    std::string extensionPath_;
    std::size_t dimension_ = 0;
};

/**
 * @brief Plain BLOB table searched by exact cosine scan
 *
 * Needs no extension; suited to small stores and tests.
 */
class ScanVectorIndex : public IVectorIndex {
public:
    static constexpr const char* kTableName = "knowledge_vec_scan";

    explicit ScanVectorIndex(metadata::Database& db);

    Result<void> initialize(std::size_t dimension) override;
    Result<void> insert(EntryId id, std::span<const float> embedding) override;
    Result<bool> remove(EntryId id) override;
    Result<bool> contains(EntryId id) override;
    Result<std::vector<VectorMatch>> search(std::span<const float> query, std::size_t k) override;

    std::string tableName() const override { return kTableName; }
    const char* backendName() const override { return "scan"; }
    std::size_t dimension() const override { return dimension_; }

protected:
    metadata::Database& db_;
    std::size_t dimension_ = 0;
};

/**
 * @brief Build the index selected by config.vectorBackend
 *
 * VectorBackendType::None yields ErrorCode::NotSupported.
 */
Result<std::unique_ptr<IVectorIndex>> createVectorIndex(metadata::Database& db,
                                                        const config::StoreConfig& config);

/**
 * @brief Delete vector rows whose knowledge row no longer exists
 * @return number of rows removed
 */
Result<int> pruneOrphanVectors(metadata::Database& db, IVectorIndex& index);

/**
 * @brief Drop the vector row of @p id on a store opened without a vector index
 *
 * Only the scan table is a plain table that can be edited without its
 * backend; a vec0 table left behind is reconciled by pruneOrphanVectors()
 * the next time the extension loads.
 */
Result<void> removeDetachedVector(metadata::Database& db, EntryId id);

/**
 * @brief L2-normalise; vectors with norm below 1e-12 are returned unchanged
 */
std::vector<float> normalizeEmbedding(std::span<const float> embedding);

double cosineSimilarity(std::span<const float> a, std::span<const float> b);

std::span<const std::byte> asBlob(std::span<const float> embedding);
std::vector<float> fromBlob(const std::vector<std::byte>& blob);

} // namespace lore::vector
