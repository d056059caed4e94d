#pragma once

#include <lore/config/store_config.h>
#include <lore/core/types.h>
#include <lore/metadata/database.h>
#include <lore/metadata/knowledge_entry.h>
#include <lore/vector/vector_index.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lore::metadata {

/**
 * @brief An open knowledge store
 *
 * Shared by every component operating on the same file. All use of the
 * SQLite handle goes through @c mutex.
 */
struct StoreConnection {
    Scope scope = Scope::Global;
    std::filesystem::path path;
    config::StoreConfig config;

    Database db;
    std::unique_ptr<vector::IVectorIndex> vectorIndex;

    bool ftsEnabled = false;
    bool vectorEnabled = false;
    std::size_t embeddingDim = 0;

    mutable std::recursive_mutex mutex;

    TimePoint now() const { return config.now(); }
};

/**
 * @brief Result of a dependency probe
 */
struct Availability {
    bool available = false;
    std::string reason;
};

/**
 * @brief Resolves, opens and caches knowledge stores
 *
 * One instance is owned by the application root and handed to consumers.
 * Connections are cached per resolved path; a second open of the same path
 * returns the cached handle.
 */
class StoreManager {
public:
    explicit StoreManager(config::StoreConfig config = {});
    ~StoreManager();

    StoreManager(const StoreManager&) = delete;
    StoreManager& operator=(const StoreManager&) = delete;

    /**
     * @brief Database file for a scope
     *
     * Global: <globalDir>/<user>.db. Project: <projectRoot>/.lore/knowledge/<user>.db.
     */
    std::filesystem::path resolvePath(Scope scope) const;

    /**
     * @brief Probe SQLite capabilities and directory writability without opening
     */
    Availability isAvailable(Scope scope) const;

    /**
     * @brief Open (or return the cached) store for a scope
     *
     * Fails with ErrorCode::CorruptedData when the file is damaged or is not a
     * database. A missing vector capability is not an error; the connection
     * reports vectorEnabled == false.
     */
    Result<std::shared_ptr<StoreConnection>> open(Scope scope);

    Result<std::shared_ptr<StoreConnection>> openPath(const std::filesystem::path& path,
                                                      Scope scope);

    /**
     * @brief Evict a connection; the handle closes when the last holder releases it
     */
    void close(const std::shared_ptr<StoreConnection>& conn);

    void closeAll();

    std::size_t openCount() const;

    const config::StoreConfig& config() const { return config_; }

    /**
     * @brief OS account name used in store file names
     */
    std::string username() const;

private:
    Result<std::shared_ptr<StoreConnection>> openUncached(const std::filesystem::path& path,
                                                          Scope scope);
    Result<void> configureConnection(StoreConnection& conn);
    Result<void> pinEmbeddingDimension(StoreConnection& conn);
    void initializeVectorIndex(StoreConnection& conn);

    config::StoreConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<StoreConnection>> connections_;
};

} // namespace lore::metadata
