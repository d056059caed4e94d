#pragma once

#include <lore/core/types.h>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace lore::metadata {
class Database;
}

namespace lore::vector {
class IVectorIndex;
}

namespace lore::config {

/**
 * @brief Vector index implementation selected at open time
 */
enum class VectorBackendType {
    SqliteVec, ///< sqlite-vec vec0 virtual table (runtime-loaded extension)
    Scan,      ///< Plain BLOB table with exact cosine scan
    None       ///< Keyword-only store
};

const char* vectorBackendToString(VectorBackendType type);
Result<VectorBackendType> parseVectorBackend(std::string_view name);

struct StoreConfig;

using Clock = std::function<TimePoint()>;
using VectorIndexFactory = std::function<Result<std::unique_ptr<vector::IVectorIndex>>(
    metadata::Database&, const StoreConfig&)>;

/**
 * @brief Runtime configuration for knowledge stores
 *
 * Read from the [knowledge] section of config.toml with environment overrides.
 * The clock and vector index factory are programmatic hooks only.
 */
struct StoreConfig {
    std::filesystem::path globalDir;   ///< Empty: resolved from env/XDG
    std::filesystem::path projectRoot; ///< Empty: current working directory
    std::string username;              ///< Empty: OS account name

    std::chrono::milliseconds busyTimeout{5000};
    int cacheSizeKb = 10000;
    std::size_t embeddingDim = 512;

    VectorBackendType vectorBackend = VectorBackendType::SqliteVec;
    std::string vectorExtension = "vec0";

    double rrfK = 60.0;
    bool cleanupOnOpen = true;
    std::string logLevel; ///< Empty leaves the process-wide spdlog level unchanged

    Clock clock;
    VectorIndexFactory vectorIndexFactory;

    TimePoint now() const { return clock ? clock() : std::chrono::system_clock::now(); }
};

/**
 * @brief Load configuration
 *
 * Precedence: defaults, then config.toml [knowledge], then LORE_DATA_DIR and
 * LORE_VECTOR_EXTENSION. An empty path resolves via get_config_path().
 * Malformed numeric values return ErrorCode::InvalidArgument.
 */
Result<StoreConfig> loadStoreConfig(const std::filesystem::path& configPath = {});

} // namespace lore::config
