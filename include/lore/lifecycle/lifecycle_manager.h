#pragma once

#include <lore/core/types.h>
#include <lore/metadata/knowledge_entry.h>
#include <lore/metadata/store_manager.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lore::lifecycle {

/// Staleness window for entries without a TTL
inline constexpr std::chrono::hours kPermanentStalenessWindow{24 * 365};

struct CleanupResult {
    std::size_t deleted = 0;
    std::vector<EntryId> ids;
};

struct StalenessInfo {
    double score = 0.0; ///< 0 = just accessed, 1 = a full TTL window untouched
    Duration sinceLastAccess{0};
    metadata::TtlCategory ttlCategory = metadata::TtlCategory::ShortTerm;
};

struct AccessStatsQuery {
    std::optional<metadata::Scope> scope;
    std::optional<std::string> type;
};

/**
 * @brief Access aggregates for one entry type
 */
struct TypeAccessStats {
    std::string type;
    int64_t count = 0;
    int64_t totalAccess = 0;
    double avgAccess = 0.0;
    int64_t maxAccess = 0;
    std::optional<TimePoint> lastAccessed;
};

/**
 * @brief Expiry sweep, access counters and staleness for one store
 *
 * All timestamps come from the connection's clock.
 */
class LifecycleManager {
public:
    explicit LifecycleManager(std::shared_ptr<metadata::StoreConnection> conn);

    /**
     * @brief Delete every entry with expires_at <= now, vector rows included
     *
     * Runs in a single IMMEDIATE transaction.
     */
    Result<CleanupResult> cleanupExpired();

    /**
     * @brief Increment access_count and stamp last_accessed
     * @return false when no entry has @p id
     */
    Result<bool> trackAccess(EntryId id);

    /**
     * @brief trackAccess for many ids in one transaction
     * @return number of entries updated
     */
    Result<std::size_t> trackAccessBatch(const std::vector<EntryId>& ids);

    /**
     * @brief clamp(elapsed since last access / TTL window, 0, 1)
     *
     * Entries never accessed measure from created_at. Permanent entries use
     * kPermanentStalenessWindow.
     */
    Result<StalenessInfo> getStalenessScore(EntryId id);

    /**
     * @brief Per-type access aggregates, ordered by type name
     */
    Result<std::vector<TypeAccessStats>> getAccessStats(const AccessStatsQuery& query = {});

private:
    std::shared_ptr<metadata::StoreConnection> conn_;
};

/**
 * @brief Pure staleness computation used by getStalenessScore()
 */
double computeStaleness(metadata::TtlCategory category, Duration sinceLastAccess);

} // namespace lore::lifecycle
