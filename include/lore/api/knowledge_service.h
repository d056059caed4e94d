#pragma once

#include <lore/core/types.h>
#include <lore/dedup/dedup_evolution.h>
#include <lore/lifecycle/lifecycle_manager.h>
#include <lore/metadata/knowledge_entry.h>
#include <lore/metadata/record_store.h>
#include <lore/metadata/store_manager.h>
#include <lore/search/search_engine.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lore::api {

/**
 * @brief Result of a write through the service
 *
 * @c skipped is set when the store is unavailable or the dedup cascade found
 * a duplicate; @c reason says which.
 */
struct WriteOutcome {
    bool skipped = false;
    std::string reason;
    std::optional<EntryId> id;
    std::string contentHash;
    std::optional<dedup::EvolutionAction> action;
    double similarity = 0.0;
};

struct SearchOptions {
    std::optional<std::vector<float>> embedding;
    std::size_t limit = 10;
    std::optional<metadata::Scope> scope; ///< Unset searches global and project stores
    std::vector<std::string> types;
    std::optional<std::string> projectSlug;
    bool trackAccess = true;
};

struct SearchResponse {
    std::vector<search::SearchHit> hits;
    bool degraded = false;
    std::vector<std::string> warnings;
};

struct CleanupOutcome {
    bool skipped = false;
    std::string reason;
    std::size_t deleted = 0;
    std::vector<EntryId> ids;
};

/**
 * @brief Narrow interface for consumers of the knowledge store
 *
 * Nothing here throws. When a store is unavailable or cannot be opened,
 * writes return a skipped outcome and reads return empty results. Reads log
 * and absorb lookup failures; write failures on an open store are returned.
 * A disabled vector capability never causes a skip.
 */
class KnowledgeService {
public:
    explicit KnowledgeService(std::shared_ptr<metadata::StoreManager> stores,
                              search::RankWeights weights = search::RankWeights::defaults(),
                              dedup::DedupConfig dedupConfig = {});

    metadata::Availability isAvailable(metadata::Scope scope) const;

    /**
     * @brief Store an entry as-is; the scope defaults to global
     */
    Result<WriteOutcome> add(const metadata::NewEntry& entry);

    /**
     * @brief Store through the dedup cascade (skip, evolve or create)
     */
    Result<WriteOutcome> ingest(const metadata::NewEntry& entry);

    Result<dedup::BatchSummary> ingestBatch(metadata::Scope scope,
                                            const std::vector<metadata::NewEntry>& entries);

    SearchResponse search(const std::string& query, const SearchOptions& options = {});

    /**
     * @brief Fetch one entry and count the read
     */
    std::optional<metadata::KnowledgeEntry> get(metadata::Scope scope, EntryId id);

    Result<WriteOutcome> update(metadata::Scope scope, EntryId id,
                                const metadata::EntryUpdate& update);

    /**
     * @brief ErrorCode::NotFound when nothing was deleted
     */
    Result<WriteOutcome> remove(metadata::Scope scope, EntryId id);

    std::vector<metadata::KnowledgeEntry> getByType(metadata::Scope scope, const std::string& type,
                                                    int limit = 100);

    Result<CleanupOutcome> cleanup(metadata::Scope scope);

    std::optional<lifecycle::StalenessInfo> staleness(metadata::Scope scope, EntryId id);

    std::vector<lifecycle::TypeAccessStats> stats(metadata::Scope scope,
                                                  const lifecycle::AccessStatsQuery& query = {});

    void close();

private:
    std::shared_ptr<metadata::StoreConnection> connect(metadata::Scope scope, std::string& reason);

    std::shared_ptr<metadata::StoreManager> stores_;
    search::RankWeights weights_;
    dedup::DedupConfig dedupConfig_;
};

} // namespace lore::api
