#pragma once

#include <lore/core/types.h>
#include <lore/metadata/database.h>
#include <lore/metadata/knowledge_entry.h>
#include <lore/metadata/store_manager.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lore::metadata {

/**
 * @brief Submission for a new entry
 */
struct NewEntry {
    std::string content;
    std::string type;
    std::optional<Scope> scope;              ///< Defaults to the connection's scope
    std::optional<TtlCategory> ttlCategory;  ///< Defaults to defaultTtlForType(type)
    std::optional<std::string> projectSlug;  ///< Falls back to metadata.project_slug
    EntryMetadata metadata;
    std::optional<std::vector<float>> embedding;
};

struct InsertResult {
    EntryId id = 0;
    std::string contentHash;
    bool vectorStored = false;
};

/**
 * @brief Partial update; unset fields keep their stored value
 *
 * Setting @c embedding is rejected: stored vectors are immutable.
 */
struct EntryUpdate {
    std::optional<std::string> content;
    std::optional<std::string> type;
    std::optional<TtlCategory> ttlCategory;
    std::optional<EntryMetadata> metadata;
    std::optional<std::vector<float>> embedding;
};

struct TypeQuery {
    std::optional<Scope> scope;
    int limit = 100;
    bool includeExpired = false;
};

/**
 * @brief Column list matching readEntryRow()
 */
inline constexpr const char* kEntryColumns =
    "k.id, k.content, k.type, k.scope, k.created_at, k.expires_at, k.access_count, "
    "k.last_accessed, k.content_hash, k.ttl_category, k.project_slug, k.metadata";

inline constexpr int kEntryColumnCount = 12;

/**
 * @brief Decode a row selected with kEntryColumns starting at @p firstColumn
 */
KnowledgeEntry readEntryRow(const Statement& stmt, int firstColumn = 0);

/**
 * @brief Persistence of knowledge records and their paired vector rows
 *
 * Writes run in one BEGIN IMMEDIATE transaction; a record and its vector row
 * are created and destroyed together and their ids are checked right after
 * every write.
 */
class RecordStore {
public:
    explicit RecordStore(std::shared_ptr<StoreConnection> conn);

    Result<InsertResult> insert(const NewEntry& entry);

    Result<std::optional<KnowledgeEntry>> get(EntryId id);
    Result<std::optional<KnowledgeEntry>> getByHash(const std::string& contentHash);

    /**
     * @brief Oldest unexpired entry with this content hash
     *
     * Unlike getByHash(), an expired copy awaiting the sweep never hides a live one.
     */
    Result<std::optional<KnowledgeEntry>> getUnexpiredByHash(const std::string& contentHash);

    /**
     * @brief Unexpired entry whose metadata.canonical_hash matches
     */
    Result<std::optional<KnowledgeEntry>> getByCanonicalHash(const std::string& canonicalHash);

    /**
     * @brief Unexpired entry whose evolution history records @p hash
     *
     * Matches either the content_hash or the canonical_hash of a merged submission.
     */
    Result<std::optional<KnowledgeEntry>> findByEvolvedHash(const std::string& hash);

    /**
     * @brief Entries of a type ordered by access_count DESC, created_at DESC
     */
    Result<std::vector<KnowledgeEntry>> getByType(const std::string& type,
                                                  const TypeQuery& query = {});

    /**
     * @brief Returns the updated entry
     *
     * ErrorCode::NotSupported when an embedding is supplied,
     * ErrorCode::NotFound when @p id does not exist.
     */
    Result<KnowledgeEntry> update(EntryId id, const EntryUpdate& update);

    /**
     * @brief Delete a record and its vector row; false when nothing matched
     */
    Result<bool> remove(EntryId id);

    /**
     * @brief Recompute expiry from now, optionally switching category
     * @return new expiry, empty for permanent entries
     */
    Result<std::optional<TimePoint>> refreshTTL(EntryId id,
                                                std::optional<TtlCategory> category = std::nullopt);

    /**
     * @brief Ids of entries that have no vector row (backfill candidates)
     */
    Result<std::vector<EntryId>> listMissingEmbeddings(int limit = 1000);

    /**
     * @brief Store the first vector row for an entry inserted without one
     */
    Result<void> attachEmbedding(EntryId id, const std::vector<float>& embedding);

    Result<int64_t> count();

    const std::shared_ptr<StoreConnection>& connection() const { return conn_; }

private:
    Result<std::optional<KnowledgeEntry>> fetchOne(const std::string& where,
                                                   const std::string& param, bool unexpiredOnly);
    Result<std::vector<float>> prepareEmbedding(const std::vector<float>& embedding) const;
    Result<bool> exists(EntryId id);

    std::shared_ptr<StoreConnection> conn_;
};

} // namespace lore::metadata
