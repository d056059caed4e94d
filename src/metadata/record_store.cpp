#include <spdlog/spdlog.h>
#include <lore/crypto/hasher.h>
#include <lore/metadata/record_store.h>

namespace lore::metadata {

namespace {

Result<void> bindOptionalTime(Statement& stmt, int index, const std::optional<TimePoint>& tp) {
    if (!tp) {
        return stmt.bind(index, nullptr);
    }
    return stmt.bind(index, toEpochMillis(*tp));
}

Result<void> bindOptionalText(Statement& stmt, int index, const std::optional<std::string>& text) {
    if (!text) {
        return stmt.bind(index, nullptr);
    }
    return stmt.bind(index, *text);
}

Result<std::vector<KnowledgeEntry>> collectEntries(Statement& stmt) {
    std::vector<KnowledgeEntry> entries;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        entries.push_back(readEntryRow(stmt));
    }
    return entries;
}

} // namespace

KnowledgeEntry readEntryRow(const Statement& stmt, int c) {
    KnowledgeEntry entry;
    entry.id = stmt.getInt64(c + 0);
    entry.content = stmt.getString(c + 1);
    entry.type = stmt.getString(c + 2);
    entry.scope = scopeFromString(stmt.getString(c + 3)).value_or(Scope::Global);
    entry.createdAt = fromEpochMillis(stmt.getInt64(c + 4));
    if (!stmt.isNull(c + 5)) {
        entry.expiresAt = fromEpochMillis(stmt.getInt64(c + 5));
    }
    entry.accessCount = stmt.getInt64(c + 6);
    if (!stmt.isNull(c + 7)) {
        entry.lastAccessed = fromEpochMillis(stmt.getInt64(c + 7));
    }
    entry.contentHash = stmt.getString(c + 8);
    entry.ttlCategory =
        ttlCategoryFromString(stmt.getString(c + 9)).value_or(defaultTtlForType(entry.type));
    if (!stmt.isNull(c + 10)) {
        entry.projectSlug = stmt.getString(c + 10);
    }

    auto metadata = EntryMetadata::parse(stmt.getString(c + 11));
    if (metadata) {
        entry.metadata = std::move(metadata).value();
    } else {
        spdlog::warn("[RecordStore] Entry {} has unreadable metadata: {}", entry.id,
                     metadata.error().message);
    }
    return entry;
}

RecordStore::RecordStore(std::shared_ptr<StoreConnection> conn) : conn_(std::move(conn)) {}

Result<std::vector<float>> RecordStore::prepareEmbedding(const std::vector<float>& embedding) const {
    if (embedding.size() != conn_->embeddingDim) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding has " + std::to_string(embedding.size()) +
                         " dimensions, store is pinned to " +
                         std::to_string(conn_->embeddingDim)};
    }
    return vector::normalizeEmbedding(embedding);
}

Result<bool> RecordStore::exists(EntryId id) {
    auto stmtResult = conn_->db.prepare("SELECT 1 FROM knowledge WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();
    return stmt.step();
}

Result<InsertResult> RecordStore::insert(const NewEntry& entry) {
    if (entry.content.empty()) {
        return Error{ErrorCode::InvalidArgument, "Entry content is empty"};
    }
    if (entry.type.empty()) {
        return Error{ErrorCode::InvalidArgument, "Entry type is empty"};
    }

    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    std::optional<std::vector<float>> embedding;
    if (entry.embedding) {
        auto prepared = prepareEmbedding(*entry.embedding);
        if (!prepared)
            return prepared.error();
        if (conn_->vectorEnabled) {
            embedding = std::move(prepared).value();
        } else {
            spdlog::debug("[RecordStore] Vector capability disabled; storing keyword-only");
        }
    }

    auto hash = crypto::sha256Hex(entry.content);
    if (!hash)
        return hash.error();

    const auto now = conn_->now();
    const auto category = entry.ttlCategory.value_or(defaultTtlForType(entry.type));
    const auto expiresAt = computeExpiry(category, now);
    const auto scope = entry.scope.value_or(conn_->scope);

    EntryMetadata metadata = entry.metadata;
    auto projectSlug = entry.projectSlug ? entry.projectSlug : metadata.projectSlug();
    if (projectSlug) {
        metadata.setProjectSlug(*projectSlug);
    }

    auto& db = conn_->db;
    InsertResult out;
    out.contentHash = hash.value();

    auto txResult = db.transaction(
        [&]() -> Result<void> {
            auto stmtResult = db.prepare(
                "INSERT INTO knowledge (content, type, scope, created_at, expires_at, "
                "access_count, last_accessed, content_hash, ttl_category, project_slug, metadata) "
                "VALUES (?, ?, ?, ?, ?, 0, NULL, ?, ?, ?, ?)");
            if (!stmtResult)
                return stmtResult.error();

            Statement stmt = std::move(stmtResult).value();
            auto bindResult = stmt.bindAll(entry.content, entry.type, scopeToString(scope),
                                           toEpochMillis(now));
            if (!bindResult)
                return bindResult;
            if (auto r = bindOptionalTime(stmt, 5, expiresAt); !r)
                return r;
            if (auto r = stmt.bind(6, out.contentHash); !r)
                return r;
            if (auto r = stmt.bind(7, ttlCategoryToString(category)); !r)
                return r;
            if (auto r = bindOptionalText(stmt, 8, projectSlug); !r)
                return r;
            if (auto r = stmt.bind(9, metadata.serialize()); !r)
                return r;

            auto execResult = stmt.execute();
            if (!execResult)
                return execResult;

            out.id = db.lastInsertRowId();

            auto recordCheck = exists(out.id);
            if (!recordCheck)
                return recordCheck.error();
            if (!recordCheck.value()) {
                return Error{ErrorCode::CorruptedData,
                             "Record row " + std::to_string(out.id) + " missing after insert"};
            }

            if (embedding) {
                auto vecResult = conn_->vectorIndex->insert(out.id, *embedding);
                if (!vecResult)
                    return vecResult;

                auto vecCheck = conn_->vectorIndex->contains(out.id);
                if (!vecCheck)
                    return vecCheck.error();
                if (!vecCheck.value()) {
                    return Error{ErrorCode::CorruptedData,
                                 "Vector row for entry " + std::to_string(out.id) +
                                     " missing after insert"};
                }
                out.vectorStored = true;
            }
            return {};
        },
        TransactionMode::Immediate);

    if (!txResult) {
        if (txResult.error().code == ErrorCode::CorruptedData) {
            spdlog::error("[RecordStore] Insert rolled back: {}", txResult.error().message);
        } else {
            spdlog::debug("[RecordStore] Insert failed: {}", txResult.error().message);
        }
        return txResult.error();
    }

    spdlog::debug("[RecordStore] Inserted entry {} (type={}, ttl={}, vector={})", out.id,
                  entry.type, ttlCategoryToString(category), out.vectorStored);
    return out;
}

Result<std::optional<KnowledgeEntry>> RecordStore::get(EntryId id) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    auto stmtResult = conn_->db.prepare(std::string("SELECT ") + kEntryColumns +
                                        " FROM knowledge k WHERE k.id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value()) {
        return std::optional<KnowledgeEntry>{};
    }
    return std::optional<KnowledgeEntry>{readEntryRow(stmt)};
}

Result<std::optional<KnowledgeEntry>> RecordStore::fetchOne(const std::string& where,
                                                            const std::string& param,
                                                            bool unexpiredOnly) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    QueryBuilder qb;
    qb.select({kEntryColumns}).from("knowledge k").where(where);
    if (unexpiredOnly) {
        qb.andWhere("k.expires_at IS NULL OR k.expires_at > ?2");
    }
    qb.orderBy("k.id ASC").limit(1);

    auto stmtResult = conn_->db.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, param);
    if (!bindResult)
        return bindResult.error();
    if (unexpiredOnly) {
        if (auto r = stmt.bind(2, toEpochMillis(conn_->now())); !r)
            return r.error();
    }

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value()) {
        return std::optional<KnowledgeEntry>{};
    }
    return std::optional<KnowledgeEntry>{readEntryRow(stmt)};
}

Result<std::optional<KnowledgeEntry>> RecordStore::getByHash(const std::string& contentHash) {
    return fetchOne("k.content_hash = ?1", contentHash, false);
}

Result<std::optional<KnowledgeEntry>>
RecordStore::getUnexpiredByHash(const std::string& contentHash) {
    return fetchOne("k.content_hash = ?1", contentHash, true);
}

Result<std::optional<KnowledgeEntry>>
RecordStore::getByCanonicalHash(const std::string& canonicalHash) {
    return fetchOne("json_extract(k.metadata, '$.canonical_hash') = ?1", canonicalHash, true);
}

Result<std::optional<KnowledgeEntry>> RecordStore::findByEvolvedHash(const std::string& hash) {
    return fetchOne("EXISTS (SELECT 1 FROM json_each(k.metadata, '$.evolution_history') je "
                    "WHERE json_extract(je.value, '$.content_hash') = ?1 "
                    "OR json_extract(je.value, '$.canonical_hash') = ?1)",
                    hash, true);
}

Result<std::vector<KnowledgeEntry>> RecordStore::getByType(const std::string& type,
                                                           const TypeQuery& query) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    QueryBuilder qb;
    qb.select({kEntryColumns}).from("knowledge k").where("k.type = ?");
    if (query.scope) {
        qb.andWhere("k.scope = ?");
    }
    if (!query.includeExpired) {
        qb.andWhere("k.expires_at IS NULL OR k.expires_at > ?");
    }
    qb.orderBy("k.access_count DESC, k.created_at DESC, k.id ASC").limit(query.limit);

    auto stmtResult = conn_->db.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    int index = 1;
    if (auto r = stmt.bind(index++, type); !r)
        return r.error();
    if (query.scope) {
        if (auto r = stmt.bind(index++, scopeToString(*query.scope)); !r)
            return r.error();
    }
    if (!query.includeExpired) {
        if (auto r = stmt.bind(index++, toEpochMillis(conn_->now())); !r)
            return r.error();
    }

    return collectEntries(stmt);
}

Result<KnowledgeEntry> RecordStore::update(EntryId id, const EntryUpdate& update) {
    if (update.embedding) {
        return Error{ErrorCode::NotSupported,
                     "Embedding updates are not supported; delete and reinsert the entry"};
    }
    if (update.content && update.content->empty()) {
        return Error{ErrorCode::InvalidArgument, "Entry content is empty"};
    }
    if (update.type && update.type->empty()) {
        return Error{ErrorCode::InvalidArgument, "Entry type is empty"};
    }

    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    auto& db = conn_->db;
    std::optional<KnowledgeEntry> updated;

    auto txResult = db.transaction(
        [&]() -> Result<void> {
            auto existingResult = get(id);
            if (!existingResult)
                return existingResult.error();
            if (!existingResult.value()) {
                return Error{ErrorCode::NotFound, "Entry " + std::to_string(id) + " not found"};
            }
            KnowledgeEntry entry = std::move(*std::move(existingResult).value());

            if (update.content && *update.content != entry.content) {
                auto hash = crypto::sha256Hex(*update.content);
                if (!hash)
                    return hash.error();
                entry.content = *update.content;
                entry.contentHash = hash.value();
            }

            bool expiryChanged = false;
            if (update.type && *update.type != entry.type) {
                entry.type = *update.type;
                if (!update.ttlCategory) {
                    entry.ttlCategory = defaultTtlForType(entry.type);
                    expiryChanged = true;
                }
            }
            if (update.ttlCategory) {
                entry.ttlCategory = *update.ttlCategory;
                expiryChanged = true;
            }
            if (expiryChanged) {
                entry.expiresAt = computeExpiry(entry.ttlCategory, conn_->now());
            }

            if (update.metadata) {
                entry.metadata = *update.metadata;
                entry.projectSlug = entry.metadata.projectSlug();
            }

            auto stmtResult = db.prepare(
                "UPDATE knowledge SET content = ?, content_hash = ?, type = ?, ttl_category = ?, "
                "expires_at = ?, project_slug = ?, metadata = ? WHERE id = ?");
            if (!stmtResult)
                return stmtResult.error();

            Statement stmt = std::move(stmtResult).value();
            auto bindResult = stmt.bindAll(entry.content, entry.contentHash, entry.type,
                                           ttlCategoryToString(entry.ttlCategory));
            if (!bindResult)
                return bindResult;
            if (auto r = bindOptionalTime(stmt, 5, entry.expiresAt); !r)
                return r;
            if (auto r = bindOptionalText(stmt, 6, entry.projectSlug); !r)
                return r;
            if (auto r = stmt.bind(7, entry.metadata.serialize()); !r)
                return r;
            if (auto r = stmt.bind(8, id); !r)
                return r;

            auto execResult = stmt.execute();
            if (!execResult)
                return execResult;
            if (db.changes() != 1) {
                return Error{ErrorCode::CorruptedData,
                             "Update of entry " + std::to_string(id) + " touched " +
                                 std::to_string(db.changes()) + " rows"};
            }

            updated = std::move(entry);
            return {};
        },
        TransactionMode::Immediate);

    if (!txResult) {
        return txResult.error();
    }
    return std::move(*updated);
}

Result<bool> RecordStore::remove(EntryId id) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    auto& db = conn_->db;
    bool removed = false;

    auto txResult = db.transaction(
        [&]() -> Result<void> {
            if (conn_->vectorEnabled) {
                auto vecResult = conn_->vectorIndex->remove(id);
                if (!vecResult)
                    return vecResult.error();
            } else if (auto r = vector::removeDetachedVector(db, id); !r) {
                return r;
            }

            auto stmtResult = db.prepare("DELETE FROM knowledge WHERE id = ?");
            if (!stmtResult)
                return stmtResult.error();

            Statement stmt = std::move(stmtResult).value();
            if (auto r = stmt.bind(1, id); !r)
                return r;
            auto execResult = stmt.execute();
            if (!execResult)
                return execResult;
            removed = db.changes() > 0;

            if (conn_->vectorEnabled) {
                auto vecCheck = conn_->vectorIndex->contains(id);
                if (!vecCheck)
                    return vecCheck.error();
                if (vecCheck.value()) {
                    return Error{ErrorCode::CorruptedData,
                                 "Vector row for entry " + std::to_string(id) +
                                     " survived delete"};
                }
            }
            return {};
        },
        TransactionMode::Immediate);

    if (!txResult) {
        if (txResult.error().code == ErrorCode::CorruptedData) {
            spdlog::error("[RecordStore] Delete rolled back: {}", txResult.error().message);
        }
        return txResult.error();
    }
    return removed;
}

Result<std::optional<TimePoint>> RecordStore::refreshTTL(EntryId id,
                                                         std::optional<TtlCategory> category) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    auto& db = conn_->db;
    std::optional<TimePoint> expiresAt;

    auto txResult = db.transaction(
        [&]() -> Result<void> {
            auto existingResult = get(id);
            if (!existingResult)
                return existingResult.error();
            if (!existingResult.value()) {
                return Error{ErrorCode::NotFound, "Entry " + std::to_string(id) + " not found"};
            }

            const auto effective = category.value_or(existingResult.value()->ttlCategory);
            expiresAt = computeExpiry(effective, conn_->now());

            auto stmtResult =
                db.prepare("UPDATE knowledge SET ttl_category = ?, expires_at = ? WHERE id = ?");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            if (auto r = stmt.bind(1, ttlCategoryToString(effective)); !r)
                return r;
            if (auto r = bindOptionalTime(stmt, 2, expiresAt); !r)
                return r;
            if (auto r = stmt.bind(3, id); !r)
                return r;
            return stmt.execute();
        },
        TransactionMode::Immediate);

    if (!txResult) {
        return txResult.error();
    }
    return expiresAt;
}

Result<std::vector<EntryId>> RecordStore::listMissingEmbeddings(int limit) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    std::vector<EntryId> ids;
    if (!conn_->vectorEnabled) {
        return ids;
    }

    auto stmtResult = conn_->db.prepare("SELECT k.id FROM knowledge k WHERE NOT EXISTS "
                                        "(SELECT 1 FROM " +
                                        conn_->vectorIndex->tableName() +
                                        " v WHERE v.rowid = k.id) ORDER BY k.id ASC LIMIT ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, limit); !r)
        return r.error();

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        ids.push_back(stmt.getInt64(0));
    }
    return ids;
}

Result<void> RecordStore::attachEmbedding(EntryId id, const std::vector<float>& embedding) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    if (!conn_->vectorEnabled) {
        return Error{ErrorCode::NotSupported, "Vector capability disabled for this store"};
    }

    auto prepared = prepareEmbedding(embedding);
    if (!prepared)
        return prepared.error();
    const auto vec = std::move(prepared).value();

    auto& db = conn_->db;
    return db.transaction(
        [&]() -> Result<void> {
            auto present = exists(id);
            if (!present)
                return present.error();
            if (!present.value()) {
                return Error{ErrorCode::NotFound, "Entry " + std::to_string(id) + " not found"};
            }

            auto stored = conn_->vectorIndex->contains(id);
            if (!stored)
                return stored.error();
            if (stored.value()) {
                return Error{ErrorCode::NotSupported,
                             "Entry " + std::to_string(id) +
                                 " already has an embedding; delete and reinsert to replace it"};
            }

            auto insertResult = conn_->vectorIndex->insert(id, vec);
            if (!insertResult)
                return insertResult;

            auto check = conn_->vectorIndex->contains(id);
            if (!check)
                return check.error();
            if (!check.value()) {
                return Error{ErrorCode::CorruptedData,
                             "Vector row for entry " + std::to_string(id) + " missing after insert"};
            }
            return {};
        },
        TransactionMode::Immediate);
}

Result<int64_t> RecordStore::count() {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    auto stmtResult = conn_->db.prepare("SELECT COUNT(*) FROM knowledge");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return stmt.getInt64(0);
}

} // namespace lore::metadata
