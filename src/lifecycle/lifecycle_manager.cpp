#include <spdlog/spdlog.h>
#include <algorithm>
#include <lore/lifecycle/lifecycle_manager.h>
#include <lore/metadata/database.h>

namespace lore::lifecycle {

using metadata::Statement;
using metadata::TransactionMode;

double computeStaleness(metadata::TtlCategory category, Duration sinceLastAccess) {
    const auto ttl = metadata::ttlDuration(category);
    const Duration window = ttl ? std::chrono::duration_cast<Duration>(*ttl)
                                : std::chrono::duration_cast<Duration>(kPermanentStalenessWindow);
    if (window.count() <= 0) {
        return 1.0;
    }
    const double ratio =
        static_cast<double>(sinceLastAccess.count()) / static_cast<double>(window.count());
    return std::clamp(ratio, 0.0, 1.0);
}

LifecycleManager::LifecycleManager(std::shared_ptr<metadata::StoreConnection> conn)
    : conn_(std::move(conn)) {}

Result<CleanupResult> LifecycleManager::cleanupExpired() {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    auto& db = conn_->db;
    CleanupResult result;
    const int64_t now = toEpochMillis(conn_->now());

    auto txResult = db.transaction(
        [&]() -> Result<void> {
            auto selectResult = db.prepare("SELECT id FROM knowledge WHERE expires_at IS NOT NULL "
                                           "AND expires_at <= ? ORDER BY id");
            if (!selectResult)
                return selectResult.error();
            Statement select = std::move(selectResult).value();
            if (auto r = select.bind(1, now); !r)
                return r;

            std::vector<EntryId> expired;
            while (true) {
                auto stepResult = select.step();
                if (!stepResult)
                    return stepResult.error();
                if (!stepResult.value())
                    break;
                expired.push_back(select.getInt64(0));
            }
            if (expired.empty()) {
                return {};
            }

            auto deleteResult = db.prepare("DELETE FROM knowledge WHERE id = ?");
            if (!deleteResult)
                return deleteResult.error();
            Statement del = std::move(deleteResult).value();

            for (EntryId id : expired) {
                if (conn_->vectorEnabled) {
                    auto vecResult = conn_->vectorIndex->remove(id);
                    if (!vecResult)
                        return vecResult.error();
                } else if (auto r = vector::removeDetachedVector(db, id); !r) {
                    return r;
                }
                if (auto r = del.reset(); !r)
                    return r;
                if (auto r = del.bind(1, id); !r)
                    return r;
                if (auto r = del.execute(); !r)
                    return r;
                if (db.changes() > 0) {
                    result.ids.push_back(id);
                }
            }
            return {};
        },
        TransactionMode::Immediate);

    if (!txResult) {
        return txResult.error();
    }

    result.deleted = result.ids.size();
    if (result.deleted > 0) {
        spdlog::info("[Lifecycle] Removed {} expired entries from {}", result.deleted,
                     conn_->path.string());
    }
    return result;
}

Result<bool> LifecycleManager::trackAccess(EntryId id) {
    auto updated = trackAccessBatch({id});
    if (!updated)
        return updated.error();
    return updated.value() > 0;
}

Result<std::size_t> LifecycleManager::trackAccessBatch(const std::vector<EntryId>& ids) {
    std::size_t updated = 0;
    if (ids.empty()) {
        return updated;
    }

    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    auto& db = conn_->db;
    const int64_t now = toEpochMillis(conn_->now());

    auto txResult = db.transaction(
        [&]() -> Result<void> {
            auto stmtResult = db.prepare("UPDATE knowledge SET access_count = access_count + 1, "
                                         "last_accessed = ? WHERE id = ?");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();

            for (EntryId id : ids) {
                if (auto r = stmt.reset(); !r)
                    return r;
                if (auto r = stmt.bindAll(now, id); !r)
                    return r;
                if (auto r = stmt.execute(); !r)
                    return r;
                updated += static_cast<std::size_t>(db.changes());
            }
            return {};
        },
        TransactionMode::Immediate);

    if (!txResult) {
        spdlog::debug("[Lifecycle] Access tracking failed: {}", txResult.error().message);
        return txResult.error();
    }
    return updated;
}

Result<StalenessInfo> LifecycleManager::getStalenessScore(EntryId id) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    auto stmtResult = conn_->db.prepare(
        "SELECT type, ttl_category, created_at, last_accessed FROM knowledge WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return r.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value()) {
        return Error{ErrorCode::NotFound, "Entry " + std::to_string(id) + " not found"};
    }

    const auto type = stmt.getString(0);
    const auto category = metadata::ttlCategoryFromString(stmt.getString(1))
                              .value_or(metadata::defaultTtlForType(type));
    const int64_t reference = stmt.isNull(3) ? stmt.getInt64(2) : stmt.getInt64(3);

    StalenessInfo info;
    info.ttlCategory = category;
    info.sinceLastAccess = std::max(Duration{0}, std::chrono::duration_cast<Duration>(
                                                     conn_->now() - fromEpochMillis(reference)));
    info.score = computeStaleness(category, info.sinceLastAccess);
    return info;
}

Result<std::vector<TypeAccessStats>>
LifecycleManager::getAccessStats(const AccessStatsQuery& query) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    metadata::QueryBuilder qb;
    qb.select({"type", "COUNT(*)", "COALESCE(SUM(access_count), 0)",
               "COALESCE(AVG(access_count), 0.0)", "COALESCE(MAX(access_count), 0)",
               "MAX(last_accessed)"})
        .from("knowledge");
    bool hasWhere = false;
    auto addCondition = [&](const std::string& condition) {
        if (hasWhere) {
            qb.andWhere(condition);
        } else {
            qb.where(condition);
            hasWhere = true;
        }
    };
    if (query.scope) {
        addCondition("scope = ?");
    }
    if (query.type) {
        addCondition("type = ?");
    }
    qb.groupBy("type").orderBy("type ASC");

    auto stmtResult = conn_->db.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    int index = 1;
    if (query.scope) {
        if (auto r = stmt.bind(index++, metadata::scopeToString(*query.scope)); !r)
            return r.error();
    }
    if (query.type) {
        if (auto r = stmt.bind(index++, *query.type); !r)
            return r.error();
    }

    std::vector<TypeAccessStats> stats;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        TypeAccessStats row;
        row.type = stmt.getString(0);
        row.count = stmt.getInt64(1);
        row.totalAccess = stmt.getInt64(2);
        row.avgAccess = stmt.getDouble(3);
        row.maxAccess = stmt.getInt64(4);
        if (!stmt.isNull(5)) {
            row.lastAccessed = fromEpochMillis(stmt.getInt64(5));
        }
        stats.push_back(std::move(row));
    }
    return stats;
}

} // namespace lore::lifecycle
