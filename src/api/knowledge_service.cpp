#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <lore/api/knowledge_service.h>

namespace lore::api {

using metadata::Scope;

namespace {

WriteOutcome skippedOutcome(std::string reason) {
    WriteOutcome outcome;
    outcome.skipped = true;
    outcome.reason = std::move(reason);
    return outcome;
}

} // namespace

KnowledgeService::KnowledgeService(std::shared_ptr<metadata::StoreManager> stores,
                                   search::RankWeights weights, dedup::DedupConfig dedupConfig)
    : stores_(std::move(stores)), weights_(std::move(weights)), dedupConfig_(dedupConfig) {}

metadata::Availability KnowledgeService::isAvailable(Scope scope) const {
    if (!stores_) {
        return {false, "No store manager configured"};
    }
    return stores_->isAvailable(scope);
}

std::shared_ptr<metadata::StoreConnection> KnowledgeService::connect(Scope scope,
                                                                     std::string& reason) {
    auto availability = isAvailable(scope);
    if (!availability.available) {
        reason = availability.reason;
        spdlog::debug("[KnowledgeService] {} store unavailable: {}",
                      metadata::scopeToString(scope), reason);
        return nullptr;
    }

    auto conn = stores_->open(scope);
    if (!conn) {
        reason = conn.error().message;
        spdlog::warn("[KnowledgeService] Cannot open {} store: {}", metadata::scopeToString(scope),
                     reason);
        return nullptr;
    }
    return conn.value();
}

Result<WriteOutcome> KnowledgeService::add(const metadata::NewEntry& entry) {
    const auto scope = entry.scope.value_or(Scope::Global);
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return skippedOutcome(reason);
    }

    metadata::NewEntry scoped = entry;
    scoped.scope = scope;
    metadata::RecordStore records(conn);
    auto inserted = records.insert(scoped);
    if (!inserted) {
        spdlog::warn("[KnowledgeService] add failed: {}", inserted.error().message);
        return inserted.error();
    }

    WriteOutcome outcome;
    outcome.id = inserted.value().id;
    outcome.contentHash = inserted.value().contentHash;
    outcome.action = dedup::EvolutionAction::Create;
    return outcome;
}

Result<WriteOutcome> KnowledgeService::ingest(const metadata::NewEntry& entry) {
    const auto scope = entry.scope.value_or(Scope::Global);
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return skippedOutcome(reason);
    }

    metadata::NewEntry scoped = entry;
    scoped.scope = scope;
    dedup::DedupEvolution cascade(conn, dedupConfig_);
    auto result = cascade.insertOrEvolve(scoped);
    if (!result) {
        spdlog::warn("[KnowledgeService] ingest failed: {}", result.error().message);
        return result.error();
    }

    const auto& evolution = result.value();
    WriteOutcome outcome;
    outcome.id = evolution.id;
    outcome.action = evolution.action;
    outcome.similarity = evolution.similarity;
    outcome.reason = evolution.reason;
    outcome.skipped = evolution.action == dedup::EvolutionAction::Skip;
    if (evolution.id && evolution.action != dedup::EvolutionAction::Skip) {
        metadata::RecordStore records(conn);
        auto stored = records.get(*evolution.id);
        if (stored && stored.value()) {
            outcome.contentHash = stored.value()->contentHash;
        }
    }
    return outcome;
}

Result<dedup::BatchSummary>
KnowledgeService::ingestBatch(Scope scope, const std::vector<metadata::NewEntry>& entries) {
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return Error{ErrorCode::NotInitialized, reason};
    }

    std::vector<metadata::NewEntry> scoped = entries;
    for (auto& entry : scoped) {
        entry.scope = scope;
    }
    dedup::DedupEvolution cascade(conn, dedupConfig_);
    return cascade.processBatch(scoped);
}

SearchResponse KnowledgeService::search(const std::string& query, const SearchOptions& options) {
    SearchResponse response;
    std::vector<std::pair<Scope, std::shared_ptr<metadata::StoreConnection>>> opened;
    std::vector<Scope> scopes;
    if (options.scope) {
        scopes.push_back(*options.scope);
    } else {
        scopes = {Scope::Global, Scope::Project};
    }

    for (Scope scope : scopes) {
        // An unscoped search must not create a project store as a side effect
        std::error_code ec;
        if (!options.scope && scope == Scope::Project && stores_ &&
            !std::filesystem::exists(stores_->resolvePath(scope), ec)) {
            continue;
        }

        std::string reason;
        auto conn = connect(scope, reason);
        if (!conn) {
            if (options.scope) {
                response.warnings.push_back(std::string(metadata::scopeToString(scope)) +
                                            " store unavailable: " + reason);
            }
            continue;
        }

        search::SearchRequest request;
        request.query = query;
        request.embedding = options.embedding;
        request.limit = options.limit;
        request.filter.types = options.types;
        request.filter.projectSlug = options.projectSlug;

        search::SearchEngine engine(conn, weights_);
        auto outcome = engine.hybridSearch(request);
        response.degraded = response.degraded || outcome.degraded;
        for (auto& warning : outcome.warnings) {
            response.warnings.push_back(std::move(warning));
        }

        opened.emplace_back(scope, conn);
        for (auto& hit : outcome.hits) {
            response.hits.push_back(std::move(hit));
        }
    }

    std::sort(response.hits.begin(), response.hits.end(),
              [](const search::SearchHit& a, const search::SearchHit& b) {
                  if (a.finalScore != b.finalScore)
                      return a.finalScore > b.finalScore;
                  if (a.entry.scope != b.entry.scope)
                      return a.entry.scope < b.entry.scope;
                  return a.entry.id < b.entry.id;
              });
    if (response.hits.size() > options.limit) {
        response.hits.resize(options.limit);
    }

    if (options.trackAccess) {
        for (const auto& [scope, conn] : opened) {
            std::vector<EntryId> ids;
            for (const auto& hit : response.hits) {
                if (hit.entry.scope == scope)
                    ids.push_back(hit.entry.id);
            }
            if (ids.empty())
                continue;
            lifecycle::LifecycleManager lifecycle(conn);
            auto tracked = lifecycle.trackAccessBatch(ids);
            if (!tracked) {
                spdlog::warn("[KnowledgeService] Access tracking failed: {}",
                             tracked.error().message);
            }
        }
    }
    return response;
}

std::optional<metadata::KnowledgeEntry> KnowledgeService::get(Scope scope, EntryId id) {
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return std::nullopt;
    }

    metadata::RecordStore records(conn);
    auto entry = records.get(id);
    if (!entry) {
        spdlog::warn("[KnowledgeService] get({}) failed: {}", id, entry.error().message);
        return std::nullopt;
    }
    auto found = std::move(entry).value();
    if (!found) {
        return std::nullopt;
    }

    lifecycle::LifecycleManager lifecycle(conn);
    auto tracked = lifecycle.trackAccess(id);
    if (tracked && tracked.value()) {
        found->accessCount += 1;
        found->lastAccessed = conn->now();
    } else if (!tracked) {
        spdlog::warn("[KnowledgeService] Access tracking failed for {}: {}", id,
                     tracked.error().message);
    }
    return found;
}

Result<WriteOutcome> KnowledgeService::update(Scope scope, EntryId id,
                                              const metadata::EntryUpdate& update) {
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return skippedOutcome(reason);
    }

    metadata::RecordStore records(conn);
    auto updated = records.update(id, update);
    if (!updated) {
        return updated.error();
    }

    WriteOutcome outcome;
    outcome.id = id;
    outcome.contentHash = updated.value().contentHash;
    return outcome;
}

Result<WriteOutcome> KnowledgeService::remove(Scope scope, EntryId id) {
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return skippedOutcome(reason);
    }

    metadata::RecordStore records(conn);
    auto removed = records.remove(id);
    if (!removed) {
        return removed.error();
    }
    if (!removed.value()) {
        return Error{ErrorCode::NotFound, "Entry " + std::to_string(id) + " not found"};
    }

    WriteOutcome outcome;
    outcome.id = id;
    return outcome;
}

std::vector<metadata::KnowledgeEntry> KnowledgeService::getByType(Scope scope,
                                                                  const std::string& type,
                                                                  int limit) {
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return {};
    }

    metadata::RecordStore records(conn);
    metadata::TypeQuery query;
    query.limit = limit;
    auto entries = records.getByType(type, query);
    if (!entries) {
        spdlog::warn("[KnowledgeService] getByType({}) failed: {}", type,
                     entries.error().message);
        return {};
    }
    return std::move(entries).value();
}

Result<CleanupOutcome> KnowledgeService::cleanup(Scope scope) {
    CleanupOutcome outcome;
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        outcome.skipped = true;
        outcome.reason = reason;
        return outcome;
    }

    lifecycle::LifecycleManager lifecycle(conn);
    auto swept = lifecycle.cleanupExpired();
    if (!swept) {
        return swept.error();
    }
    outcome.deleted = swept.value().deleted;
    outcome.ids = swept.value().ids;
    return outcome;
}

std::optional<lifecycle::StalenessInfo> KnowledgeService::staleness(Scope scope, EntryId id) {
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return std::nullopt;
    }

    lifecycle::LifecycleManager lifecycle(conn);
    auto info = lifecycle.getStalenessScore(id);
    if (!info) {
        if (info.error().code != ErrorCode::NotFound) {
            spdlog::warn("[KnowledgeService] staleness({}) failed: {}", id,
                         info.error().message);
        }
        return std::nullopt;
    }
    return info.value();
}

std::vector<lifecycle::TypeAccessStats>
KnowledgeService::stats(Scope scope, const lifecycle::AccessStatsQuery& query) {
    std::string reason;
    auto conn = connect(scope, reason);
    if (!conn) {
        return {};
    }

    lifecycle::LifecycleManager lifecycle(conn);
    auto stats = lifecycle.getAccessStats(query);
    if (!stats) {
        spdlog::warn("[KnowledgeService] stats failed: {}", stats.error().message);
        return {};
    }
    return std::move(stats).value();
}

void KnowledgeService::close() {
    if (stores_) {
        stores_->closeAll();
    }
}

} // namespace lore::api
