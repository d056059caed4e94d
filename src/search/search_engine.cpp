#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>
#include <lore/metadata/record_store.h>
#include <lore/search/query_sanitizer.h>
#include <lore/search/search_engine.h>

namespace lore::search {

using metadata::Statement;

namespace {

constexpr std::size_t kCandidateMultiplier = 3;

std::string placeholders(std::size_t n) {
    std::string out;
    for (std::size_t i = 0; i < n; ++i) {
        out += i == 0 ? "?" : ", ?";
    }
    return out;
}

} // namespace

bool SearchFilter::matches(const metadata::KnowledgeEntry& entry, TimePoint now) const {
    if (!includeExpired && entry.isExpired(now))
        return false;
    if (scope && entry.scope != *scope)
        return false;
    if (!types.empty() && std::find(types.begin(), types.end(), entry.type) == types.end())
        return false;
    if (projectSlug && entry.projectSlug != projectSlug)
        return false;
    return true;
}

SearchEngine::SearchEngine(std::shared_ptr<metadata::StoreConnection> conn, RankWeights weights)
    : conn_(std::move(conn)), weights_(std::move(weights)) {}

Result<std::vector<ScoredEntry>>
SearchEngine::keywordSearch(std::string_view query, std::size_t limit, const SearchFilter& filter) {
    std::vector<ScoredEntry> results;
    if (!conn_->ftsEnabled) {
        return Error{ErrorCode::NotSupported, "Keyword index unavailable (FTS5 missing)"};
    }

    const auto match = toFtsMatchExpression(query);
    if (match.empty() || limit == 0) {
        return results;
    }

    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    metadata::QueryBuilder qb;
    qb.select({metadata::kEntryColumns, "bm25(knowledge_fts) AS score"})
        .from("knowledge_fts")
        .join("knowledge k", "k.id = knowledge_fts.rowid")
        .where("knowledge_fts MATCH ?");
    if (filter.scope) {
        qb.andWhere("k.scope = ?");
    }
    if (!filter.types.empty()) {
        qb.andWhere("k.type IN (" + placeholders(filter.types.size()) + ")");
    }
    if (filter.projectSlug) {
        qb.andWhere("k.project_slug = ?");
    }
    if (!filter.includeExpired) {
        qb.andWhere("k.expires_at IS NULL OR k.expires_at > ?");
    }
    qb.orderBy("score ASC, k.id ASC").limit(static_cast<int>(limit));

    auto stmtResult = conn_->db.prepare(qb.build());
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    int index = 1;
    if (auto r = stmt.bind(index++, match); !r)
        return r.error();
    if (filter.scope) {
        if (auto r = stmt.bind(index++, metadata::scopeToString(*filter.scope)); !r)
            return r.error();
    }
    for (const auto& type : filter.types) {
        if (auto r = stmt.bind(index++, type); !r)
            return r.error();
    }
    if (filter.projectSlug) {
        if (auto r = stmt.bind(index++, *filter.projectSlug); !r)
            return r.error();
    }
    if (!filter.includeExpired) {
        if (auto r = stmt.bind(index++, toEpochMillis(conn_->now())); !r)
            return r.error();
    }

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        ScoredEntry scored;
        scored.entry = metadata::readEntryRow(stmt);
        scored.score = stmt.getDouble(metadata::kEntryColumnCount);
        scored.rank = results.size() + 1;
        results.push_back(std::move(scored));
    }

    spdlog::debug("[SearchEngine] Keyword pass '{}' returned {} rows", match, results.size());
    return results;
}

Result<std::vector<ScoredEntry>> SearchEngine::vectorSearch(std::span<const float> embedding,
                                                            std::size_t limit,
                                                            const SearchFilter& filter) {
    std::vector<ScoredEntry> results;
    if (!conn_->vectorEnabled || embedding.empty() || limit == 0) {
        return results;
    }
    if (embedding.size() != conn_->embeddingDim) {
        return Error{ErrorCode::InvalidArgument,
                     "Query embedding has " + std::to_string(embedding.size()) +
                         " dimensions, store is pinned to " + std::to_string(conn_->embeddingDim)};
    }

    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    const auto normalized = vector::normalizeEmbedding(embedding);
    auto matchesResult = conn_->vectorIndex->search(normalized, limit * kCandidateMultiplier);
    if (!matchesResult)
        return matchesResult.error();

    auto stmtResult = conn_->db.prepare(std::string("SELECT ") + metadata::kEntryColumns +
                                        " FROM knowledge k WHERE k.id = ?");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();

    const auto now = conn_->now();
    for (const auto& match : matchesResult.value()) {
        if (auto r = stmt.reset(); !r)
            return r.error();
        if (auto r = stmt.bind(1, match.id); !r)
            return r.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value()) {
            spdlog::debug("[SearchEngine] Vector row {} has no record; skipping", match.id);
            continue;
        }

        auto entry = metadata::readEntryRow(stmt);
        if (!filter.matches(entry, now))
            continue;

        ScoredEntry scored;
        scored.entry = std::move(entry);
        scored.score = match.distance;
        scored.rank = results.size() + 1;
        results.push_back(std::move(scored));
        if (results.size() >= limit)
            break;
    }

    spdlog::debug("[SearchEngine] Vector pass returned {} of {} candidates", results.size(),
                  matchesResult.value().size());
    return results;
}

SearchOutcome SearchEngine::hybridSearch(const SearchRequest& request) {
    SearchOutcome outcome;
    if (request.limit == 0) {
        return outcome;
    }

    const std::size_t candidateLimit = request.limit * kCandidateMultiplier;
    std::vector<RankedList> lists;
    std::unordered_map<EntryId, metadata::KnowledgeEntry> entries;

    auto collect = [&](SearchSource source, const std::vector<ScoredEntry>& rows) {
        RankedList list;
        list.source = source;
        list.ids.reserve(rows.size());
        for (const auto& row : rows) {
            list.ids.push_back(row.entry.id);
            entries.try_emplace(row.entry.id, row.entry);
        }
        lists.push_back(std::move(list));
    };

    auto degrade = [&](SearchSource source, const Error& error) {
        spdlog::warn("[SearchEngine] Degraded mode: {} pass failed ({}); continuing without it",
                     sourceToString(source), error.message);
        outcome.degraded = true;
        outcome.warnings.push_back(std::string(sourceToString(source)) +
                                   " search failed: " + error.message);
    };

    if (!sanitizeFtsQuery(request.query).empty()) {
        auto keyword = keywordSearch(request.query, candidateLimit, request.filter);
        if (keyword) {
            collect(SearchSource::Keyword, keyword.value());
        } else {
            degrade(SearchSource::Keyword, keyword.error());
        }
    }

    if (request.embedding && !request.embedding->empty()) {
        auto vec = vectorSearch(*request.embedding, candidateLimit, request.filter);
        if (vec) {
            collect(SearchSource::Vector, vec.value());
        } else {
            degrade(SearchSource::Vector, vec.error());
        }
    }

    const auto fused = fuseReciprocalRank(lists, conn_->config.rrfK);
    std::vector<SearchHit> hits;
    hits.reserve(fused.size());
    for (const auto& candidate : fused) {
        auto it = entries.find(candidate.id);
        if (it == entries.end())
            continue;
        SearchHit hit;
        hit.entry = it->second;
        hit.rrfScore = candidate.rrfScore;
        hit.sources = candidate.sources;
        hits.push_back(std::move(hit));
    }

    outcome.hits = rerank(std::move(hits), weights_, request.limit);
    spdlog::debug("[SearchEngine] Hybrid search fused {} lists into {} hits (degraded={})",
                  lists.size(), outcome.hits.size(), outcome.degraded);
    return outcome;
}

} // namespace lore::search
