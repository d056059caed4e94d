#pragma once

#include <lore/core/types.h>
#include <lore/metadata/knowledge_entry.h>
#include <lore/metadata/store_manager.h>
#include <lore/search/rank_fusion.h>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lore::search {

struct SearchFilter {
    std::optional<metadata::Scope> scope;
    std::vector<std::string> types; ///< Empty matches every type
    std::optional<std::string> projectSlug;
    bool includeExpired = false;

    bool matches(const metadata::KnowledgeEntry& entry, TimePoint now) const;
};

/**
 * @brief Row returned by a single pass
 *
 * @c score is the bm25 value for keyword hits (lower is better) and the
 * cosine distance for vector hits.
 */
struct ScoredEntry {
    metadata::KnowledgeEntry entry;
    std::size_t rank = 0; ///< 1-based position within the pass
    double score = 0.0;
};

struct SearchRequest {
    std::string query;
    std::optional<std::vector<float>> embedding;
    std::size_t limit = 10;
    SearchFilter filter;
};

struct SearchOutcome {
    std::vector<SearchHit> hits;
    bool degraded = false;             ///< A pass failed and was skipped
    std::vector<std::string> warnings; ///< One message per failed pass
};

/**
 * @brief Keyword and vector retrieval with RRF fusion over one store
 *
 * hybridSearch() never fails as a whole: a pass that errors out (lock
 * timeout, missing FTS5, broken vector table) is logged and dropped, and the
 * surviving pass is returned with SearchOutcome::degraded set.
 */
class SearchEngine {
public:
    explicit SearchEngine(std::shared_ptr<metadata::StoreConnection> conn,
                          RankWeights weights = RankWeights::defaults());

    /**
     * @brief FTS5 MATCH ordered by bm25
     *
     * ErrorCode::NotSupported when the store has no FTS5 index. A query that
     * is empty after sanitising yields no rows.
     */
    Result<std::vector<ScoredEntry>> keywordSearch(std::string_view query, std::size_t limit,
                                                   const SearchFilter& filter = {});

    /**
     * @brief Nearest neighbours, filtered client-side
     *
     * Fetches 3x @p limit candidates before filtering. Empty when the vector
     * capability is disabled.
     */
    Result<std::vector<ScoredEntry>> vectorSearch(std::span<const float> embedding,
                                                  std::size_t limit,
                                                  const SearchFilter& filter = {});

    SearchOutcome hybridSearch(const SearchRequest& request);

    const RankWeights& weights() const { return weights_; }

private:
    std::shared_ptr<metadata::StoreConnection> conn_;
    RankWeights weights_;
};

} // namespace lore::search
