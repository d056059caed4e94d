#pragma once

#include <lore/core/types.h>
#include <lore/metadata/knowledge_entry.h>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lore::search {

inline constexpr double kDefaultRrfK = 60.0;

enum class SearchSource { Keyword, Vector };

const char* sourceToString(SearchSource source);

/**
 * @brief Ids produced by one retrieval pass, best first
 */
struct RankedList {
    SearchSource source = SearchSource::Keyword;
    std::vector<EntryId> ids;
};

struct FusedCandidate {
    EntryId id = 0;
    double rrfScore = 0.0;
    std::vector<SearchSource> sources;
};

/**
 * @brief Reciprocal Rank Fusion
 *
 * Each list contributes 1 / (k + rank) with 1-based rank. An id repeated
 * within one list counts once, at its best rank. Output is ordered by score
 * descending, ties by ascending id.
 */
std::vector<FusedCandidate> fuseReciprocalRank(const std::vector<RankedList>& lists,
                                               double k = kDefaultRrfK);

/**
 * @brief Per-type multipliers applied after fusion
 */
struct RankWeights {
    std::unordered_map<std::string, double> typeWeights;
    double defaultWeight = 1.0;

    /// decision 2.0, lesson 2.0, summary 0.5, temp_note 0.3
    static RankWeights defaults();

    double weightFor(std::string_view type) const;
};

/**
 * @brief 1 + ln(1 + accessCount); 1.0 for entries never read
 */
double accessBoost(int64_t accessCount);

struct SearchHit {
    metadata::KnowledgeEntry entry;
    double rrfScore = 0.0;
    double typeWeight = 1.0;
    double accessBoost = 1.0;
    double finalScore = 0.0;
    std::vector<SearchSource> sources;
};

/**
 * @brief final = rrf * typeWeight * accessBoost, sorted descending, ties by id
 *
 * Truncates to @p limit.
 */
std::vector<SearchHit> rerank(std::vector<SearchHit> hits, const RankWeights& weights,
                              std::size_t limit);

} // namespace lore::search
