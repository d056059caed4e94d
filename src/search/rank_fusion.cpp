#include <lore/search/rank_fusion.h>

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace lore::search {

const char* sourceToString(SearchSource source) {
    switch (source) {
        case SearchSource::Keyword:
            return "keyword";
        case SearchSource::Vector:
            return "vector";
    }
    return "unknown";
}

std::vector<FusedCandidate> fuseReciprocalRank(const std::vector<RankedList>& lists, double k) {
    std::unordered_map<EntryId, FusedCandidate> byId;

    for (const auto& list : lists) {
        std::unordered_set<EntryId> seen;
        for (std::size_t i = 0; i < list.ids.size(); ++i) {
            const EntryId id = list.ids[i];
            if (!seen.insert(id).second)
                continue;

            auto& candidate = byId[id];
            candidate.id = id;
            candidate.rrfScore += 1.0 / (k + static_cast<double>(i + 1));
            candidate.sources.push_back(list.source);
        }
    }

    std::vector<FusedCandidate> fused;
    fused.reserve(byId.size());
    for (auto& [id, candidate] : byId) {
        fused.push_back(std::move(candidate));
    }
    std::sort(fused.begin(), fused.end(), [](const FusedCandidate& a, const FusedCandidate& b) {
        if (a.rrfScore != b.rrfScore)
            return a.rrfScore > b.rrfScore;
        return a.id < b.id;
    });
    return fused;
}

RankWeights RankWeights::defaults() {
    RankWeights weights;
    weights.typeWeights = {
        {std::string(metadata::entry_type::Decision), 2.0},
        {std::string(metadata::entry_type::Lesson), 2.0},
        {std::string(metadata::entry_type::Summary), 0.5},
        {std::string(metadata::entry_type::TempNote), 0.3},
    };
    return weights;
}

double RankWeights::weightFor(std::string_view type) const {
    auto it = typeWeights.find(std::string(type));
    return it != typeWeights.end() ? it->second : defaultWeight;
}

double accessBoost(int64_t accessCount) {
    return 1.0 + std::log1p(static_cast<double>(std::max<int64_t>(accessCount, 0)));
}

std::vector<SearchHit> rerank(std::vector<SearchHit> hits, const RankWeights& weights,
                              std::size_t limit) {
    for (auto& hit : hits) {
        hit.typeWeight = weights.weightFor(hit.entry.type);
        hit.accessBoost = accessBoost(hit.entry.accessCount);
        hit.finalScore = hit.rrfScore * hit.typeWeight * hit.accessBoost;
    }

    std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.finalScore != b.finalScore)
            return a.finalScore > b.finalScore;
        return a.entry.id < b.entry.id;
    });
    if (hits.size() > limit) {
        hits.resize(limit);
    }
    return hits;
}

} // namespace lore::search
