#pragma once

#include <lore/core/types.h>
#include <lore/metadata/knowledge_entry.h>
#include <lore/metadata/record_store.h>
#include <lore/metadata/store_manager.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lore::dedup {

/**
 * @brief Normalised form used for the canonical hash
 *
 * Lowercased, whitespace runs collapsed to one space, the characters
 * . , ; : ! ? ' " removed, ends trimmed.
 */
std::string canonicalize(std::string_view content);

/**
 * @brief SHA-256 hex of canonicalize(content)
 */
Result<std::string> computeCanonicalHash(std::string_view content);

enum class MatchStage { None, ExactHash, CanonicalHash, Embedding };

const char* matchStageToString(MatchStage stage);

enum class EvolutionAction { Skip, Evolve, Create };

const char* evolutionActionToString(EvolutionAction action);

struct DedupConfig {
    double skipThreshold = 0.88;   ///< similarity above this is skipped
    double evolveThreshold = 0.65; ///< [evolveThreshold, skipThreshold] evolves
    double exactSimilarity = 1.0;
    double canonicalSimilarity = 0.9;
    std::size_t maxHistory = metadata::EntryMetadata::kMaxEvolutionHistory;
    std::size_t previewLength = 100;
    std::size_t neighbourCandidates = 10; ///< rows examined to find an unexpired neighbour
};

/**
 * @brief Result of the three-stage cascade
 */
struct DuplicateCheck {
    bool isDuplicate = false; ///< a stage matched at or above evolveThreshold
    MatchStage stage = MatchStage::None;
    double similarity = 0.0;
    std::optional<metadata::KnowledgeEntry> existing;
    std::string contentHash;
    std::string canonicalHash;
};

struct EvolutionOutcome {
    EvolutionAction action = EvolutionAction::Create;
    std::optional<EntryId> id; ///< created or evolved entry; the matched entry on skip
    double similarity = 0.0;
    MatchStage stage = MatchStage::None;
    int evolutionCount = 0;
    std::string reason;
};

struct BatchSummary {
    std::size_t created = 0;
    std::size_t evolved = 0;
    std::size_t skipped = 0;
    std::vector<std::string> errors; ///< "<content preview>: <message>" per failed item
};

/**
 * @brief existing + "\n\nUpdate: [YYYY-MM-DD] " + addition, date in UTC
 */
std::string mergeContent(std::string_view existing, std::string_view addition, TimePoint when);

/**
 * @brief Merge-or-create policy for machine-derived content
 *
 * Stage 1 compares the SHA-256 of the content against stored entries and the
 * hashes recorded in evolution histories (similarity 1.0). Stage 2 does the
 * same with the canonical hash (0.9). Stage 3 runs only when both miss and an
 * embedding is available, and takes the cosine similarity of the nearest
 * unexpired neighbour.
 *
 * Re-submitting any content already stored or merged is a skip, so the
 * cascade is idempotent.
 */
class DedupEvolution {
public:
    explicit DedupEvolution(std::shared_ptr<metadata::StoreConnection> conn,
                            DedupConfig config = {});

    Result<DuplicateCheck> checkDuplicate(std::string_view content,
                                          const std::optional<std::vector<float>>& embedding);

    EvolutionAction decide(const DuplicateCheck& check) const;

    Result<EvolutionOutcome> insertOrEvolve(const metadata::NewEntry& entry);

    /**
     * @brief insertOrEvolve() over many entries; per-item failures are collected
     */
    BatchSummary processBatch(const std::vector<metadata::NewEntry>& entries);

    const DedupConfig& config() const { return config_; }

private:
    Result<std::optional<metadata::KnowledgeEntry>> nearestNeighbour(const std::vector<float>& query,
                                                                     double& similarity);
    Result<EvolutionOutcome> evolve(const DuplicateCheck& check, const metadata::NewEntry& entry);
    Result<EvolutionOutcome> create(const DuplicateCheck& check, const metadata::NewEntry& entry);

    std::shared_ptr<metadata::StoreConnection> conn_;
    metadata::RecordStore records_;
    DedupConfig config_;
};

} // namespace lore::dedup
