#include <spdlog/spdlog.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <cctype>
#include <ctime>
#include <lore/crypto/hasher.h>
#include <lore/dedup/dedup_evolution.h>

namespace lore::dedup {

namespace {

bool isStrippedPunctuation(char c) {
    switch (c) {
        case '.':
        case ',':
        case ';':
        case ':':
        case '!':
        case '?':
        case '\'':
        case '"':
            return true;
        default:
            return false;
    }
}

// Cut at most maxBytes without splitting a UTF-8 sequence
std::string utf8Prefix(std::string_view text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return std::string(text);
    }
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

std::string isoDate(TimePoint when) {
    return fmt::format("{:%Y-%m-%d}", fmt::gmtime(std::chrono::system_clock::to_time_t(when)));
}

} // namespace

std::string canonicalize(std::string_view content) {
    std::string out;
    out.reserve(content.size());
    bool pendingSpace = false;
    for (char c : content) {
        if (isStrippedPunctuation(c))
            continue;
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

Result<std::string> computeCanonicalHash(std::string_view content) {
    return crypto::sha256Hex(canonicalize(content));
}

const char* matchStageToString(MatchStage stage) {
    switch (stage) {
        case MatchStage::None:
            return "none";
        case MatchStage::ExactHash:
            return "exact_hash";
        case MatchStage::CanonicalHash:
            return "canonical_hash";
        case MatchStage::Embedding:
            return "embedding";
    }
    return "unknown";
}

const char* evolutionActionToString(EvolutionAction action) {
    switch (action) {
        case EvolutionAction::Skip:
            return "skipped";
        case EvolutionAction::Evolve:
            return "evolved";
        case EvolutionAction::Create:
            return "created";
    }
    return "unknown";
}

std::string mergeContent(std::string_view existing, std::string_view addition, TimePoint when) {
    return fmt::format("{}\n\nUpdate: [{}] {}", existing, isoDate(when), addition);
}

DedupEvolution::DedupEvolution(std::shared_ptr<metadata::StoreConnection> conn,
                               DedupConfig config)
    : conn_(conn), records_(conn), config_(config) {}

Result<std::optional<metadata::KnowledgeEntry>>
DedupEvolution::nearestNeighbour(const std::vector<float>& query, double& similarity) {
    auto matches = conn_->vectorIndex->search(vector::normalizeEmbedding(query),
                                              config_.neighbourCandidates);
    if (!matches)
        return matches.error();

    const auto now = conn_->now();
    for (const auto& match : matches.value()) {
        auto entry = records_.get(match.id);
        if (!entry)
            return entry.error();
        if (!entry.value() || entry.value()->isExpired(now))
            continue;
        similarity = match.similarity();
        return entry;
    }
    return std::optional<metadata::KnowledgeEntry>{};
}

Result<DuplicateCheck>
DedupEvolution::checkDuplicate(std::string_view content,
                               const std::optional<std::vector<float>>& embedding) {
    if (content.empty()) {
        return Error{ErrorCode::InvalidArgument, "Entry content is empty"};
    }
    if (embedding && embedding->size() != conn_->embeddingDim) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding has " + std::to_string(embedding->size()) +
                         " dimensions, store is pinned to " + std::to_string(conn_->embeddingDim)};
    }

    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);
    DuplicateCheck check;

    auto contentHash = crypto::sha256Hex(content);
    if (!contentHash)
        return contentHash.error();
    check.contentHash = contentHash.value();

    auto canonicalHash = computeCanonicalHash(content);
    if (!canonicalHash)
        return canonicalHash.error();
    check.canonicalHash = canonicalHash.value();

    const auto now = conn_->now();
    auto accept = [&](std::optional<metadata::KnowledgeEntry> found, MatchStage stage,
                      double similarity) {
        if (!found || found->isExpired(now))
            return false;
        check.existing = std::move(found);
        check.stage = stage;
        check.similarity = similarity;
        check.isDuplicate = similarity >= config_.evolveThreshold;
        return true;
    };

    // Stage 1: exact hash, stored or merged
    auto byHash = records_.getUnexpiredByHash(check.contentHash);
    if (!byHash)
        return byHash.error();
    if (accept(std::move(byHash).value(), MatchStage::ExactHash, config_.exactSimilarity))
        return check;

    auto byEvolvedHash = records_.findByEvolvedHash(check.contentHash);
    if (!byEvolvedHash)
        return byEvolvedHash.error();
    if (accept(std::move(byEvolvedHash).value(), MatchStage::ExactHash, config_.exactSimilarity))
        return check;

    // Stage 2: canonical hash
    auto byCanonical = records_.getByCanonicalHash(check.canonicalHash);
    if (!byCanonical)
        return byCanonical.error();
    if (accept(std::move(byCanonical).value(), MatchStage::CanonicalHash,
               config_.canonicalSimilarity))
        return check;

    auto byEvolvedCanonical = records_.findByEvolvedHash(check.canonicalHash);
    if (!byEvolvedCanonical)
        return byEvolvedCanonical.error();
    if (accept(std::move(byEvolvedCanonical).value(), MatchStage::CanonicalHash,
               config_.canonicalSimilarity))
        return check;

    // Stage 3: nearest neighbour
    if (embedding && conn_->vectorEnabled) {
        double similarity = 0.0;
        auto neighbour = nearestNeighbour(*embedding, similarity);
        if (!neighbour)
            return neighbour.error();
        accept(std::move(neighbour).value(), MatchStage::Embedding, similarity);
    }

    spdlog::debug("[Dedup] Cascade result: stage={} similarity={:.3f}",
                  matchStageToString(check.stage), check.similarity);
    return check;
}

EvolutionAction DedupEvolution::decide(const DuplicateCheck& check) const {
    if (check.stage == MatchStage::None || !check.existing) {
        return EvolutionAction::Create;
    }
    if (check.similarity > config_.skipThreshold) {
        return EvolutionAction::Skip;
    }
    if (check.similarity >= config_.evolveThreshold) {
        return EvolutionAction::Evolve;
    }
    return EvolutionAction::Create;
}

Result<EvolutionOutcome> DedupEvolution::insertOrEvolve(const metadata::NewEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(conn_->mutex);

    auto checkResult = checkDuplicate(entry.content, entry.embedding);
    if (!checkResult)
        return checkResult.error();
    const auto& check = checkResult.value();

    switch (decide(check)) {
        case EvolutionAction::Skip: {
            EvolutionOutcome outcome;
            outcome.action = EvolutionAction::Skip;
            outcome.id = check.existing->id;
            outcome.similarity = check.similarity;
            outcome.stage = check.stage;
            outcome.evolutionCount = check.existing->metadata.evolutionCount();
            outcome.reason = std::string("duplicate_") + matchStageToString(check.stage);
            spdlog::debug("[Dedup] Skipping submission matching entry {} ({})", *outcome.id,
                          outcome.reason);
            return outcome;
        }
        case EvolutionAction::Evolve:
            return evolve(check, entry);
        case EvolutionAction::Create:
            break;
    }
    return create(check, entry);
}

Result<EvolutionOutcome> DedupEvolution::evolve(const DuplicateCheck& check,
                                                const metadata::NewEntry& entry) {
    const auto& existing = *check.existing;
    const auto now = conn_->now();

    auto metadata = existing.metadata;
    if (!metadata.canonicalHash()) {
        auto original = computeCanonicalHash(existing.content);
        if (!original)
            return original.error();
        metadata.setCanonicalHash(original.value());
    }

    metadata::EvolutionRecord record;
    record.date = isoDate(now);
    record.contentPreview = utf8Prefix(entry.content, config_.previewLength);
    record.contentHash = check.contentHash;
    record.canonicalHash = check.canonicalHash;
    record.similarity = check.similarity;
    metadata.appendEvolution(record, config_.maxHistory);

    const int evolutionCount = metadata.evolutionCount() + 1;
    metadata.setEvolutionCount(evolutionCount);
    metadata.setLastEvolution(now);

    metadata::EntryUpdate update;
    update.content = mergeContent(existing.content, entry.content, now);
    update.metadata = std::move(metadata);

    auto updated = records_.update(existing.id, update);
    if (!updated) {
        spdlog::warn("[Dedup] Evolving entry {} failed: {}", existing.id,
                     updated.error().message);
        return updated.error();
    }

    EvolutionOutcome outcome;
    outcome.action = EvolutionAction::Evolve;
    outcome.id = existing.id;
    outcome.similarity = check.similarity;
    outcome.stage = check.stage;
    outcome.evolutionCount = evolutionCount;
    outcome.reason = fmt::format("merged into entry {} at similarity {:.3f}", existing.id,
                                 check.similarity);
    spdlog::debug("[Dedup] Evolved entry {} (count={})", existing.id, evolutionCount);
    return outcome;
}

Result<EvolutionOutcome> DedupEvolution::create(const DuplicateCheck& check,
                                                const metadata::NewEntry& entry) {
    metadata::NewEntry stamped = entry;
    stamped.metadata.setCanonicalHash(check.canonicalHash);

    auto inserted = records_.insert(stamped);
    if (!inserted)
        return inserted.error();

    EvolutionOutcome outcome;
    outcome.action = EvolutionAction::Create;
    outcome.id = inserted.value().id;
    outcome.similarity = check.similarity;
    outcome.stage = check.stage;
    outcome.reason = check.stage == MatchStage::None ? "no_match" : "below_evolve_threshold";
    return outcome;
}

BatchSummary DedupEvolution::processBatch(const std::vector<metadata::NewEntry>& entries) {
    BatchSummary summary;
    for (const auto& entry : entries) {
        auto outcome = insertOrEvolve(entry);
        if (!outcome) {
            summary.errors.push_back(utf8Prefix(entry.content, 50) + ": " +
                                     outcome.error().message);
            continue;
        }
        switch (outcome.value().action) {
            case EvolutionAction::Create:
                ++summary.created;
                break;
            case EvolutionAction::Evolve:
                ++summary.evolved;
                break;
            case EvolutionAction::Skip:
                ++summary.skipped;
                break;
        }
    }

    spdlog::info("[Dedup] Batch of {}: {} created, {} evolved, {} skipped, {} errors",
                 entries.size(), summary.created, summary.evolved, summary.skipped,
                 summary.errors.size());
    return summary;
}

} // namespace lore::dedup
