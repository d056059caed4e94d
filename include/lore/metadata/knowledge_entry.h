#pragma once

#include <lore/core/types.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lore::metadata {

/**
 * @brief Which store an entry lives in
 */
enum class Scope { Global, Project };

const char* scopeToString(Scope scope);
std::optional<Scope> scopeFromString(std::string_view name);

/**
 * @brief Retention class; fixes the expiry window of an entry
 */
enum class TtlCategory {
    Permanent, ///< Never expires
    LongTerm,  ///< 90 days
    ShortTerm, ///< 7 days
    Ephemeral  ///< 24 hours
};

const char* ttlCategoryToString(TtlCategory category);
std::optional<TtlCategory> ttlCategoryFromString(std::string_view name);

/**
 * @brief Lifetime of a category, empty for permanent entries
 */
std::optional<std::chrono::milliseconds> ttlDuration(TtlCategory category);

/**
 * @brief Default retention for an entry type; unknown types get ShortTerm
 */
TtlCategory defaultTtlForType(std::string_view type);

/**
 * @brief Expiry of an entry written at @p from, empty for permanent entries
 */
std::optional<TimePoint> computeExpiry(TtlCategory category, TimePoint from);

namespace entry_type {
inline constexpr std::string_view Decision = "decision";
inline constexpr std::string_view Lesson = "lesson";
inline constexpr std::string_view Summary = "summary";
inline constexpr std::string_view TempNote = "temp_note";
} // namespace entry_type

/**
 * @brief One merge recorded in an entry's evolution history
 */
struct EvolutionRecord {
    std::string date;           ///< YYYY-MM-DD (UTC)
    std::string contentPreview; ///< First 100 characters of the merged submission
    std::string contentHash;    ///< SHA-256 of the merged submission
    std::string canonicalHash;  ///< Canonical hash of the merged submission
    double similarity = 0.0;
};

/**
 * @brief Typed view over the JSON metadata column
 *
 * Recognised keys have accessors; any other key is preserved verbatim.
 */
class EntryMetadata {
public:
    static constexpr std::size_t kMaxEvolutionHistory = 10;

    EntryMetadata() : data_(nlohmann::json::object()) {}
    explicit EntryMetadata(nlohmann::json data);

    /**
     * @brief Parse the stored column; non-object JSON is rejected as InvalidData
     */
    static Result<EntryMetadata> parse(std::string_view text);

    std::string serialize() const;

    std::optional<double> confidence() const;
    void setConfidence(double value);

    std::optional<std::string> source() const;
    void setSource(std::string value);

    std::optional<std::string> projectSlug() const;
    void setProjectSlug(std::string value);

    std::vector<std::string> tags() const;
    void setTags(const std::vector<std::string>& tags);

    int evolutionCount() const;
    void setEvolutionCount(int count);

    std::vector<EvolutionRecord> evolutionHistory() const;

    /**
     * @brief Append a record, keeping at most @p maxEntries (oldest dropped first)
     */
    void appendEvolution(const EvolutionRecord& record,
                         std::size_t maxEntries = kMaxEvolutionHistory);

    std::optional<std::string> canonicalHash() const;
    void setCanonicalHash(std::string value);

    std::optional<int64_t> lastEvolution() const;
    void setLastEvolution(TimePoint when);

    bool contains(std::string_view key) const;
    const nlohmann::json* get(std::string_view key) const;
    void set(const std::string& key, nlohmann::json value);
    void erase(const std::string& key);

    const nlohmann::json& json() const { return data_; }

private:
    template <typename T> std::optional<T> typed(std::string_view key) const;

    nlohmann::json data_;
};

/**
 * @brief A stored knowledge record
 */
struct KnowledgeEntry {
    EntryId id = 0;
    std::string content;
    std::string type;
    Scope scope = Scope::Global;
    TimePoint createdAt{};
    std::optional<TimePoint> expiresAt;
    int64_t accessCount = 0;
    std::optional<TimePoint> lastAccessed;
    std::string contentHash;
    TtlCategory ttlCategory = TtlCategory::ShortTerm;
    std::optional<std::string> projectSlug;
    EntryMetadata metadata;
    std::optional<std::vector<float>> embedding;

    bool isExpired(TimePoint now) const { return expiresAt && *expiresAt <= now; }
};

} // namespace lore::metadata
