#include <lore/metadata/knowledge_entry.h>

namespace lore::metadata {

using namespace std::chrono_literals;

const char* scopeToString(Scope scope) {
    switch (scope) {
        case Scope::Global:
            return "global";
        case Scope::Project:
            return "project";
    }
    return "global";
}

std::optional<Scope> scopeFromString(std::string_view name) {
    if (name == "global")
        return Scope::Global;
    if (name == "project")
        return Scope::Project;
    return std::nullopt;
}

const char* ttlCategoryToString(TtlCategory category) {
    switch (category) {
        case TtlCategory::Permanent:
            return "permanent";
        case TtlCategory::LongTerm:
            return "long_term";
        case TtlCategory::ShortTerm:
            return "short_term";
        case TtlCategory::Ephemeral:
            return "ephemeral";
    }
    return "short_term";
}

std::optional<TtlCategory> ttlCategoryFromString(std::string_view name) {
    if (name == "permanent")
        return TtlCategory::Permanent;
    if (name == "long_term")
        return TtlCategory::LongTerm;
    if (name == "short_term")
        return TtlCategory::ShortTerm;
    if (name == "ephemeral")
        return TtlCategory::Ephemeral;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> ttlDuration(TtlCategory category) {
    switch (category) {
        case TtlCategory::Permanent:
            return std::nullopt;
        case TtlCategory::LongTerm:
            return std::chrono::duration_cast<std::chrono::milliseconds>(24h * 90);
        case TtlCategory::ShortTerm:
            return std::chrono::duration_cast<std::chrono::milliseconds>(24h * 7);
        case TtlCategory::Ephemeral:
            return std::chrono::duration_cast<std::chrono::milliseconds>(24h);
    }
    return std::nullopt;
}

TtlCategory defaultTtlForType(std::string_view type) {
    if (type == entry_type::Lesson)
        return TtlCategory::Permanent;
    if (type == entry_type::Decision)
        return TtlCategory::LongTerm;
    if (type == entry_type::Summary)
        return TtlCategory::ShortTerm;
    if (type == entry_type::TempNote)
        return TtlCategory::Ephemeral;
    return TtlCategory::ShortTerm;
}

std::optional<TimePoint> computeExpiry(TtlCategory category, TimePoint from) {
    auto window = ttlDuration(category);
    if (!window)
        return std::nullopt;
    return from + *window;
}

// EntryMetadata
EntryMetadata::EntryMetadata(nlohmann::json data) : data_(std::move(data)) {
    if (!data_.is_object()) {
        data_ = nlohmann::json::object();
    }
}

Result<EntryMetadata> EntryMetadata::parse(std::string_view text) {
    if (text.empty()) {
        return EntryMetadata{};
    }
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Error{ErrorCode::InvalidData, "metadata is not a JSON object"};
    }
    return EntryMetadata{std::move(parsed)};
}

std::string EntryMetadata::serialize() const {
    return data_.dump();
}

template <typename T> std::optional<T> EntryMetadata::typed(std::string_view key) const {
    auto it = data_.find(std::string(key));
    if (it == data_.end() || it->is_null()) {
        return std::nullopt;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        if (!it->is_string())
            return std::nullopt;
    } else {
        if (!it->is_number())
            return std::nullopt;
    }
    return it->template get<T>();
}

std::optional<double> EntryMetadata::confidence() const {
    return typed<double>("confidence");
}

void EntryMetadata::setConfidence(double value) {
    data_["confidence"] = value;
}

std::optional<std::string> EntryMetadata::source() const {
    return typed<std::string>("source");
}

void EntryMetadata::setSource(std::string value) {
    data_["source"] = std::move(value);
}

std::optional<std::string> EntryMetadata::projectSlug() const {
    return typed<std::string>("project_slug");
}

void EntryMetadata::setProjectSlug(std::string value) {
    data_["project_slug"] = std::move(value);
}

std::vector<std::string> EntryMetadata::tags() const {
    std::vector<std::string> out;
    auto it = data_.find("tags");
    if (it == data_.end() || !it->is_array()) {
        return out;
    }
    for (const auto& tag : *it) {
        if (tag.is_string()) {
            out.push_back(tag.get<std::string>());
        }
    }
    return out;
}

void EntryMetadata::setTags(const std::vector<std::string>& tags) {
    data_["tags"] = tags;
}

int EntryMetadata::evolutionCount() const {
    return typed<int>("evolution_count").value_or(0);
}

void EntryMetadata::setEvolutionCount(int count) {
    data_["evolution_count"] = count;
}

std::vector<EvolutionRecord> EntryMetadata::evolutionHistory() const {
    std::vector<EvolutionRecord> out;
    auto it = data_.find("evolution_history");
    if (it == data_.end() || !it->is_array()) {
        return out;
    }
    for (const auto& item : *it) {
        if (!item.is_object())
            continue;
        EvolutionRecord record;
        record.date = item.value("date", std::string{});
        record.contentPreview = item.value("content_preview", std::string{});
        record.contentHash = item.value("content_hash", std::string{});
        record.canonicalHash = item.value("canonical_hash", std::string{});
        record.similarity = item.value("similarity", 0.0);
        out.push_back(std::move(record));
    }
    return out;
}

void EntryMetadata::appendEvolution(const EvolutionRecord& record, std::size_t maxEntries) {
    auto& history = data_["evolution_history"];
    if (!history.is_array()) {
        history = nlohmann::json::array();
    }
    history.push_back({{"date", record.date},
                       {"content_preview", record.contentPreview},
                       {"content_hash", record.contentHash},
                       {"canonical_hash", record.canonicalHash},
                       {"similarity", record.similarity}});
    while (history.size() > maxEntries) {
        history.erase(history.begin());
    }
}

std::optional<std::string> EntryMetadata::canonicalHash() const {
    return typed<std::string>("canonical_hash");
}

void EntryMetadata::setCanonicalHash(std::string value) {
    data_["canonical_hash"] = std::move(value);
}

std::optional<int64_t> EntryMetadata::lastEvolution() const {
    return typed<int64_t>("last_evolution");
}

void EntryMetadata::setLastEvolution(TimePoint when) {
    data_["last_evolution"] = toEpochMillis(when);
}

bool EntryMetadata::contains(std::string_view key) const {
    return data_.find(std::string(key)) != data_.end();
}

const nlohmann::json* EntryMetadata::get(std::string_view key) const {
    auto it = data_.find(std::string(key));
    return it == data_.end() ? nullptr : &*it;
}

void EntryMetadata::set(const std::string& key, nlohmann::json value) {
    data_[key] = std::move(value);
}

void EntryMetadata::erase(const std::string& key) {
    data_.erase(key);
}

} // namespace lore::metadata
