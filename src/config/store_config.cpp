#include <spdlog/spdlog.h>
#include <lore/config/config_helpers.h>
#include <lore/config/store_config.h>
#include <limits>

namespace lore::config {

namespace {

Result<int64_t> parseInteger(const std::string& key, const std::string& raw) {
    try {
        size_t consumed = 0;
        auto value = std::stoll(raw, &consumed);
        if (consumed != raw.size()) {
            return Error{ErrorCode::InvalidArgument,
                         "knowledge." + key + ": trailing characters in '" + raw + "'"};
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     "knowledge." + key + ": expected integer, got '" + raw + "'"};
    }
}

Result<double> parseDouble(const std::string& key, const std::string& raw) {
    try {
        size_t consumed = 0;
        auto value = std::stod(raw, &consumed);
        if (consumed != raw.size()) {
            return Error{ErrorCode::InvalidArgument,
                         "knowledge." + key + ": trailing characters in '" + raw + "'"};
        }
        return value;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     "knowledge." + key + ": expected number, got '" + raw + "'"};
    }
}

Result<bool> parseBool(const std::string& key, const std::string& raw) {
    if (raw == "true" || raw == "1" || raw == "yes" || raw == "on") {
        return true;
    }
    if (raw == "false" || raw == "0" || raw == "no" || raw == "off") {
        return false;
    }
    return Error{ErrorCode::InvalidArgument,
                 "knowledge." + key + ": expected boolean, got '" + raw + "'"};
}

} // namespace

const char* vectorBackendToString(VectorBackendType type) {
    switch (type) {
        case VectorBackendType::SqliteVec:
            return "sqlite_vec";
        case VectorBackendType::Scan:
            return "scan";
        case VectorBackendType::None:
            return "none";
    }
    return "none";
}

Result<VectorBackendType> parseVectorBackend(std::string_view name) {
    if (name == "sqlite_vec" || name == "sqlite-vec" || name == "vec0") {
        return VectorBackendType::SqliteVec;
    }
    if (name == "scan") {
        return VectorBackendType::Scan;
    }
    if (name == "none" || name == "off") {
        return VectorBackendType::None;
    }
    return Error{ErrorCode::InvalidArgument,
                 "Unknown vector backend '" + std::string(name) + "'"};
}

Result<StoreConfig> loadStoreConfig(const std::filesystem::path& configPath) {
    StoreConfig cfg;
    const auto path = configPath.empty() ? get_config_path() : configPath;

    auto read = [&](const char* key) { return parse_config_value(path, "knowledge", key); };

    cfg.globalDir = resolve_global_dir_from_config(path);

    if (auto v = read("project_root"); !v.empty()) {
        cfg.projectRoot = expand_tilde(v);
    }
    if (auto v = read("busy_timeout_ms"); !v.empty()) {
        auto parsed = parseInteger("busy_timeout_ms", v);
        if (!parsed)
            return parsed.error();
        if (parsed.value() < 0) {
            return Error{ErrorCode::InvalidArgument, "knowledge.busy_timeout_ms must be >= 0"};
        }
        cfg.busyTimeout = std::chrono::milliseconds(parsed.value());
    }
    if (auto v = read("cache_size_kb"); !v.empty()) {
        auto parsed = parseInteger("cache_size_kb", v);
        if (!parsed)
            return parsed.error();
        if (parsed.value() <= 0 || parsed.value() > std::numeric_limits<int>::max()) {
            return Error{ErrorCode::InvalidArgument, "knowledge.cache_size_kb must be positive"};
        }
        cfg.cacheSizeKb = static_cast<int>(parsed.value());
    }
    if (auto v = read("embedding_dim"); !v.empty()) {
        auto parsed = parseInteger("embedding_dim", v);
        if (!parsed)
            return parsed.error();
        if (parsed.value() <= 0) {
            return Error{ErrorCode::InvalidArgument, "knowledge.embedding_dim must be positive"};
        }
        cfg.embeddingDim = static_cast<std::size_t>(parsed.value());
    }
    if (auto v = read("vector_backend"); !v.empty()) {
        auto parsed = parseVectorBackend(v);
        if (!parsed)
            return parsed.error();
        cfg.vectorBackend = parsed.value();
    }
    if (auto v = read("vector_extension"); !v.empty()) {
        cfg.vectorExtension = expand_tilde(v).string();
    }
    if (auto v = read("rrf_k"); !v.empty()) {
        auto parsed = parseDouble("rrf_k", v);
        if (!parsed)
            return parsed.error();
        if (parsed.value() <= 0.0) {
            return Error{ErrorCode::InvalidArgument, "knowledge.rrf_k must be positive"};
        }
        cfg.rrfK = parsed.value();
    }
    if (auto v = read("cleanup_on_open"); !v.empty()) {
        auto parsed = parseBool("cleanup_on_open", v);
        if (!parsed)
            return parsed.error();
        cfg.cleanupOnOpen = parsed.value();
    }
    if (auto v = read("log_level"); !v.empty()) {
        cfg.logLevel = v;
    }

    if (const char* env = std::getenv("LORE_VECTOR_EXTENSION"); env && *env) {
        cfg.vectorExtension = env;
    }

    spdlog::debug("[Config] Loaded knowledge config from {} (global_dir={}, vector_backend={})",
                  path.string(), cfg.globalDir.string(),
                  vectorBackendToString(cfg.vectorBackend));
    return cfg;
}

} // namespace lore::config
