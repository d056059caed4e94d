#include <spdlog/spdlog.h>
#include <lore/vector/vector_index.h>

namespace lore::vector {

using metadata::Statement;

SqliteVecIndex::SqliteVecIndex(metadata::Database& db, std::string extensionPath)
    : db_(db), extensionPath_(std::move(extensionPath)) {}

Result<bool> SqliteVecIndex::moduleRegistered() {
    auto stmtResult = db_.prepare("SELECT 1 FROM pragma_module_list WHERE name='vec0'");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    return stmt.step();
}

Result<void> SqliteVecIndex::loadExtension() {
    auto registered = moduleRegistered();
    if (registered && registered.value()) {
        spdlog::debug("[SqliteVecIndex] vec0 already registered on connection");
        return {};
    }

    sqlite3* handle = db_.nativeHandle();
    if (!handle) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    spdlog::debug("[SqliteVecIndex] Loading sqlite-vec extension from '{}'", extensionPath_);

    // Enable the C entry point only; the SQL load_extension() function stays off
    int rc = sqlite3_db_config(handle, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 1, nullptr);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::NotSupported, "Extension loading disabled in this SQLite build"};
    }

    char* errorMsg = nullptr;
    rc = sqlite3_load_extension(handle, extensionPath_.c_str(), "sqlite3_vec_init", &errorMsg);
    sqlite3_db_config(handle, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);

    if (rc != SQLITE_OK) {
        std::string error = errorMsg ? errorMsg : sqlite3_errstr(rc);
        sqlite3_free(errorMsg);
        return Error{ErrorCode::NotSupported, "Failed to load sqlite-vec extension: " + error};
    }

    registered = moduleRegistered();
    if (!registered)
        return registered.error();
    if (!registered.value()) {
        return Error{ErrorCode::NotSupported,
                     "sqlite-vec extension loaded but vec0 module not available"};
    }

    spdlog::info("[SqliteVecIndex] sqlite-vec extension loaded");
    return {};
}

Result<void> SqliteVecIndex::initialize(std::size_t dimension) {
    if (dimension == 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension must be positive"};
    }

    auto loaded = loadExtension();
    if (!loaded)
        return loaded;

    dimension_ = dimension;
    return db_.execute("CREATE VIRTUAL TABLE IF NOT EXISTS knowledge_vec USING vec0("
                       "embedding float[" +
                       std::to_string(dimension) + "] distance_metric=cosine)");
}

Result<void> SqliteVecIndex::insert(EntryId id, std::span<const float> embedding) {
    if (embedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding has " + std::to_string(embedding.size()) + " dimensions, expected " +
                         std::to_string(dimension_)};
    }

    // vec0 accepts an explicit integer rowid; sqlite3_bind_int64 keeps the type exact
    auto stmtResult = db_.prepare("INSERT INTO knowledge_vec(rowid, embedding) VALUES (?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(id, asBlob(embedding));
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

Result<bool> SqliteVecIndex::remove(EntryId id) {
    auto stmtResult = db_.prepare("DELETE FROM knowledge_vec WHERE rowid = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult.error();
    return db_.changes() > 0;
}

Result<bool> SqliteVecIndex::contains(EntryId id) {
    auto stmtResult = db_.prepare("SELECT 1 FROM knowledge_vec WHERE rowid = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    return stmt.step();
}

Result<std::vector<VectorMatch>> SqliteVecIndex::search(std::span<const float> query,
                                                        std::size_t k) {
    if (query.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     "Query has " + std::to_string(query.size()) + " dimensions, expected " +
                         std::to_string(dimension_)};
    }
    std::vector<VectorMatch> matches;
    if (k == 0) {
        return matches;
    }

    auto stmtResult = db_.prepare("SELECT rowid, distance FROM knowledge_vec "
                                  "WHERE embedding MATCH ? AND k = ? "
                                  "ORDER BY distance ASC, rowid ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(asBlob(query), static_cast<int64_t>(k));
    if (!bindResult)
        return bindResult.error();

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        matches.push_back(VectorMatch{stmt.getInt64(0), stmt.getDouble(1)});
    }

    spdlog::debug("[SqliteVecIndex] KNN k={} returned {} rows", k, matches.size());
    return matches;
}

} // namespace lore::vector
