#include <spdlog/spdlog.h>
#include <algorithm>
#include <lore/vector/vector_index.h>

namespace lore::vector {

using metadata::Statement;

ScanVectorIndex::ScanVectorIndex(metadata::Database& db) : db_(db) {}

Result<void> ScanVectorIndex::initialize(std::size_t dimension) {
    if (dimension == 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension must be positive"};
    }
    dimension_ = dimension;
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS knowledge_vec_scan (
            id INTEGER PRIMARY KEY,
            embedding BLOB NOT NULL
        )
    )");
}

Result<void> ScanVectorIndex::insert(EntryId id, std::span<const float> embedding) {
    if (embedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding has " + std::to_string(embedding.size()) + " dimensions, expected " +
                         std::to_string(dimension_)};
    }

    auto stmtResult = db_.prepare("INSERT INTO knowledge_vec_scan(id, embedding) VALUES (?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(id, asBlob(embedding));
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

Result<bool> ScanVectorIndex::remove(EntryId id) {
    auto stmtResult = db_.prepare("DELETE FROM knowledge_vec_scan WHERE id = ?");
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

Result<bool> ScanVectorIndex::contains(EntryId id) {
    auto stmtResult = db_.prepare("SELECT 1 FROM knowledge_vec_scan WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, id);
    if (!bindResult)
        return bindResult.error();

    return stmt.step();
}

Result<std::vector<VectorMatch>> ScanVectorIndex::search(std::span<const float> query,
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

    auto stmtResult = db_.prepare("SELECT id, embedding FROM knowledge_vec_scan");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        auto stored = fromBlob(stmt.getBlob(1));
        if (stored.size() != dimension_) {
            spdlog::warn("[ScanVectorIndex] Skipping row {} with {} dimensions", stmt.getInt64(0),
                         stored.size());
            continue;
        }
        matches.push_back(VectorMatch{stmt.getInt64(0), 1.0 - cosineSimilarity(query, stored)});
    }

    std::sort(matches.begin(), matches.end(), [](const VectorMatch& a, const VectorMatch& b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        return a.id < b.id;
    });
    if (matches.size() > k) {
        matches.resize(k);
    }
    return matches;
}

} // namespace lore::vector
