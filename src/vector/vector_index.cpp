#include <spdlog/spdlog.h>
#include <cmath>
#include <cstring>
#include <lore/vector/vector_index.h>

namespace lore::vector {

std::vector<float> normalizeEmbedding(std::span<const float> embedding) {
    std::vector<float> out(embedding.begin(), embedding.end());
    double sumSquares = 0.0;
    for (float v : out) {
        sumSquares += static_cast<double>(v) * static_cast<double>(v);
    }
    const double norm = std::sqrt(sumSquares);
    if (norm < 1e-12) {
        return out;
    }
    for (auto& v : out) {
        v = static_cast<float>(static_cast<double>(v) / norm);
    }
    return out;
}

double cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }
    double dot = 0.0, normA = 0.0, normB = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA < 1e-24 || normB < 1e-24) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

std::span<const std::byte> asBlob(std::span<const float> embedding) {
    return std::as_bytes(embedding);
}

std::vector<float> fromBlob(const std::vector<std::byte>& blob) {
    std::vector<float> out(blob.size() / sizeof(float));
    if (!out.empty()) {
        std::memcpy(out.data(), blob.data(), out.size() * sizeof(float));
    }
    return out;
}

Result<int> pruneOrphanVectors(metadata::Database& db, IVectorIndex& index) {
    auto result = db.execute("DELETE FROM " + index.tableName() +
                             " WHERE rowid NOT IN (SELECT id FROM knowledge)");
    if (!result)
        return result.error();
    return db.changes();
}

Result<void> removeDetachedVector(metadata::Database& db, EntryId id) {
    auto present = db.tableExists(ScanVectorIndex::kTableName);
    if (!present)
        return present.error();
    if (!present.value())
        return {};

    auto stmtResult =
        db.prepare(std::string("DELETE FROM ") + ScanVectorIndex::kTableName + " WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();
    metadata::Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, id); !r)
        return r;
    auto execResult = stmt.execute();
    if (!execResult)
        return execResult;
    if (db.changes() > 0) {
        spdlog::debug("[VectorIndex] Removed detached vector row {}", id);
    }
    return {};
}

Result<std::unique_ptr<IVectorIndex>> createVectorIndex(metadata::Database& db,
                                                        const config::StoreConfig& config) {
    switch (config.vectorBackend) {
        case config::VectorBackendType::SqliteVec:
            return std::unique_ptr<IVectorIndex>(
                std::make_unique<SqliteVecIndex>(db, config.vectorExtension));
        case config::VectorBackendType::Scan:
            return std::unique_ptr<IVectorIndex>(std::make_unique<ScanVectorIndex>(db));
        case config::VectorBackendType::None:
            break;
    }
    return Error{ErrorCode::NotSupported, "Vector backend disabled by configuration"};
}

} // namespace lore::vector
