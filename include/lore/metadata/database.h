#pragma once

#include <lore/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lore::metadata {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    Create     ///< Create if not exists
};

/**
 * @brief Locking behaviour of BEGIN
 */
enum class TransactionMode {
    Deferred, ///< Lock on first access (reads)
    Immediate ///< Take the writer lock up front (writes)
};

/**
 * @brief Map a SQLite result code to an ErrorCode
 *
 * SQLITE_BUSY and SQLITE_LOCKED become Timeout; SQLITE_CORRUPT and
 * SQLITE_NOTADB become CorruptedData.
 */
ErrorCode translateSqliteError(int sqliteError);

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    /**
     * @brief Get column values
     */
    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

    int columnCount() const;

    /**
     * @brief Reset statement for reuse
     */
    Result<void> reset();

private:
    sqlite3_stmt* stmt_ = nullptr;

    Error stepError(int rc, const char* what) const;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    /**
     * @brief Close database connection
     */
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction(TransactionMode mode = TransactionMode::Deferred);
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute within transaction
     *
     * The callable returns Result<void>; an error result or an exception rolls back.
     */
    template <typename Func>
    Result<void> transaction(Func&& func, TransactionMode mode = TransactionMode::Deferred) {
        auto beginResult = beginTransaction(mode);
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                rollback();
                return result;
            }
            auto commitResult = commit();
            if (!commitResult) {
                rollback();
            }
            return commitResult;
        } catch (...) {
            rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;

    /**
     * @brief Get number of rows affected by last query
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    /**
     * @brief Check if FTS5 is available
     */
    Result<bool> hasFTS5();

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Enable WAL mode
     */
    Result<void> enableWAL();

    /**
     * @brief Run a pragma and return its first result column as text
     */
    Result<std::string> pragmaValue(const std::string& pragma);

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

    /**
     * @brief Raw handle for extension loading and virtual-table setup
     */
    [[nodiscard]] sqlite3* nativeHandle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

/**
 * @brief Query builder for constructing SELECT statements
 */
class QueryBuilder {
public:
    QueryBuilder() = default;

    QueryBuilder& select(const std::vector<std::string>& columns = {});
    QueryBuilder& from(const std::string& table);
    QueryBuilder& join(const std::string& table, const std::string& on);
    QueryBuilder& where(const std::string& condition);
    QueryBuilder& andWhere(const std::string& condition);
    QueryBuilder& groupBy(const std::string& column);
    QueryBuilder& orderBy(const std::string& clause);
    QueryBuilder& limit(int limit);

    [[nodiscard]] std::string build() const;

    void reset();

private:
    std::string table_;
    std::vector<std::string> selectColumns_;
    std::vector<std::string> whereClauses_;
    std::vector<std::string> joinClauses_;
    std::string groupByClause_;
    std::string orderByClause_;
    int limit_ = -1;
};

} // namespace lore::metadata
