#pragma once

#include <canopy/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace canopy::metadata {

// Library error code for a SQLite result code (primary or extended).
ErrorCode mapSqliteError(int rc) noexcept;

struct OpenOptions {
    std::chrono::milliseconds busyTimeout{5000};
    bool walJournal = true;
};

/**
 * @brief Prepared SQLite statement, finalized on destruction.
 *
 * Obtained from Database::prepare(). Busy and locked steps are retried with
 * backoff before they are reported.
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameter indexes start at 1
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);

    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindFrom(1, std::forward<Args>(args)...);
    }

    // Runs a statement that returns no rows.
    Result<void> execute();
    // true while a row is available.
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

private:
    friend class Database;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

    Error failure(int rc, std::string_view what) const;

    template <typename T, typename... Rest>
    Result<void> bindFrom(int index, T&& value, Rest&&... rest) {
        if (auto r = bind(index, std::forward<T>(value)); !r)
            return r;
        if constexpr (sizeof...(rest) > 0) {
            return bindFrom(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

class Transaction;

/**
 * @brief Single SQLite connection, closed on destruction.
 */
class Database {
public:
    // Opens or creates the file, then applies the busy timeout and journal mode.
    static Result<Database> open(const std::filesystem::path& path, const OpenOptions& options = {});
    static Result<Database> openInMemory();

    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<Statement> prepare(std::string_view sql);
    Result<void> execute(const std::string& sql);

    // BEGIN IMMEDIATE; the returned guard rolls back unless committed.
    Result<Transaction> begin();

    int changes() const;
    [[nodiscard]] const std::string& path() const { return path_; }

private:
    friend class Transaction;

    void close() noexcept;

    sqlite3* db_ = nullptr;
    std::string path_;
};

class Transaction {
public:
    ~Transaction();

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&&) = delete;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result<void> commit();

private:
    friend class Database;
    explicit Transaction(Database& db) : db_(&db) {}

    Database* db_;
};

} // namespace canopy::metadata
