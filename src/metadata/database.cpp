#include <spdlog/spdlog.h>
#include <canopy/metadata/database.h>

#include <thread>

namespace canopy::metadata {

namespace {

constexpr int kMaxRetries = 5;
constexpr auto kInitialBackoff = std::chrono::milliseconds(10);

bool isContention(int rc) {
    const int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

Error connectionError(sqlite3* db, int rc, std::string_view what) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return Error{mapSqliteError(rc), std::string(what) + ": " + detail};
}

} // namespace

ErrorCode mapSqliteError(int rc) noexcept {
    switch (rc & 0xff) {
        case SQLITE_OK:
        case SQLITE_ROW:
        case SQLITE_DONE:
            return ErrorCode::Success;
        case SQLITE_FULL:
            return ErrorCode::StorageFull;
        case SQLITE_PERM:
        case SQLITE_READONLY:
        case SQLITE_AUTH:
        case SQLITE_CANTOPEN:
            return ErrorCode::PermissionDenied;
        case SQLITE_IOERR:
            return ErrorCode::WriteError;
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return ErrorCode::CorruptedData;
        case SQLITE_CONSTRAINT:
        case SQLITE_MISMATCH:
        case SQLITE_TOOBIG:
            return ErrorCode::InvalidData;
        case SQLITE_MISUSE:
            return ErrorCode::InvalidState;
        default:
            // BUSY and LOCKED land here once retries are exhausted
            return ErrorCode::DatabaseError;
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }
    return *this;
}

Error Statement::failure(int rc, std::string_view what) const {
    return connectionError(db_, rc, what);
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    if (int rc = sqlite3_bind_null(stmt_, index); rc != SQLITE_OK) {
        return failure(rc, "bind null to parameter " + std::to_string(index));
    }
    return {};
}

Result<void> Statement::bind(int index, int value) {
    if (int rc = sqlite3_bind_int(stmt_, index, value); rc != SQLITE_OK) {
        return failure(rc, "bind int to parameter " + std::to_string(index));
    }
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    if (int rc = sqlite3_bind_int64(stmt_, index, value); rc != SQLITE_OK) {
        return failure(rc, "bind int64 to parameter " + std::to_string(index));
    }
    return {};
}

Result<void> Statement::bind(int index, double value) {
    if (int rc = sqlite3_bind_double(stmt_, index, value); rc != SQLITE_OK) {
        return failure(rc, "bind double to parameter " + std::to_string(index));
    }
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return failure(rc, "bind text to parameter " + std::to_string(index));
    }
    return {};
}

Result<void> Statement::execute() {
    auto r = step();
    if (!r)
        return r.error();
    if (r.value()) {
        return Error{ErrorCode::InvalidOperation, "statement returned rows; use step()"};
    }
    return {};
}

Result<bool> Statement::step() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "statement not prepared"};
    }

    auto backoff = kInitialBackoff;
    for (int attempt = 1;; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)
            return true;
        if (rc == SQLITE_DONE)
            return false;

        if (isContention(rc) && attempt < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        auto error = failure(rc, "step");
        // Leave the statement reusable after a failed step
        sqlite3_reset(stmt_);
        return error;
    }
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database> Database::open(const std::filesystem::path& path, const OpenOptions& options) {
    Database db;
    int rc = sqlite3_open_v2(path.c_str(), &db.db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc != SQLITE_OK) {
        return connectionError(db.db_, rc, "open " + path.string());
    }
    db.path_ = path.string();

    rc = sqlite3_busy_timeout(db.db_, static_cast<int>(options.busyTimeout.count()));
    if (rc != SQLITE_OK) {
        return connectionError(db.db_, rc, "set busy timeout");
    }
    // Fails with SQLITE_NOTADB when the file is not a database
    if (options.walJournal) {
        if (auto r = db.execute("PRAGMA journal_mode=WAL"); !r) {
            return r.error();
        }
    } else if (auto r = db.execute("PRAGMA schema_version"); !r) {
        return r.error();
    }
    return std::move(db);
}

Result<Database> Database::openInMemory() {
    Database db;
    int rc = sqlite3_open_v2(":memory:", &db.db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY,
                             nullptr);
    if (rc != SQLITE_OK) {
        return connectionError(db.db_, rc, "open in-memory database");
    }
    db.path_ = ":memory:";
    return std::move(db);
}

void Database::close() noexcept {
    if (db_) {
        if (int rc = sqlite3_close(db_); rc != SQLITE_OK) {
            spdlog::warn("Closing SQLite database {} failed: {}", path_, sqlite3_errstr(rc));
        }
        db_ = nullptr;
    }
    path_.clear();
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "database not open"};
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto error = connectionError(db_, rc, "prepare");
        sqlite3_finalize(stmt);
        return error;
    }
    return Statement(db_, stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string detail = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        spdlog::error("SQL exec failed ({}): {}", detail, sql);
        return Error{mapSqliteError(rc), "exec: " + detail};
    }
    return {};
}

Result<Transaction> Database::begin() {
    if (auto r = execute("BEGIN IMMEDIATE"); !r) {
        return r.error();
    }
    return Transaction(*this);
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Transaction::Transaction(Transaction&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Transaction::~Transaction() {
    if (!db_) {
        return;
    }
    if (auto r = db_->execute("ROLLBACK"); !r) {
        spdlog::warn("SQLite rollback failed: {}", r.error().message);
    }
}

Result<void> Transaction::commit() {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "transaction already finished"};
    }
    auto r = db_->execute("COMMIT");
    if (r) {
        db_ = nullptr;
    }
    return r;
}

} // namespace canopy::metadata
