#include "storage/database.hpp"

namespace spool::storage {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

Error sqlite_error(int rc, std::string_view what, const std::string& detail) {
    const int primary = rc & 0xFF;
    const bool duplicate = rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE;
    std::string message = std::string(what) + " failed (" + sqlite3_errstr(primary) + ")";
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return Error{duplicate ? ErrorCode::DuplicateId : ErrorCode::IoFailure, std::move(message)};
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

Statement& Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK && bind_error_ == SQLITE_OK) bind_error_ = rc;
    return *this;
}

Statement& Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK && bind_error_ == SQLITE_OK) bind_error_ = rc;
    return *this;
}

Statement& Statement::bind_blob(int index, const std::vector<uint8_t>& data) {
    // A zero-length blob still needs a non-null pointer or SQLite stores NULL.
    static const uint8_t empty = 0;
    const void* ptr = data.empty() ? static_cast<const void*>(&empty) : data.data();
    int rc = sqlite3_bind_blob(stmt_.get(), index, ptr,
                               static_cast<int>(data.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK && bind_error_ == SQLITE_OK) bind_error_ = rc;
    return *this;
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK && bind_error_ == SQLITE_OK) bind_error_ = rc;
    return *this;
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

std::vector<uint8_t> Statement::column_blob(int index) const {
    const void* data = sqlite3_column_blob(stmt_.get(), index);
    int size = sqlite3_column_bytes(stmt_.get(), index);
    if (!data || size <= 0) return {};

    const auto* bytes = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(bytes, bytes + size);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    if (bind_error_ != SQLITE_OK) {
        return Result<bool, Error>::err(sqlite_error(bind_error_, "Bind", ""));
    }
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(sqlite_error(rc, "Step", db ? sqlite3_errmsg(db) : ""));
}

Result<void, Error> Statement::run() {
    auto result = step();
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = handle ? sqlite3_errmsg(handle) : "unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(sqlite_error(rc, "Open " + path, detail));
    }

    Database db(handle);
    sqlite3_extended_result_codes(handle, 1);
    sqlite3_busy_timeout(handle, BUSY_TIMEOUT_MS);

    auto pragma = db.execute("PRAGMA foreign_keys = ON;");
    if (pragma.is_err()) {
        return Result<Database, Error>::err(pragma.unwrap_err());
    }

    // WAL lets readers proceed while a sync cycle writes. In-memory
    // databases silently keep their own journal mode.
    pragma = db.execute("PRAGMA journal_mode = WAL;");
    if (pragma.is_err()) {
        return Result<Database, Error>::err(pragma.unwrap_err());
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(std::string_view sql) {
    if (!db_) {
        return fail<Statement>(ErrorCode::IoFailure, "Database not open");
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error(rc, "Prepare", last_error()));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return fail(ErrorCode::IoFailure, "Database not open");
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string detail = error_msg ? error_msg : "";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(sqlite_error(rc, "Execute", detail));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction(TransactionMode mode) {
    return execute(mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db, TransactionMode mode)
    : db_(db)
    , status_(db.begin_transaction(mode))
{
    active_ = status_.is_ok();
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        // Destructors cannot report; the caller already has the error that
        // made it skip commit().
        auto result = db_.rollback();
        (void)result;
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return status_.is_err() ? status_ : fail(ErrorCode::IoFailure, "No active transaction");
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

} // namespace spool::storage
