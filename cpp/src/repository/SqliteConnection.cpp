#include "tradestats/repository/SqliteConnection.hpp"
#include "tradestats/util/Logging.hpp"

#include <utility>

namespace tradestats::repository {

SqliteConnection::Statement::Statement(Statement&& other) noexcept
    : db_(other.db_)
    , stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteConnection::Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

bool SqliteConnection::Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseError(std::string{"SQLite step failed: "} + sqlite3_errmsg(db_));
}

SqliteConnection::SqliteConnection(const DatabaseConfig& config)
    : path_(config.path) {
    if (path_.empty()) {
        throw DatabaseError("Database path must be provided in configuration");
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        util::log(util::LogLevel::error, "Open SQLite database failed: " + message);
        throw DatabaseError("Cannot open database " + path_ + ": " + message);
    }

    sqlite3_busy_timeout(db_, config.busyTimeoutMs);

    // sqlite3_open_v2 is lazy; reading the schema version forces the header check so a
    // corrupt file fails here rather than on the first request.
    try {
        auto probe = prepare("PRAGMA schema_version");
        probe.step();
    } catch (const DatabaseError& err) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw DatabaseError("Cannot open database " + path_ + ": " + err.what());
    }
}

SqliteConnection::~SqliteConnection() {
    if (db_) {
        sqlite3_close(db_);
    }
}

SqliteConnection::Statement SqliteConnection::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        throw DatabaseError(std::string{"SQLite prepare failed: "} + sqlite3_errmsg(db_));
    }
    return Statement{db_, stmt};
}

} // namespace tradestats::repository
