#pragma once

#include "tradestats/repository/DatabaseConfig.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace tradestats::repository {

class DatabaseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RowDecodeError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

class SqliteConnection {
public:
    class Statement {
    public:
        Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}
        Statement(Statement&& other) noexcept;
        Statement& operator=(Statement&&) = delete;
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;
        ~Statement();

        // True while a row is available. Throws DatabaseError on any step failure.
        bool step();

        sqlite3_stmt* get() const noexcept { return stmt_; }

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_;
    };

    // Opens an existing database file read-only. Throws DatabaseError when the file is
    // missing, unreadable, or not a database.
    explicit SqliteConnection(const DatabaseConfig& config);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    Statement prepare(const std::string& sql);

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    sqlite3* db_{};
};

} // namespace tradestats::repository
