#include <tmd/db/connection.hpp>

#include <sqlite3.h>

#include <utility>

namespace tmd {

Connection::Connection(Connection&& other) noexcept
    : db_(std::exchange(other.db_, nullptr))
    , read_only_(other.read_only_)
{}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        read_only_ = other.read_only_;
    }
    return *this;
}

Connection::~Connection() {
    close();
}

void Connection::close() {
    if (db_) {
        // close_v2 never leaves the handle half-open: unfinalized statements
        // turn it into a zombie that SQLite frees later.
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

std::string Connection::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "no connection";
}

Result<Connection> Connection::open(const fs::path& path, bool read_only, bool create) {
    int flags = read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
    if (!read_only && create) {
        flags |= SQLITE_OPEN_CREATE;
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        return Error(ErrorCode::DB_ERROR, "failed to open database: " + msg);
    }

    sqlite3_extended_result_codes(db, 1);
    return Connection(db, read_only);
}

Result<void> Connection::execute(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : last_error();
        sqlite3_free(err);
        return Error(ErrorCode::DB_ERROR, msg);
    }
    return Ok();
}

Result<int64_t> Connection::query_int(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return Error(ErrorCode::DB_ERROR, last_error());
    }

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        std::string msg = rc == SQLITE_DONE ? "query returned no rows" : last_error();
        sqlite3_finalize(stmt);
        return Error(ErrorCode::DB_ERROR, msg);
    }

    int64_t value = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return value;
}

Result<void> Connection::query(const std::string& sql,
                               const std::function<void(const Row&)>& on_row) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return Error(ErrorCode::DB_ERROR, last_error());
    }
    if (!stmt) {
        return Ok();  // empty statement
    }

    int count = sqlite3_column_count(stmt);
    std::vector<std::string> columns;
    columns.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        columns.push_back(name ? name : "");
    }

    Row row;
    row.columns = &columns;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row.values.clear();
        for (int i = 0; i < count; ++i) {
            if (sqlite3_column_type(stmt, i) == SQLITE_NULL) {
                row.values.emplace_back(std::nullopt);
            } else {
                const unsigned char* text = sqlite3_column_text(stmt, i);
                int len = sqlite3_column_bytes(stmt, i);
                if (!text || len <= 0) {
                    row.values.emplace_back(std::string());
                } else {
                    row.values.emplace_back(std::string(reinterpret_cast<const char*>(text),
                                                        static_cast<size_t>(len)));
                }
            }
        }
        on_row(row);
    }

    if (rc != SQLITE_DONE) {
        std::string msg = last_error();
        sqlite3_finalize(stmt);
        return Error(ErrorCode::DB_ERROR, msg);
    }
    sqlite3_finalize(stmt);
    return Ok();
}

}  // namespace tmd
