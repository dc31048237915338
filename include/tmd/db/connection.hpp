#pragma once

#include <tmd/result.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace tmd {

namespace fs = std::filesystem;

/**
 * One result row, values rendered as text (NULL -> nullopt).
 */
struct Row {
    const std::vector<std::string>* columns = nullptr;
    std::vector<std::optional<std::string>> values;
};

/**
 * Connection - RAII wrapper around a sqlite3 handle.
 *
 * Connections are only handed out by DbHandle::with_read/with_write and
 * are closed when those calls return.
 */
class Connection {
public:
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    ~Connection();

    /**
     * Open a database file.
     *
     * @param path Database file
     * @param read_only Open with SQLITE_OPEN_READONLY
     * @param create Create the file if it does not exist (ignored when read_only)
     */
    static Result<Connection> open(const fs::path& path, bool read_only, bool create = false);

    /**
     * Run one or more ';'-separated statements, discarding rows.
     */
    Result<void> execute(const std::string& sql);

    /**
     * First column of the first row as an integer.
     */
    Result<int64_t> query_int(const std::string& sql);

    /**
     * Run a single statement and invoke on_row for every result row.
     */
    Result<void> query(const std::string& sql, const std::function<void(const Row&)>& on_row);

    bool read_only() const { return read_only_; }

private:
    Connection(sqlite3* db, bool read_only) : db_(db), read_only_(read_only) {}

    void close();
    std::string last_error() const;

    sqlite3* db_ = nullptr;
    bool read_only_ = false;
};

}  // namespace tmd
