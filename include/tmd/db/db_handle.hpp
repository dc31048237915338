#pragma once

#include <tmd/core_types.hpp>
#include <tmd/db/connection.hpp>
#include <tmd/result.hpp>
#include <tmd/types.hpp>

#include <filesystem>
#include <functional>
#include <string>

namespace tmd {

namespace fs = std::filesystem;

/**
 * DbHandle - Owns the embedded SQLite database of one document.
 *
 * The database lives in a private temporary directory created by the
 * handle and removed by its destructor. The file path is never exposed;
 * all access goes through scoped connections that are closed before the
 * call returns, so no connection outlives a single operation.
 *
 * The schema version is SQLite's PRAGMA user_version.
 */
class DbHandle {
public:
    using ConnectionFn = std::function<Result<void>(Connection&)>;

    DbHandle(DbHandle&& other) noexcept;
    DbHandle& operator=(DbHandle&& other) noexcept;
    DbHandle(const DbHandle&) = delete;
    DbHandle& operator=(const DbHandle&) = delete;

    ~DbHandle();

    /**
     * Materialize an empty database with user_version 0.
     */
    static Result<DbHandle> new_empty();

    /**
     * Materialize a database from an existing file image.
     * Fails with INVALID_FORMAT if the bytes are not a readable SQLite file.
     */
    static Result<DbHandle> from_bytes(const Bytes& bytes);

    /**
     * Deep copy into a new private file.
     */
    Result<DbHandle> clone() const;

    /**
     * Apply page_size / journal_mode / synchronous. Settings are kept and
     * re-applied to every write connection. journal_mode WAL is rejected
     * because the single backing file must stay self-contained.
     */
    Result<void> configure(const DbOptions& options);

    /**
     * Run fn with a read-only connection.
     */
    Result<void> with_read(const ConnectionFn& fn) const;

    /**
     * Run fn with a read-write connection inside BEGIN IMMEDIATE. The
     * transaction commits if fn succeeds and rolls back otherwise, so
     * statements grouped in one call are atomic.
     */
    Result<void> with_write(const ConnectionFn& fn);

    Result<uint32_t> user_version() const;

    /**
     * Replace all content with schema_sql and set user_version.
     * Builds the new file beside the current one and swaps it in only on
     * success; on INVALID_SCHEMA the previous content is untouched.
     */
    Result<void> reset(const std::string& schema_sql, uint32_t version);

    /**
     * Apply one migration step. Fails with VERSION_MISMATCH unless
     * user_version == from; otherwise runs step_sql and sets user_version
     * to `to` in one transaction. On failure user_version stays at from.
     * step_sql must not contain its own BEGIN/COMMIT.
     */
    Result<void> migrate(const std::string& step_sql, uint32_t from, uint32_t to);

    // Copy the database file out to / in from an external location
    Result<void> export_to(const fs::path& out) const;
    Result<void> import_from(const fs::path& in);

    // Replace the content with a file image (validated like from_bytes)
    Result<void> import_bytes(const Bytes& bytes);

    // Current file image, as stored in db/main.sqlite3
    Result<Bytes> to_bytes() const;

private:
    DbHandle(fs::path dir, fs::path path) : dir_(std::move(dir)), path_(std::move(path)) {}

    static Result<DbHandle> create_private();

    Result<Connection> open_write() const;
    Result<void> apply_options(Connection& conn) const;
    Result<void> replace_file(const Bytes& bytes);
    void cleanup();

    fs::path dir_;
    fs::path path_;
    DbOptions options_;
};

}  // namespace tmd
