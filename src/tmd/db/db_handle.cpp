#include <tmd/db/db_handle.hpp>
#include <tmd/util/file_io.hpp>
#include <tmd/util/logger.hpp>

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace tmd {

namespace {

constexpr const char* DB_FILE_NAME = "main.sqlite3";

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

Result<void> validate_options(const DbOptions& options) {
    if (options.page_size) {
        uint32_t size = *options.page_size;
        bool power_of_two = size != 0 && (size & (size - 1)) == 0;
        if (!power_of_two || size < 512 || size > 65536) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "page_size must be a power of two between 512 and 65536");
        }
    }
    if (options.journal_mode) {
        std::string mode = upper(*options.journal_mode);
        if (mode == "WAL") {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "journal_mode WAL is not supported for embedded databases");
        }
        if (mode != "DELETE" && mode != "TRUNCATE" && mode != "PERSIST" &&
            mode != "MEMORY" && mode != "OFF") {
            return Error(ErrorCode::INVALID_ARGUMENT, "unknown journal_mode " + *options.journal_mode);
        }
    }
    if (options.synchronous) {
        std::string mode = upper(*options.synchronous);
        if (mode != "OFF" && mode != "NORMAL" && mode != "FULL" && mode != "EXTRA") {
            return Error(ErrorCode::INVALID_ARGUMENT, "unknown synchronous mode " + *options.synchronous);
        }
    }
    return Ok();
}

// Open an image read-only and touch the schema so corrupt files fail early
Result<void> check_database_image(const fs::path& path) {
    auto conn = Connection::open(path, true);
    if (!conn.ok()) {
        return conn.error();
    }
    auto count = conn.value().query_int("SELECT count(*) FROM sqlite_master");
    if (!count.ok()) {
        return count.error();
    }
    return Ok();
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

DbHandle::DbHandle(DbHandle&& other) noexcept
    : dir_(std::move(other.dir_))
    , path_(std::move(other.path_))
    , options_(std::move(other.options_))
{
    other.dir_.clear();
    other.path_.clear();
}

DbHandle& DbHandle::operator=(DbHandle&& other) noexcept {
    if (this != &other) {
        cleanup();
        dir_ = std::move(other.dir_);
        path_ = std::move(other.path_);
        options_ = std::move(other.options_);
        other.dir_.clear();
        other.path_.clear();
    }
    return *this;
}

DbHandle::~DbHandle() {
    cleanup();
}

void DbHandle::cleanup() {
    if (dir_.empty()) return;

    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        logger().warning("failed to remove database directory " + dir_.string() + ": " + ec.message());
    } else {
        logger().debug("removed database directory " + dir_.string());
    }
    dir_.clear();
    path_.clear();
}

Result<DbHandle> DbHandle::create_private() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "no temporary directory available: " + ec.message());
    }

    std::string tmpl = (base / "tmd-db-XXXXXX").string();
    if (!mkdtemp(&tmpl[0])) {
        return Error(ErrorCode::IO_ERROR,
                     "failed to create database directory: " + std::string(std::strerror(errno)));
    }

    fs::path dir(tmpl);
    logger().debug("created database directory " + dir.string());
    return DbHandle(dir, dir / DB_FILE_NAME);
}

Result<DbHandle> DbHandle::new_empty() {
    auto created = create_private();
    if (!created.ok()) {
        return created.error();
    }
    DbHandle handle = std::move(created.value());

    auto conn = Connection::open(handle.path_, false, true);
    if (!conn.ok()) {
        return conn.error();
    }
    // Writing user_version forces SQLite to materialize the header page
    auto init = conn.value().execute("PRAGMA user_version = 0;");
    if (!init.ok()) {
        return init.error().with_context("failed to initialize database");
    }
    return Result<DbHandle>(std::move(handle));
}

Result<DbHandle> DbHandle::from_bytes(const Bytes& bytes) {
    if (!has_sqlite_magic(bytes.data(), bytes.size())) {
        return Error(ErrorCode::INVALID_FORMAT, "database image is not a SQLite 3 file");
    }

    auto created = create_private();
    if (!created.ok()) {
        return created.error();
    }
    DbHandle handle = std::move(created.value());

    auto written = write_file_atomic(handle.path_, bytes);
    if (!written.ok()) {
        return written.error();
    }

    auto readable = check_database_image(handle.path_);
    if (!readable.ok()) {
        return Error(ErrorCode::INVALID_FORMAT,
                     "database image is unreadable: " + readable.error().message());
    }
    return Result<DbHandle>(std::move(handle));
}

Result<DbHandle> DbHandle::clone() const {
    auto bytes = to_bytes();
    if (!bytes.ok()) {
        return bytes.error();
    }
    auto copy = from_bytes(bytes.value());
    if (!copy.ok()) {
        return copy.error();
    }
    copy.value().options_ = options_;
    return copy;
}

// ============================================================================
// Options
// ============================================================================

Result<void> DbHandle::configure(const DbOptions& options) {
    auto valid = validate_options(options);
    if (!valid.ok()) {
        return valid;
    }

    if (options.page_size) {
        auto conn = Connection::open(path_, false);
        if (!conn.ok()) {
            return conn.error();
        }
        auto current = conn.value().query_int("PRAGMA page_size");
        if (!current.ok()) {
            return current.error();
        }
        if (static_cast<uint32_t>(current.value()) != *options.page_size) {
            // page_size only takes effect on an existing database through VACUUM
            auto applied = conn.value().execute(
                "PRAGMA page_size = " + std::to_string(*options.page_size) + "; VACUUM;");
            if (!applied.ok()) {
                return applied.error().with_context("failed to change page_size");
            }
        }
    }

    options_ = options;
    return Ok();
}

Result<void> DbHandle::apply_options(Connection& conn) const {
    std::string sql;
    if (options_.journal_mode) {
        sql += "PRAGMA journal_mode = " + upper(*options_.journal_mode) + ";";
    }
    if (options_.synchronous) {
        sql += "PRAGMA synchronous = " + upper(*options_.synchronous) + ";";
    }
    if (sql.empty()) {
        return Ok();
    }
    return conn.execute(sql);
}

// ============================================================================
// Scoped access
// ============================================================================

Result<Connection> DbHandle::open_write() const {
    auto conn = Connection::open(path_, false);
    if (!conn.ok()) {
        return conn.error();
    }
    auto applied = apply_options(conn.value());
    if (!applied.ok()) {
        return applied.error();
    }
    return conn;
}

Result<void> DbHandle::with_read(const ConnectionFn& fn) const {
    auto conn = Connection::open(path_, true);
    if (!conn.ok()) {
        return conn.error();
    }
    return fn(conn.value());
}

Result<void> DbHandle::with_write(const ConnectionFn& fn) {
    auto conn = open_write();
    if (!conn.ok()) {
        return conn.error();
    }
    Connection& c = conn.value();

    auto begun = c.execute("BEGIN IMMEDIATE;");
    if (!begun.ok()) {
        return begun;
    }

    auto result = fn(c);
    if (!result.ok()) {
        auto rolled_back = c.execute("ROLLBACK;");
        if (!rolled_back.ok()) {
            logger().warning("rollback failed: " + rolled_back.error().message());
        }
        return result;
    }

    auto committed = c.execute("COMMIT;");
    if (!committed.ok()) {
        auto rolled_back = c.execute("ROLLBACK;");
        if (!rolled_back.ok()) {
            logger().warning("rollback after failed commit failed: " + rolled_back.error().message());
        }
        return committed.error().with_context("commit failed");
    }
    return Ok();
}

Result<uint32_t> DbHandle::user_version() const {
    uint32_t version = 0;
    auto read = with_read([&version](Connection& conn) -> Result<void> {
        auto v = conn.query_int("PRAGMA user_version");
        if (!v.ok()) {
            return v.error();
        }
        version = static_cast<uint32_t>(v.value());
        return Ok();
    });
    if (!read.ok()) {
        return read.error();
    }
    return version;
}

// ============================================================================
// Schema management
// ============================================================================

Result<void> DbHandle::reset(const std::string& schema_sql, uint32_t version) {
    fs::path staged = dir_ / "reset.sqlite3";
    std::error_code ec;
    fs::remove(staged, ec);

    Result<void> built = [&]() -> Result<void> {
        auto conn = Connection::open(staged, false, true);
        if (!conn.ok()) {
            return conn.error();
        }
        Connection& c = conn.value();

        if (options_.page_size) {
            auto ps = c.execute("PRAGMA page_size = " + std::to_string(*options_.page_size) + ";");
            if (!ps.ok()) {
                return ps;
            }
        }
        auto applied = apply_options(c);
        if (!applied.ok()) {
            return applied;
        }

        auto begun = c.execute("BEGIN;");
        if (!begun.ok()) {
            return begun;
        }
        auto schema = c.execute(schema_sql);
        if (!schema.ok()) {
            return Error(ErrorCode::INVALID_SCHEMA, "schema rejected: " + schema.error().message());
        }
        auto versioned = c.execute("PRAGMA user_version = " + std::to_string(version) + ";");
        if (!versioned.ok()) {
            return versioned;
        }
        return c.execute("COMMIT;");
    }();

    if (!built.ok()) {
        fs::remove(staged, ec);
        return built;
    }

    fs::rename(staged, path_, ec);
    if (ec) {
        fs::remove(staged, ec);
        return Error(ErrorCode::IO_ERROR, "failed to install reset database: " + ec.message());
    }
    logger().debug("database reset to user_version " + std::to_string(version));
    return Ok();
}

Result<void> DbHandle::migrate(const std::string& step_sql, uint32_t from, uint32_t to) {
    auto migrated = with_write([&](Connection& conn) -> Result<void> {
        auto current = conn.query_int("PRAGMA user_version");
        if (!current.ok()) {
            return current.error();
        }
        if (static_cast<uint32_t>(current.value()) != from) {
            return Error(ErrorCode::VERSION_MISMATCH,
                         "expected user_version " + std::to_string(from) +
                         " but found " + std::to_string(current.value()));
        }

        auto step = conn.execute(step_sql);
        if (!step.ok()) {
            return step.error().with_context("migration " + std::to_string(from) +
                                             " -> " + std::to_string(to) + " failed");
        }
        return conn.execute("PRAGMA user_version = " + std::to_string(to) + ";");
    });

    if (migrated.ok()) {
        logger().debug("database migrated " + std::to_string(from) + " -> " + std::to_string(to));
    }
    return migrated;
}

// ============================================================================
// Import / export
// ============================================================================

Result<Bytes> DbHandle::to_bytes() const {
    return read_file(path_);
}

Result<void> DbHandle::export_to(const fs::path& out) const {
    std::error_code ec;
    fs::copy_file(path_, out, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "failed to export database to '" + out.string() + "': " + ec.message());
    }
    return Ok();
}

Result<void> DbHandle::import_from(const fs::path& in) {
    auto bytes = read_file(in);
    if (!bytes.ok()) {
        return bytes.error();
    }
    return import_bytes(bytes.value());
}

Result<void> DbHandle::import_bytes(const Bytes& bytes) {
    if (!has_sqlite_magic(bytes.data(), bytes.size())) {
        return Error(ErrorCode::INVALID_FORMAT, "database image is not a SQLite 3 file");
    }
    return replace_file(bytes);
}

Result<void> DbHandle::replace_file(const Bytes& bytes) {
    fs::path staged = dir_ / "import.sqlite3";
    auto written = write_file_atomic(staged, bytes);
    if (!written.ok()) {
        return written;
    }

    std::error_code ec;
    auto readable = check_database_image(staged);
    if (!readable.ok()) {
        fs::remove(staged, ec);
        return Error(ErrorCode::INVALID_FORMAT,
                     "database image is unreadable: " + readable.error().message());
    }

    fs::rename(staged, path_, ec);
    if (ec) {
        fs::remove(staged, ec);
        return Error(ErrorCode::IO_ERROR, "failed to install imported database: " + ec.message());
    }
    return Ok();
}

}  // namespace tmd
