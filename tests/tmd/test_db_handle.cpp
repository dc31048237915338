#include <gtest/gtest.h>
#include <tmd/db/db_handle.hpp>
#include <tmd/util/file_io.hpp>

#include <filesystem>
#include <set>

using namespace tmd;
namespace fs = std::filesystem;

class DbHandleTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            (std::string("tmd_db_test_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    DbHandle make_db() {
        auto result = DbHandle::new_empty();
        EXPECT_TRUE(result.ok()) << result.error().to_string();
        return std::move(result.value());
    }

    uint32_t version_of(const DbHandle& db) {
        auto v = db.user_version();
        EXPECT_TRUE(v.ok()) << v.error().to_string();
        return v.ok() ? v.value() : 0xFFFFFFFFu;
    }

    int64_t count_rows(const DbHandle& db, const std::string& table) {
        int64_t count = -1;
        auto read = db.with_read([&](Connection& conn) -> Result<void> {
            auto n = conn.query_int("SELECT count(*) FROM " + table);
            if (!n.ok()) return n.error();
            count = n.value();
            return Ok();
        });
        EXPECT_TRUE(read.ok()) << read.error().to_string();
        return count;
    }

    // Private database directories currently in the temp directory
    std::set<fs::path> db_dirs() {
        std::set<fs::path> dirs;
        for (const auto& entry : fs::directory_iterator(fs::temp_directory_path())) {
            if (entry.path().filename().string().rfind("tmd-db-", 0) == 0) {
                dirs.insert(entry.path());
            }
        }
        return dirs;
    }

    fs::path test_dir_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(DbHandleTest, NewEmptyStartsAtVersionZero) {
    DbHandle db = make_db();
    EXPECT_EQ(version_of(db), 0u);

    auto bytes = db.to_bytes();
    ASSERT_TRUE(bytes.ok());
    EXPECT_TRUE(has_sqlite_magic(bytes.value().data(), bytes.value().size()));
}

TEST_F(DbHandleTest, BackingDirectoryRemovedOnDestruction) {
    std::set<fs::path> before = db_dirs();
    std::set<fs::path> created;
    {
        DbHandle db = make_db();
        for (const auto& dir : db_dirs()) {
            if (before.count(dir) == 0) created.insert(dir);
        }
        ASSERT_FALSE(created.empty());
    }

    // Other processes may create directories meanwhile; ours must be gone
    size_t removed = 0;
    for (const auto& dir : created) {
        if (!fs::exists(dir)) ++removed;
    }
    EXPECT_GE(removed, 1u);
}

TEST_F(DbHandleTest, MovedFromHandleDoesNotRemoveFile) {
    DbHandle a = make_db();
    DbHandle b = std::move(a);
    EXPECT_EQ(version_of(b), 0u);
}

TEST_F(DbHandleTest, FromBytesRejectsNonSqlite) {
    Bytes junk(100, 0x41);
    auto result = DbHandle::from_bytes(junk);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_FORMAT);

    EXPECT_EQ(DbHandle::from_bytes(Bytes{}).error_code(), ErrorCode::INVALID_FORMAT);
}

TEST_F(DbHandleTest, BytesRoundTrip) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x INTEGER); INSERT INTO t VALUES (1), (2);", 5).ok());

    auto bytes = db.to_bytes();
    ASSERT_TRUE(bytes.ok());
    auto copy = DbHandle::from_bytes(bytes.value());
    ASSERT_TRUE(copy.ok()) << copy.error().to_string();

    EXPECT_EQ(version_of(copy.value()), 5u);
    EXPECT_EQ(count_rows(copy.value(), "t"), 2);
}

TEST_F(DbHandleTest, CloneIsIndependent) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x INTEGER);", 1).ok());

    auto clone = db.clone();
    ASSERT_TRUE(clone.ok());
    ASSERT_TRUE(clone.value().with_write([](Connection& conn) {
        return conn.execute("INSERT INTO t VALUES (42);");
    }).ok());

    EXPECT_EQ(count_rows(clone.value(), "t"), 1);
    EXPECT_EQ(count_rows(db, "t"), 0);
}

// ============================================================================
// Scoped access
// ============================================================================

TEST_F(DbHandleTest, WriteCommitsOnSuccess) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x INTEGER);", 1).ok());

    auto written = db.with_write([](Connection& conn) -> Result<void> {
        auto a = conn.execute("INSERT INTO t VALUES (1);");
        if (!a.ok()) return a;
        return conn.execute("INSERT INTO t VALUES (2);");
    });
    ASSERT_TRUE(written.ok()) << written.error().to_string();
    EXPECT_EQ(count_rows(db, "t"), 2);
}

TEST_F(DbHandleTest, WriteRollsBackOnFailure) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x INTEGER);", 1).ok());

    auto written = db.with_write([](Connection& conn) -> Result<void> {
        auto a = conn.execute("INSERT INTO t VALUES (1);");
        if (!a.ok()) return a;
        return conn.execute("INSERT INTO missing VALUES (2);");
    });
    ASSERT_FALSE(written.ok());
    EXPECT_EQ(written.error_code(), ErrorCode::DB_ERROR);
    EXPECT_EQ(count_rows(db, "t"), 0);
}

TEST_F(DbHandleTest, CallbackErrorIsPropagated) {
    DbHandle db = make_db();
    auto written = db.with_write([](Connection&) -> Result<void> {
        return Error(ErrorCode::INVALID_ARGUMENT, "caller gave up");
    });
    ASSERT_FALSE(written.ok());
    EXPECT_EQ(written.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(written.error().message(), "caller gave up");
}

TEST_F(DbHandleTest, ReadConnectionIsReadOnly) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x INTEGER);", 1).ok());

    auto attempted = db.with_read([](Connection& conn) -> Result<void> {
        EXPECT_TRUE(conn.read_only());
        return conn.execute("INSERT INTO t VALUES (1);");
    });
    EXPECT_FALSE(attempted.ok());
    EXPECT_EQ(count_rows(db, "t"), 0);
}

TEST_F(DbHandleTest, QueryRows) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(name TEXT, n INTEGER);"
                         "INSERT INTO t VALUES ('a', 1), (NULL, 2);", 1).ok());

    std::vector<std::vector<std::optional<std::string>>> rows;
    std::vector<std::string> columns;
    auto read = db.with_read([&](Connection& conn) {
        return conn.query("SELECT name, n FROM t ORDER BY n", [&](const Row& row) {
            if (row.columns) columns = *row.columns;
            rows.push_back(row.values);
        });
    });
    ASSERT_TRUE(read.ok()) << read.error().to_string();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(columns, (std::vector<std::string>{"name", "n"}));
    EXPECT_EQ(rows[0][0], "a");
    EXPECT_EQ(rows[0][1], "1");
    EXPECT_FALSE(rows[1][0].has_value());
}

// ============================================================================
// Reset and migrate
// ============================================================================

TEST_F(DbHandleTest, ResetReplacesContent) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE old(x);", 1).ok());
    ASSERT_TRUE(db.reset("CREATE TABLE fresh(y);", 7).ok());

    EXPECT_EQ(version_of(db), 7u);
    auto missing = db.with_read([](Connection& conn) -> Result<void> {
        auto n = conn.query_int("SELECT count(*) FROM old");
        if (!n.ok()) return n.error();
        return Ok();
    });
    EXPECT_FALSE(missing.ok());
    EXPECT_EQ(count_rows(db, "fresh"), 0);
}

TEST_F(DbHandleTest, ResetFailureKeepsPreviousContent) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x); INSERT INTO t VALUES (1);", 2).ok());

    auto reset = db.reset("CREATE TABLE broken(", 9);
    ASSERT_FALSE(reset.ok());
    EXPECT_EQ(reset.error_code(), ErrorCode::INVALID_SCHEMA);

    EXPECT_EQ(version_of(db), 2u);
    EXPECT_EQ(count_rows(db, "t"), 1);
}

TEST_F(DbHandleTest, MigrateAdvancesVersion) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x);", 1).ok());

    auto migrated = db.migrate("ALTER TABLE t ADD COLUMN y TEXT;", 1, 2);
    ASSERT_TRUE(migrated.ok()) << migrated.error().to_string();
    EXPECT_EQ(version_of(db), 2u);

    ASSERT_TRUE(db.with_write([](Connection& conn) {
        return conn.execute("INSERT INTO t(x, y) VALUES (1, 'y');");
    }).ok());
}

TEST_F(DbHandleTest, MigrateFromWrongVersionLeavesCounter) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x);", 3).ok());

    auto migrated = db.migrate("ALTER TABLE t ADD COLUMN y TEXT;", 2, 4);
    ASSERT_FALSE(migrated.ok());
    EXPECT_EQ(migrated.error_code(), ErrorCode::VERSION_MISMATCH);
    EXPECT_EQ(version_of(db), 3u);
}

TEST_F(DbHandleTest, MigrateWithInvalidSqlLeavesCounter) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x);", 3).ok());

    auto migrated = db.migrate("CREATE TABLE u(a); THIS IS NOT SQL;", 3, 4);
    ASSERT_FALSE(migrated.ok());
    EXPECT_EQ(migrated.error_code(), ErrorCode::DB_ERROR);
    EXPECT_EQ(version_of(db), 3u);

    // The partial step was rolled back with it
    auto missing = db.with_read([](Connection& conn) -> Result<void> {
        auto n = conn.query_int("SELECT count(*) FROM u");
        if (!n.ok()) return n.error();
        return Ok();
    });
    EXPECT_FALSE(missing.ok());
}

// ============================================================================
// Import / export / options
// ============================================================================

TEST_F(DbHandleTest, ExportAndImport) {
    DbHandle source = make_db();
    ASSERT_TRUE(source.reset("CREATE TABLE t(x); INSERT INTO t VALUES (1), (2), (3);", 4).ok());

    fs::path file = test_dir_ / "export.sqlite3";
    ASSERT_TRUE(source.export_to(file).ok());
    ASSERT_TRUE(fs::exists(file));

    DbHandle target = make_db();
    auto imported = target.import_from(file);
    ASSERT_TRUE(imported.ok()) << imported.error().to_string();
    EXPECT_EQ(version_of(target), 4u);
    EXPECT_EQ(count_rows(target, "t"), 3);
}

TEST_F(DbHandleTest, ImportRejectsGarbageAndKeepsContent) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x);", 1).ok());

    fs::path file = test_dir_ / "garbage.bin";
    ASSERT_TRUE(write_file_atomic(file, Bytes(64, 0x00)).ok());

    auto imported = db.import_from(file);
    ASSERT_FALSE(imported.ok());
    EXPECT_EQ(imported.error_code(), ErrorCode::INVALID_FORMAT);
    EXPECT_EQ(version_of(db), 1u);

    EXPECT_EQ(db.import_from(test_dir_ / "missing.sqlite3").error_code(), ErrorCode::IO_ERROR);
}

TEST_F(DbHandleTest, ConfigureValidatesOptions) {
    DbHandle db = make_db();

    DbOptions wal;
    wal.journal_mode = "wal";
    EXPECT_EQ(db.configure(wal).error_code(), ErrorCode::INVALID_ARGUMENT);

    DbOptions bad_page;
    bad_page.page_size = 1000;
    EXPECT_EQ(db.configure(bad_page).error_code(), ErrorCode::INVALID_ARGUMENT);

    DbOptions bad_sync;
    bad_sync.synchronous = "sometimes";
    EXPECT_EQ(db.configure(bad_sync).error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DbHandleTest, ConfigureAppliesPageSize) {
    DbHandle db = make_db();
    ASSERT_TRUE(db.reset("CREATE TABLE t(x); INSERT INTO t VALUES (1);", 1).ok());

    DbOptions options;
    options.page_size = 8192;
    options.journal_mode = "TRUNCATE";
    options.synchronous = "NORMAL";
    auto configured = db.configure(options);
    ASSERT_TRUE(configured.ok()) << configured.error().to_string();

    int64_t page_size = 0;
    ASSERT_TRUE(db.with_read([&](Connection& conn) -> Result<void> {
        auto v = conn.query_int("PRAGMA page_size");
        if (!v.ok()) return v.error();
        page_size = v.value();
        return Ok();
    }).ok());
    EXPECT_EQ(page_size, 8192);
    EXPECT_EQ(count_rows(db, "t"), 1);

    ASSERT_TRUE(db.with_write([](Connection& conn) {
        return conn.execute("INSERT INTO t VALUES (2);");
    }).ok());
    EXPECT_EQ(count_rows(db, "t"), 2);
}
