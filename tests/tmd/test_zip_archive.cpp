#include <gtest/gtest.h>
#include <tmd/codec/trailer.hpp>
#include <tmd/codec/zip_archive.hpp>

#include <algorithm>

using namespace tmd;
using namespace tmd::codec;

class ZipArchiveTest : public ::testing::Test {
protected:
    Bytes build(const std::vector<std::pair<std::string, std::string>>& entries) {
        ZipWriter zip;
        for (const auto& [name, text] : entries) {
            auto added = zip.add_entry(name, text);
            EXPECT_TRUE(added.ok()) << added.error().to_string();
        }
        auto archive = zip.finish();
        EXPECT_TRUE(archive.ok());
        return archive.ok() ? archive.value() : Bytes{};
    }

    static uint32_t read_u32(const Bytes& b, size_t offset) {
        return static_cast<uint32_t>(b[offset]) | (static_cast<uint32_t>(b[offset + 1]) << 8) |
               (static_cast<uint32_t>(b[offset + 2]) << 16) | (static_cast<uint32_t>(b[offset + 3]) << 24);
    }

    static void write_u16(Bytes& b, size_t offset, uint16_t v) {
        b[offset] = static_cast<uint8_t>(v & 0xFF);
        b[offset + 1] = static_cast<uint8_t>(v >> 8);
    }

    // Offset of the first central directory header (archive without comment)
    static size_t central_offset(const Bytes& b) {
        return read_u32(b, b.size() - EOCD_MIN_SIZE + 16);
    }

    // Offset of the first occurrence of text, or b.size()
    static size_t find_text(const Bytes& b, const std::string& text) {
        auto it = std::search(b.begin(), b.end(), text.begin(), text.end());
        return static_cast<size_t>(it - b.begin());
    }

    static Result<ZipReader> open(const Bytes& b) {
        return ZipReader::open(b.data(), b.size());
    }
};

// ============================================================================
// Writer / reader
// ============================================================================

TEST_F(ZipArchiveTest, WriteAndRead) {
    Bytes archive = build({{"manifest.json", "{}"}, {"docs/a.txt", "hello"}, {"empty", ""}});

    auto reader = open(archive);
    ASSERT_TRUE(reader.ok()) << reader.error().to_string();
    ASSERT_EQ(reader.value().entries().size(), 3u);

    // Archive order is insertion order
    EXPECT_EQ(reader.value().entries()[0].name, "manifest.json");
    EXPECT_EQ(reader.value().entries()[1].name, "docs/a.txt");
    EXPECT_EQ(reader.value().entries()[2].name, "empty");

    const ZipEntry* entry = reader.value().find("docs/a.txt");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(reader.value().crc_matches(*entry));

    Bytes data = reader.value().read(*entry);
    EXPECT_EQ(std::string(data.begin(), data.end()), "hello");

    EXPECT_TRUE(reader.value().read(*reader.value().find("empty")).empty());
    EXPECT_EQ(reader.value().find("missing"), nullptr);
}

TEST_F(ZipArchiveTest, EntriesAreStoredUncompressed) {
    std::string payload(4096, 'z');
    Bytes archive = build({{"big.txt", payload}});

    // A STORED payload appears verbatim in the archive
    EXPECT_LT(find_text(archive, payload), archive.size());
    EXPECT_GT(archive.size(), payload.size());
}

TEST_F(ZipArchiveTest, OutputIsDeterministic) {
    Bytes first = build({{"a", "1"}, {"b", "22"}});
    Bytes second = build({{"a", "1"}, {"b", "22"}});
    EXPECT_EQ(first, second);
}

TEST_F(ZipArchiveTest, WriterRejectsDuplicatesAndBadNames) {
    ZipWriter zip;
    ASSERT_TRUE(zip.add_entry("a.txt", "x").ok());
    EXPECT_EQ(zip.add_entry("a.txt", "y").error_code(), ErrorCode::ALREADY_EXISTS);
    EXPECT_EQ(zip.add_entry("", "y").error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(zip.entry_count(), 1u);

    ASSERT_TRUE(zip.finish().ok());
    EXPECT_EQ(zip.add_entry("b.txt", "z").error_code(), ErrorCode::INTERNAL_ERROR);
    EXPECT_EQ(zip.finish().error_code(), ErrorCode::INTERNAL_ERROR);
}

TEST_F(ZipArchiveTest, FinishWritesComment) {
    ZipWriter zip;
    ASSERT_TRUE(zip.add_entry("a", "1").ok());
    Bytes comment = {'h', 'i'};
    auto archive = zip.finish(comment);
    ASSERT_TRUE(archive.ok());

    auto eocd = locate_eocd(archive.value().data(), archive.value().size());
    ASSERT_TRUE(eocd.ok());
    EXPECT_EQ(eocd.value().comment_length, 2u);
    EXPECT_TRUE(open(archive.value()).ok());
}

TEST_F(ZipArchiveTest, EmptyArchive) {
    ZipWriter zip;
    auto archive = zip.finish();
    ASSERT_TRUE(archive.ok());

    auto reader = open(archive.value());
    ASSERT_TRUE(reader.ok()) << reader.error().to_string();
    EXPECT_TRUE(reader.value().entries().empty());
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(ZipArchiveTest, RejectsCompressedEntry) {
    Bytes archive = build({{"a.txt", "abc"}});
    size_t cd = central_offset(archive);
    write_u16(archive, 8, 8);        // local header: deflate
    write_u16(archive, cd + 10, 8);  // central header: deflate

    auto reader = open(archive);
    ASSERT_FALSE(reader.ok());
    EXPECT_EQ(reader.error().kind(), ErrorKind::FORMAT);
}

TEST_F(ZipArchiveTest, RejectsEncryptedEntry) {
    Bytes archive = build({{"a.txt", "abc"}});
    size_t cd = central_offset(archive);
    archive[6] |= 0x01;       // local header flags
    archive[cd + 8] |= 0x01;  // central header flags

    auto reader = open(archive);
    ASSERT_FALSE(reader.ok());
    EXPECT_EQ(reader.error().kind(), ErrorKind::FORMAT);
}

TEST_F(ZipArchiveTest, RejectsZip64Markers) {
    Bytes archive = build({{"a.txt", "abc"}});
    size_t eocd = archive.size() - EOCD_MIN_SIZE;
    archive[eocd + 16] = 0xFF;
    archive[eocd + 17] = 0xFF;
    archive[eocd + 18] = 0xFF;
    archive[eocd + 19] = 0xFF;

    EXPECT_EQ(open(archive).error_code(), ErrorCode::UNSUPPORTED);
}

TEST_F(ZipArchiveTest, RejectsMultiDisk) {
    Bytes archive = build({{"a.txt", "abc"}});
    write_u16(archive, archive.size() - EOCD_MIN_SIZE + 4, 1);

    EXPECT_EQ(open(archive).error_code(), ErrorCode::UNSUPPORTED);
}

TEST_F(ZipArchiveTest, RejectsDuplicateNames) {
    // Equal-length names, so renaming every occurrence keeps all offsets valid
    Bytes archive = build({{"a.txt", "1"}, {"b.txt", "2"}});
    const std::string from = "b.txt";
    const std::string to = "a.txt";
    size_t renamed = 0;
    for (size_t at = find_text(archive, from); at < archive.size(); at = find_text(archive, from)) {
        std::copy(to.begin(), to.end(), archive.begin() + static_cast<std::ptrdiff_t>(at));
        ++renamed;
    }
    ASSERT_EQ(renamed, 2u);  // local and central header

    auto reader = open(archive);
    ASSERT_FALSE(reader.ok());
    EXPECT_EQ(reader.error_code(), ErrorCode::INVALID_FORMAT);
}

TEST_F(ZipArchiveTest, RejectsTruncatedInput) {
    Bytes archive = build({{"a.txt", "hello"}});

    Bytes tail_cut(archive.begin(), archive.end() - 1);
    EXPECT_EQ(open(tail_cut).error_code(), ErrorCode::INVALID_FORMAT);

    Bytes tiny(archive.begin(), archive.begin() + 10);
    EXPECT_EQ(open(tiny).error_code(), ErrorCode::INVALID_FORMAT);

    EXPECT_EQ(open(Bytes{}).error_code(), ErrorCode::INVALID_FORMAT);
}

TEST_F(ZipArchiveTest, RejectsCentralDirectoryOutOfBounds) {
    Bytes archive = build({{"a.txt", "hello"}});
    size_t eocd = archive.size() - EOCD_MIN_SIZE;
    archive[eocd + 12] = 0xF0;  // cd_size far beyond the buffer

    EXPECT_EQ(open(archive).error_code(), ErrorCode::INVALID_FORMAT);
}

TEST_F(ZipArchiveTest, CrcMismatchIsDetected) {
    Bytes archive = build({{"a.txt", "hello"}});
    size_t payload = find_text(archive, "hello");
    ASSERT_LT(payload, archive.size());
    archive[payload] ^= 0x01;

    auto reader = open(archive);
    if (reader.ok()) {
        EXPECT_FALSE(reader.value().crc_matches(reader.value().entries()[0]));
    } else {
        EXPECT_EQ(reader.error_code(), ErrorCode::INVALID_FORMAT);
    }
}
