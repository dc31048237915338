#include <gtest/gtest.h>
#include <tmd/codec/trailer.hpp>
#include <tmd/codec/zip_archive.hpp>

#include <algorithm>
#include <cstring>

using namespace tmd;
using namespace tmd::codec;

class TrailerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ZipWriter zip;
        ASSERT_TRUE(zip.add_entry("index.md", "# Title\n").ok());
        auto archive = zip.finish();
        ASSERT_TRUE(archive.ok());
        archive_ = archive.value();
    }

    Bytes archive_;
};

// ============================================================================
// EOCD location
// ============================================================================

TEST_F(TrailerTest, LocateEocdWithoutComment) {
    auto eocd = locate_eocd(archive_.data(), archive_.size());
    ASSERT_TRUE(eocd.ok()) << eocd.error().to_string();
    EXPECT_EQ(eocd.value().offset, archive_.size() - EOCD_MIN_SIZE);
    EXPECT_EQ(eocd.value().comment_length, 0u);
}

TEST_F(TrailerTest, LocateEocdRejectsShortInput) {
    Bytes tiny(EOCD_MIN_SIZE - 1, 0);
    auto eocd = locate_eocd(tiny.data(), tiny.size());
    ASSERT_FALSE(eocd.ok());
    EXPECT_EQ(eocd.error_code(), ErrorCode::INVALID_FORMAT);
}

TEST_F(TrailerTest, LocateEocdRejectsMissingSignature) {
    Bytes junk(200, 0x20);
    EXPECT_EQ(locate_eocd(junk.data(), junk.size()).error_code(), ErrorCode::INVALID_FORMAT);
}

TEST_F(TrailerTest, LocateEocdRequiresCommentToEndAtBufferEnd) {
    Bytes padded = archive_;
    padded.push_back(0);
    auto eocd = locate_eocd(padded.data(), padded.size());
    ASSERT_FALSE(eocd.ok());
    EXPECT_NE(eocd.error().message().find("comment length"), std::string::npos);
}

TEST_F(TrailerTest, SignatureInsideCommentIsSkipped) {
    // Comment carries a fake EOCD record whose comment length does not fit
    Bytes comment = {'P', 'K', 0x05, 0x06};
    comment.resize(EOCD_MIN_SIZE + 4, 0);
    comment[EOCD_COMMENT_LENGTH_OFFSET] = 0x40;
    ASSERT_TRUE(patch_comment(archive_, comment).ok());

    auto eocd = locate_eocd(archive_.data(), archive_.size());
    ASSERT_TRUE(eocd.ok());
    EXPECT_EQ(eocd.value().offset, archive_.size() - EOCD_MIN_SIZE - comment.size());
    EXPECT_EQ(eocd.value().comment_length, comment.size());
}

// ============================================================================
// Trailer encoding
// ============================================================================

TEST_F(TrailerTest, EncodeTrailerLayout) {
    Bytes trailer = encode_trailer(0x0102030405060708ULL);
    ASSERT_EQ(trailer.size(), TMD_TRAILER_SIZE);
    EXPECT_EQ(std::memcmp(trailer.data(), "TMD1\0", 5), 0);
    EXPECT_EQ(trailer[5], 0x08);
    EXPECT_EQ(trailer[12], 0x01);

    auto decoded = decode_trailer(trailer.data(), trailer.size());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), 0x0102030405060708ULL);
}

TEST_F(TrailerTest, DecodeTrailerRejectsBadSignature) {
    Bytes trailer = encode_trailer(5);
    trailer[3] = '2';
    auto decoded = decode_trailer(trailer.data(), trailer.size());
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error_code(), ErrorCode::INVALID_FORMAT);
    EXPECT_NE(decoded.error().message().find("signature"), std::string::npos);
}

TEST_F(TrailerTest, DecodeTrailerRejectsBadLength) {
    Bytes trailer = encode_trailer(5);
    trailer.push_back(0);
    auto decoded = decode_trailer(trailer.data(), trailer.size());
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.error_code(), ErrorCode::INVALID_FORMAT);

    EXPECT_EQ(decode_trailer(trailer.data(), 3).error_code(), ErrorCode::INVALID_FORMAT);
}

// ============================================================================
// Comment patching and splitting
// ============================================================================

TEST_F(TrailerTest, PatchCommentRewritesLengthField) {
    size_t eocd = archive_.size() - EOCD_MIN_SIZE;
    Bytes trailer = encode_trailer(42);
    ASSERT_TRUE(patch_comment(archive_, trailer).ok());

    ASSERT_EQ(archive_.size(), eocd + EOCD_MIN_SIZE + TMD_TRAILER_SIZE);
    EXPECT_EQ(archive_[eocd + EOCD_COMMENT_LENGTH_OFFSET], TMD_TRAILER_SIZE);
    EXPECT_EQ(archive_[eocd + EOCD_COMMENT_LENGTH_OFFSET + 1], 0);
    EXPECT_TRUE(std::equal(trailer.begin(), trailer.end(), archive_.begin() + eocd + EOCD_MIN_SIZE));

    // Patching again replaces the comment rather than appending to it
    ASSERT_TRUE(patch_comment(archive_, Bytes{}).ok());
    EXPECT_EQ(archive_.size(), eocd + EOCD_MIN_SIZE);
}

TEST_F(TrailerTest, PatchCommentRejectsOversizedComment) {
    Bytes original = archive_;
    Bytes huge(EOCD_MAX_COMMENT + 1, 'x');
    auto patched = patch_comment(archive_, huge);
    ASSERT_FALSE(patched.ok());
    EXPECT_EQ(patched.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(archive_, original);
}

TEST_F(TrailerTest, SplitTmd) {
    std::string markdown = "# Title\n";
    ASSERT_TRUE(patch_comment(archive_, encode_trailer(markdown.size())).ok());

    Bytes file(markdown.begin(), markdown.end());
    file.insert(file.end(), archive_.begin(), archive_.end());

    auto parts = split_tmd(file.data(), file.size());
    ASSERT_TRUE(parts.ok()) << parts.error().to_string();
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(parts.value().markdown),
                          parts.value().markdown_size), markdown);
    EXPECT_EQ(parts.value().archive_size, archive_.size());
    EXPECT_TRUE(ZipReader::open(parts.value().archive, parts.value().archive_size).ok());
}

TEST_F(TrailerTest, SplitTmdRejectsOversizedPrefix) {
    ASSERT_TRUE(patch_comment(archive_, encode_trailer(1u << 20)).ok());
    Bytes file = {'x'};
    file.insert(file.end(), archive_.begin(), archive_.end());

    auto parts = split_tmd(file.data(), file.size());
    ASSERT_FALSE(parts.ok());
    EXPECT_EQ(parts.error_code(), ErrorCode::INVALID_FORMAT);
    EXPECT_NE(parts.error().message().find("exceeds buffer"), std::string::npos);
}

TEST_F(TrailerTest, SplitTmdRequiresTrailer) {
    auto parts = split_tmd(archive_.data(), archive_.size());
    ASSERT_FALSE(parts.ok());
    EXPECT_EQ(parts.error_code(), ErrorCode::INVALID_FORMAT);
}

// ============================================================================
// EOCD record
// ============================================================================

TEST_F(TrailerTest, ReadEocdFields) {
    auto record = read_eocd(archive_.data(), archive_.size());
    ASSERT_TRUE(record.ok()) << record.error().to_string();
    EXPECT_EQ(record.value().entry_count, 1u);
    EXPECT_GT(record.value().cd_size, 0u);
    EXPECT_EQ(record.value().cd_offset + record.value().cd_size, record.value().location.offset);
}

TEST_F(TrailerTest, ReadEocdRejectsEntryCountMarker) {
    size_t eocd = archive_.size() - EOCD_MIN_SIZE;
    archive_[eocd + 8] = 0xFF;
    archive_[eocd + 9] = 0xFF;
    archive_[eocd + 10] = 0xFF;
    archive_[eocd + 11] = 0xFF;
    EXPECT_EQ(read_eocd(archive_.data(), archive_.size()).error_code(), ErrorCode::UNSUPPORTED);
}

TEST_F(TrailerTest, HasTmdTrailer) {
    EXPECT_FALSE(has_tmd_trailer(archive_.data(), archive_.size()));

    ASSERT_TRUE(patch_comment(archive_, encode_trailer(0)).ok());
    EXPECT_TRUE(has_tmd_trailer(archive_.data(), archive_.size()));

    ASSERT_TRUE(patch_comment(archive_, Bytes{'T', 'M', 'D'}).ok());
    EXPECT_FALSE(has_tmd_trailer(archive_.data(), archive_.size()));

    Bytes junk(100, 'x');
    EXPECT_FALSE(has_tmd_trailer(junk.data(), junk.size()));
}
