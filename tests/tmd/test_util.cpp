#include <gtest/gtest.h>
#include <tmd/util/encoding.hpp>
#include <tmd/util/logger.hpp>
#include <tmd/util/serializer.hpp>
#include <tmd/util/sha256.hpp>
#include <tmd/util/time.hpp>
#include <tmd/util/uuid.hpp>

#include <set>

using namespace tmd;

// ============================================================================
// SHA-256
// ============================================================================

TEST(SHA256Test, KnownVectors) {
    EXPECT_EQ(hex_encode(SHA256::digest(std::string("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hex_encode(SHA256::digest(std::string())),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    Bytes data(1000);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i * 7);

    SHA256 sha;
    sha.update(data.data(), 333);
    sha.update(data.data() + 333, data.size() - 333);
    EXPECT_EQ(sha.finish(), SHA256::digest(data));
}

// ============================================================================
// Hex and UTF-8
// ============================================================================

TEST(EncodingTest, HexRoundTrip) {
    Bytes data = {0x00, 0x7f, 0x80, 0xff, 0x12};
    std::string hex = hex_encode(data.data(), data.size());
    EXPECT_EQ(hex, "007f80ff12");

    auto decoded = hex_decode("007F80FF12");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST(EncodingTest, HexRejectsMalformed) {
    EXPECT_FALSE(hex_decode("abc").has_value());
    EXPECT_FALSE(hex_decode("zz").has_value());
    EXPECT_FALSE(parse_sha256_hex("00").has_value());
    EXPECT_TRUE(parse_sha256_hex(std::string(64, 'a')).has_value());
}

TEST(EncodingTest, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8(std::string("plain ascii")));
    EXPECT_TRUE(is_valid_utf8(std::string("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80")));
    EXPECT_TRUE(is_valid_utf8(std::string()));

    EXPECT_FALSE(is_valid_utf8(std::string("\xff")));
    EXPECT_FALSE(is_valid_utf8(std::string("\xc3")));              // truncated
    EXPECT_FALSE(is_valid_utf8(std::string("\xc0\xaf")));          // overlong
    EXPECT_FALSE(is_valid_utf8(std::string("\xed\xa0\x80")));      // surrogate
    EXPECT_FALSE(is_valid_utf8(std::string("\xf4\x90\x80\x80")));  // above U+10FFFF
}

// ============================================================================
// UUID
// ============================================================================

TEST(UuidTest, GenerateV4) {
    auto id = Uuid::generate_v4();
    ASSERT_TRUE(id.ok()) << id.error().to_string();
    EXPECT_EQ(id.value().version(), 4);
    EXPECT_FALSE(id.value().is_nil());
    EXPECT_EQ((id.value().bytes()[8] & 0xC0), 0x80);
}

TEST(UuidTest, GeneratedIdsAreDistinct) {
    std::set<Uuid> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = Uuid::generate_v4();
        ASSERT_TRUE(id.ok());
        ids.insert(id.value());
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(UuidTest, ParseAndFormat) {
    auto id = Uuid::parse("123E4567-E89B-42D3-A456-426614174000");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->to_string(), "123e4567-e89b-42d3-a456-426614174000");
    EXPECT_EQ(Uuid::parse(id->to_string()), id);

    EXPECT_FALSE(Uuid::parse("123e4567e89b42d3a456426614174000").has_value());
    EXPECT_FALSE(Uuid::parse("123e4567-e89b-42d3-a456-42661417400g").has_value());
    EXPECT_TRUE(Uuid().is_nil());
}

// ============================================================================
// Timestamps
// ============================================================================

TEST(TimeTest, FormatEpoch) {
    EXPECT_EQ(format_rfc3339(Timestamp()), "1970-01-01T00:00:00.000000Z");
}

TEST(TimeTest, RoundTripNow) {
    Timestamp now = now_utc();
    auto parsed = parse_rfc3339(format_rfc3339(now));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, now);
}

TEST(TimeTest, ParsesOffsets) {
    auto utc = parse_rfc3339("2024-02-29T12:00:00Z");
    auto plus = parse_rfc3339("2024-02-29T14:30:00+02:30");
    ASSERT_TRUE(utc.has_value());
    ASSERT_TRUE(plus.has_value());
    EXPECT_EQ(*utc, *plus);
    EXPECT_EQ(format_rfc3339(*utc), "2024-02-29T12:00:00.000000Z");
}

TEST(TimeTest, TruncatesLongFractions) {
    auto ts = parse_rfc3339("2024-01-01T00:00:00.123456789Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_rfc3339(*ts), "2024-01-01T00:00:00.123456Z");
}

TEST(TimeTest, RejectsMalformed) {
    EXPECT_FALSE(parse_rfc3339("2024-01-01").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-01T00:00:00").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-01T00:00:00Zjunk").has_value());
}

// ============================================================================
// Serializer
// ============================================================================

TEST(SerializerTest, LittleEndianLayout) {
    ByteWriter writer;
    writer.write_uint16(0x0102);
    writer.write_uint32(0x03040506);
    writer.write_uint64(0x0708090A0B0C0D0Eull);

    const Bytes& out = writer.data();
    ASSERT_EQ(out.size(), 14u);
    EXPECT_EQ(out[0], 0x02);
    EXPECT_EQ(out[1], 0x01);
    EXPECT_EQ(out[2], 0x06);
    EXPECT_EQ(out[5], 0x03);
    EXPECT_EQ(out[6], 0x0E);
    EXPECT_EQ(out[13], 0x07);

    ByteReader reader(out);
    uint16_t a = 0;
    uint32_t b = 0;
    uint64_t c = 0;
    ASSERT_TRUE(reader.read_uint16(&a));
    ASSERT_TRUE(reader.read_uint32(&b));
    ASSERT_TRUE(reader.read_uint64(&c));
    EXPECT_EQ(a, 0x0102);
    EXPECT_EQ(b, 0x03040506u);
    EXPECT_EQ(c, 0x0708090A0B0C0D0Eull);
    EXPECT_FALSE(reader.has_remaining(1));
}

TEST(SerializerTest, ReaderNeverReadsPastEnd) {
    Bytes data = {1, 2, 3};
    ByteReader reader(data);
    uint32_t v = 0;
    EXPECT_FALSE(reader.read_uint32(&v));
    EXPECT_EQ(reader.position(), 0u);
    EXPECT_FALSE(reader.skip(4));
    EXPECT_FALSE(reader.seek(4));

    std::string s;
    EXPECT_TRUE(reader.read_string(3, &s));
    EXPECT_FALSE(reader.read_string(1, &s));
}

TEST(SerializerTest, PatchUint16) {
    ByteWriter writer;
    writer.write_uint32(0);
    EXPECT_TRUE(writer.patch_uint16(2, 0xABCD));
    EXPECT_FALSE(writer.patch_uint16(3, 1));
    EXPECT_EQ(writer.data()[2], 0xCD);
    EXPECT_EQ(writer.data()[3], 0xAB);
}

// ============================================================================
// Logger
// ============================================================================

namespace {

class RecordingLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        messages.push_back(message);
    }
    std::vector<std::string> messages;
};

}  // namespace

TEST(LoggerTest, GlobalLoggerCanBeReplaced) {
    auto recorder = std::make_shared<RecordingLogger>();
    recorder->set_min_level(LogLevel::WARNING);
    set_logger(recorder);

    logger().debug("hidden");
    logger().warning("shown");
    ASSERT_EQ(recorder->messages.size(), 1u);
    EXPECT_EQ(recorder->messages[0], "shown");

    set_logger(nullptr);
    logger().error("goes nowhere");
    EXPECT_EQ(recorder->messages.size(), 1u);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}
