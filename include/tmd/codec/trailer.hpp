#pragma once

#include <tmd/core_types.hpp>
#include <tmd/result.hpp>

#include <cstddef>
#include <cstdint>

namespace tmd::codec {

// ZIP end-of-central-directory record ("PK\x05\x06")
constexpr uint32_t EOCD_SIGNATURE = 0x06054b50;
constexpr size_t EOCD_MIN_SIZE = 22;
constexpr size_t EOCD_COMMENT_LENGTH_OFFSET = 20;
constexpr size_t EOCD_MAX_COMMENT = 0xFFFF;
constexpr size_t EOCD_MAX_SCAN = EOCD_MAX_COMMENT + EOCD_MIN_SIZE;
constexpr uint16_t ZIP16_LIMIT = 0xFFFF;
constexpr uint32_t ZIP32_LIMIT = 0xFFFFFFFFu;

// EOCD comment of a .tmd file: signature followed by u64le prefix length
constexpr uint8_t TMD_TRAILER_SIGNATURE[] = {'T', 'M', 'D', '1', '\0'};
constexpr size_t TMD_TRAILER_SIGNATURE_SIZE = sizeof(TMD_TRAILER_SIGNATURE);
constexpr size_t TMD_TRAILER_SIZE = TMD_TRAILER_SIGNATURE_SIZE + 8;

struct EocdLocation {
    size_t offset = 0;           // Start of the EOCD record
    uint16_t comment_length = 0;
};

/**
 * Find the EOCD record by scanning backward from the end of the buffer.
 *
 * The scan covers at most the last EOCD_MAX_SCAN bytes. A candidate is
 * accepted only if its comment ends exactly at the end of the buffer, so
 * a signature appearing inside comment bytes is skipped.
 *
 * @return INVALID_FORMAT if the buffer is too short or no consistent
 *         record exists
 */
Result<EocdLocation> locate_eocd(const uint8_t* data, size_t size);

/**
 * Fields of the EOCD record that describe the central directory.
 */
struct EocdRecord {
    EocdLocation location;
    uint16_t entry_count = 0;
    uint32_t cd_size = 0;
    uint32_t cd_offset = 0;
};

/**
 * Locate and parse the EOCD record.
 *
 * @return UNSUPPORTED for ZIP64 markers or multi-disk archives,
 *         INVALID_FORMAT if the central directory lies outside the buffer
 */
Result<EocdRecord> read_eocd(const uint8_t* data, size_t size);

/**
 * True if the EOCD comment of data carries a TMD trailer signature.
 */
bool has_tmd_trailer(const uint8_t* data, size_t size);

/**
 * Encode the 13-byte TMD comment for a Markdown prefix of the given length.
 */
Bytes encode_trailer(uint64_t markdown_length);

/**
 * Decode a TMD comment back to the Markdown prefix length.
 */
Result<uint64_t> decode_trailer(const uint8_t* comment, size_t size);

/**
 * A .tmd buffer split at the prefix length recorded in its trailer.
 * Both views borrow from the input buffer.
 */
struct TmdParts {
    const uint8_t* markdown = nullptr;
    size_t markdown_size = 0;
    const uint8_t* archive = nullptr;
    size_t archive_size = 0;
};

Result<TmdParts> split_tmd(const uint8_t* data, size_t size);

/**
 * Replace the EOCD comment of a finished archive in place.
 *
 * Rewrites the comment-length field, truncates the buffer at the comment
 * start and appends the new comment.
 *
 * @return INVALID_ARGUMENT if the comment exceeds EOCD_MAX_COMMENT,
 *         INVALID_FORMAT if archive has no EOCD record
 */
Result<void> patch_comment(Bytes& archive, const Bytes& comment);

}  // namespace tmd::codec
