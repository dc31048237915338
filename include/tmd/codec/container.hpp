#pragma once

#include <tmd/document.hpp>
#include <tmd/result.hpp>
#include <tmd/types.hpp>

#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>

namespace tmd {

namespace fs = std::filesystem;

/**
 * Guess the container format. Input whose end record carries a TMD
 * trailer is a .tmd, even when its Markdown starts with "PK\x03\x04".
 * Otherwise an archive that starts with a local file header is a .tmdz
 * and anything else non-empty is treated as a .tmd.
 */
std::optional<Format> sniff_format(const uint8_t* data, size_t size);

inline std::optional<Format> sniff_format(const Bytes& data) {
    return sniff_format(data.data(), data.size());
}

// ".tmd" or ".tmdz" (case-insensitive), nullopt otherwise
std::optional<Format> format_from_extension(const fs::path& path);

// ============================================================================
// Decoding
// ============================================================================

/**
 * Decode a plain archive.
 *
 * Fails with INVALID_FORMAT on a missing reserved entry, an entry that is
 * neither reserved nor declared in attachments.json, a directory entry,
 * a CRC-32 mismatch or a database entry without the SQLite header;
 * with LENGTH_MISMATCH / DIGEST_MISMATCH when an attachment payload does
 * not match its declared metadata.
 */
Result<Document> read_tmdz(const uint8_t* data, size_t size, const ReadMode& mode = {});

/**
 * Decode a Markdown prefix followed by an archive whose EOCD comment
 * carries the prefix length. The prefix must be valid UTF-8 and equal
 * to the archive's index.md.
 */
Result<Document> read_tmd(const uint8_t* data, size_t size, const ReadMode& mode = {});

/**
 * Decode either format; the format is sniffed when not given.
 */
Result<Document> read_document(const Bytes& data,
                               std::optional<Format> format = std::nullopt,
                               const ReadMode& mode = {});

Result<Document> read_document(std::istream& in,
                               std::optional<Format> format = std::nullopt,
                               const ReadMode& mode = {});

Result<Document> read_from_path(const fs::path& path,
                                std::optional<Format> format = std::nullopt,
                                const ReadMode& mode = {});

// ============================================================================
// Encoding
// ============================================================================

/**
 * Encode as a plain archive. The document is validated first; entries are
 * written as manifest.json, index.md, attachments.json, db/main.sqlite3,
 * then attachments sorted by logical path.
 */
Result<Bytes> write_tmdz(const Document& doc, const WriteMode& mode = {});

/**
 * Encode as Markdown followed by the archive, with the TMD trailer in the
 * archive's EOCD comment.
 */
Result<Bytes> write_tmd(const Document& doc, const WriteMode& mode = {});

Result<Bytes> write_document(const Document& doc, Format format, const WriteMode& mode = {});

Result<void> write_document(const Document& doc, Format format, std::ostream& out,
                            const WriteMode& mode = {});

/**
 * Encode and atomically replace path. Without an explicit format the
 * extension decides.
 */
Result<void> write_to_path(const Document& doc, const fs::path& path,
                           std::optional<Format> format = std::nullopt,
                           const WriteMode& mode = {});

}  // namespace tmd
