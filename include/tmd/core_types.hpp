#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tmd {

// Raw byte buffer used for attachment payloads, archives and database images
using Bytes = std::vector<uint8_t>;

// SHA-256 digest of an attachment payload
using Sha256Digest = std::array<uint8_t, 32>;

// Normalized, forward-slash relative path of an attachment inside a container
using LogicalPath = std::string;

// Reserved archive entries
constexpr const char* MANIFEST_ENTRY = "manifest.json";
constexpr const char* MARKDOWN_ENTRY = "index.md";
constexpr const char* ATTACHMENTS_ENTRY = "attachments.json";
constexpr const char* DATABASE_ENTRY = "db/main.sqlite3";

// First 16 bytes of every SQLite 3 database file
constexpr char SQLITE_MAGIC[] = "SQLite format 3";  // plus the terminating NUL
constexpr size_t SQLITE_MAGIC_SIZE = 16;

// Manifest format version written by this library
constexpr uint16_t FORMAT_VERSION_MAJOR = 1;
constexpr uint16_t FORMAT_VERSION_MINOR = 0;
constexpr uint16_t FORMAT_VERSION_PATCH = 0;

inline bool is_reserved_entry(const std::string& name) {
    return name == MANIFEST_ENTRY || name == MARKDOWN_ENTRY ||
           name == ATTACHMENTS_ENTRY || name == DATABASE_ENTRY;
}

inline bool has_sqlite_magic(const uint8_t* data, size_t size) {
    if (size < SQLITE_MAGIC_SIZE) return false;
    for (size_t i = 0; i < SQLITE_MAGIC_SIZE; ++i) {
        if (data[i] != static_cast<uint8_t>(SQLITE_MAGIC[i])) return false;
    }
    return true;
}

}  // namespace tmd
