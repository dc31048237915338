#pragma once

#include <tmd/core_types.hpp>
#include <tmd/util/time.hpp>
#include <tmd/util/uuid.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tmd {

using AttachmentId = Uuid;

struct Semver {
    uint16_t major = FORMAT_VERSION_MAJOR;
    uint16_t minor = FORMAT_VERSION_MINOR;
    uint16_t patch = FORMAT_VERSION_PATCH;

    std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    bool operator==(const Semver& o) const {
        return major == o.major && minor == o.minor && patch == o.patch;
    }
    bool operator!=(const Semver& o) const { return !(*this == o); }
};

// Typed link, e.g. {"rel": "source", "href": "https://..."}
struct LinkRef {
    std::string rel;
    std::string href;

    bool operator==(const LinkRef& o) const { return rel == o.rel && href == o.href; }
    bool operator!=(const LinkRef& o) const { return !(*this == o); }
};

/**
 * Document-level metadata, stored as manifest.json.
 */
struct Manifest {
    Semver tmd_version;
    Uuid doc_id;
    std::optional<std::string> title;
    std::vector<std::string> authors;
    Timestamp created_utc;
    Timestamp modified_utc;
    std::vector<std::string> tags;
    std::optional<AttachmentId> cover_image;
    std::vector<LinkRef> links;
    std::optional<uint32_t> db_schema_version;  // mirror of the database user_version
    nlohmann::json extras = nlohmann::json::object();

    bool operator==(const Manifest& o) const {
        return tmd_version == o.tmd_version && doc_id == o.doc_id && title == o.title &&
               authors == o.authors && created_utc == o.created_utc &&
               modified_utc == o.modified_utc && tags == o.tags &&
               cover_image == o.cover_image && links == o.links &&
               db_schema_version == o.db_schema_version && extras == o.extras;
    }
    bool operator!=(const Manifest& o) const { return !(*this == o); }
};

/**
 * Metadata of one attachment as held by the AttachmentStore.
 * length and sha256 always describe the current bytes.
 */
struct AttachmentMeta {
    AttachmentId id;
    LogicalPath logical_path;
    std::string mime;
    uint64_t length = 0;
    Sha256Digest sha256{};
    std::optional<std::string> title;
    std::optional<std::string> alt;
    nlohmann::json extras = nlohmann::json::object();
};

/**
 * Attachment metadata as declared in attachments.json. The digest may be
 * absent when the writer skipped hashing.
 */
struct AttachmentRecord {
    AttachmentId id;
    LogicalPath logical_path;
    std::string mime;
    uint64_t length = 0;
    std::optional<Sha256Digest> sha256;
    std::optional<std::string> title;
    std::optional<std::string> alt;
    nlohmann::json extras = nlohmann::json::object();
};

// ============================================================================
// Configuration
// ============================================================================

enum class Format {
    TMD,   // Markdown prefix + archive
    TMDZ   // archive only
};

inline const char* format_name(Format f) {
    return f == Format::TMD ? "tmd" : "tmdz";
}

/**
 * Options for decoding a container.
 */
struct ReadMode {
    bool verify_hashes = true;      // Recompute SHA-256 and compare with attachments.json
    bool lazy_attachments = false;  // Accepted for API compatibility; loading is always eager
};

/**
 * Options for encoding a container.
 */
struct WriteMode {
    bool compute_hashes = true;  // Emit sha256 in attachments.json (null otherwise)
    bool dedup_by_hash = false;  // Reuse the CRC-32 of identical payloads
};

/**
 * Pragmas applied to the embedded database by DbHandle::configure().
 */
struct DbOptions {
    std::optional<uint32_t> page_size;
    std::optional<std::string> journal_mode;  // DELETE, TRUNCATE, PERSIST, MEMORY, OFF
    std::optional<std::string> synchronous;   // OFF, NORMAL, FULL, EXTRA
};

}  // namespace tmd
