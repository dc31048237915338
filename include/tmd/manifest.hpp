#pragma once

#include <tmd/result.hpp>
#include <tmd/types.hpp>

#include <string>
#include <vector>

namespace tmd {

// True if every string and object key inside value is valid UTF-8
bool is_valid_utf8_json(const nlohmann::json& value);

/**
 * Fresh manifest for a new document: current format version, random
 * doc_id, created_utc == modified_utc == now.
 */
Result<Manifest> make_manifest();

// ============================================================================
// manifest.json
// ============================================================================

/**
 * Serialize as pretty-printed JSON (2-space indent, keys sorted).
 *
 * @return INVALID_FORMAT if any string is not valid UTF-8
 */
Result<std::string> manifest_to_json(const Manifest& manifest);

/**
 * Parse and validate manifest.json.
 *
 * Fails with INVALID_FORMAT on malformed JSON, missing or mistyped
 * fields, or modified_utc earlier than created_utc, and with
 * UNSUPPORTED on a tmd_version major other than the one this library
 * writes.
 */
Result<Manifest> manifest_from_json(const std::string& text);

// ============================================================================
// attachments.json
// ============================================================================

AttachmentRecord to_record(const AttachmentMeta& meta, bool include_digest);

Result<std::string> attachment_records_to_json(const std::vector<AttachmentRecord>& records);

Result<std::vector<AttachmentRecord>> attachment_records_from_json(const std::string& text);

}  // namespace tmd
