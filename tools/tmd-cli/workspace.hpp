#pragma once

#include <tmd/document.hpp>
#include <tmd/result.hpp>

#include <filesystem>

namespace tmd::cli {

/**
 * Unpacked directory form of a document:
 *
 *     <dir>/index.md
 *     <dir>/manifest.json
 *     <dir>/attachments.json
 *     <dir>/db/main.sqlite3
 *     <dir>/<logical path>      one file per attachment
 *
 * The files on disk are authoritative when packing: lengths and digests
 * are recomputed from them, so attachments may be edited in place.
 */
Result<Document> read_workspace(const std::filesystem::path& dir);

/**
 * Write every part of doc below dir, creating it if needed. Existing
 * files with the same names are replaced.
 */
Result<void> write_workspace(const Document& doc, const std::filesystem::path& dir);

}  // namespace tmd::cli
