#include <tmd/codec/container.hpp>
#include <tmd/codec/trailer.hpp>
#include <tmd/codec/zip_archive.hpp>
#include <tmd/manifest.hpp>
#include <tmd/util/encoding.hpp>
#include <tmd/util/file_io.hpp>
#include <tmd/util/logger.hpp>
#include <tmd/util/path.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>

namespace tmd {

using codec::ZipEntry;
using codec::ZipReader;
using codec::ZipWriter;

namespace {

const char* const REQUIRED_ENTRIES[] = {
    MANIFEST_ENTRY, MARKDOWN_ENTRY, ATTACHMENTS_ENTRY, DATABASE_ENTRY,
};

std::string to_text(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// Reserved entries are only CRC-checked; their content is validated by parsing
Result<Bytes> read_reserved(const ZipReader& zip, const char* name) {
    const ZipEntry* entry = zip.find(name);
    if (!entry) {
        return Error(ErrorCode::INVALID_FORMAT, std::string("missing required entry ") + name);
    }
    if (!zip.crc_matches(*entry)) {
        return Error(ErrorCode::INVALID_FORMAT, std::string("CRC-32 mismatch in ") + name);
    }
    return zip.read(*entry);
}

Result<void> check_entry_set(const ZipReader& zip, const std::vector<AttachmentRecord>& records) {
    std::set<std::string> declared;
    for (const auto& record : records) {
        if (!is_normalized_logical_path(record.logical_path)) {
            return Error(ErrorCode::INVALID_PATH,
                         "attachments.json declares non-normalized path '" + record.logical_path + "'")
                .with_context("attachment error");
        }
        declared.insert(record.logical_path);
    }

    for (const auto& entry : zip.entries()) {
        if (!entry.name.empty() && entry.name.back() == '/') {
            return Error(ErrorCode::INVALID_FORMAT, "unexpected directory entry '" + entry.name + "'");
        }
        if (!is_reserved_entry(entry.name) && declared.count(entry.name) == 0) {
            return Error(ErrorCode::INVALID_FORMAT, "undeclared archive entry '" + entry.name + "'");
        }
    }
    return Ok();
}

Result<AttachmentStore> read_attachments(const ZipReader& zip,
                                         const std::vector<AttachmentRecord>& records,
                                         const ReadMode& mode) {
    AttachmentStore store;
    for (const auto& record : records) {
        const ZipEntry* entry = zip.find(record.logical_path);
        if (!entry) {
            return Error(ErrorCode::INVALID_FORMAT,
                         "attachment '" + record.logical_path + "' is declared but missing from the archive");
        }

        auto inserted = store.insert_verified(record, zip.read(*entry), mode.verify_hashes);
        if (!inserted.ok()) {
            return inserted.error().with_context("attachment error");
        }
        if (!zip.crc_matches(*entry)) {
            return Error(ErrorCode::INVALID_FORMAT, "CRC-32 mismatch in " + record.logical_path);
        }
    }
    return Result<AttachmentStore>(std::move(store));
}

Result<Document> read_archive(const uint8_t* data, size_t size, const ReadMode& mode) {
    auto opened = ZipReader::open(data, size);
    if (!opened.ok()) {
        return opened.error();
    }
    const ZipReader& zip = opened.value();

    Bytes parts[4];
    for (size_t i = 0; i < 4; ++i) {
        auto part = read_reserved(zip, REQUIRED_ENTRIES[i]);
        if (!part.ok()) {
            return part.error();
        }
        parts[i] = std::move(part.value());
    }
    Bytes& manifest_bytes = parts[0];
    Bytes& markdown_bytes = parts[1];
    Bytes& records_bytes = parts[2];
    Bytes& db_bytes = parts[3];

    auto manifest = manifest_from_json(to_text(manifest_bytes));
    if (!manifest.ok()) {
        return manifest.error();
    }
    if (!is_valid_utf8(markdown_bytes.data(), markdown_bytes.size())) {
        return Error(ErrorCode::INVALID_FORMAT, "index.md is not valid UTF-8");
    }
    auto records = attachment_records_from_json(to_text(records_bytes));
    if (!records.ok()) {
        return records.error();
    }

    auto entry_set = check_entry_set(zip, records.value());
    if (!entry_set.ok()) {
        return entry_set.error();
    }

    auto store = read_attachments(zip, records.value(), mode);
    if (!store.ok()) {
        return store.error();
    }

    if (!has_sqlite_magic(db_bytes.data(), db_bytes.size())) {
        return Error(ErrorCode::INVALID_FORMAT, "db/main.sqlite3 is not a SQLite database");
    }
    auto db = DbHandle::from_bytes(db_bytes);
    if (!db.ok()) {
        return db.error();
    }

    auto user_version = db.value().user_version();
    if (!user_version.ok()) {
        return user_version.error();
    }
    const auto& declared = manifest.value().db_schema_version;
    if (declared && *declared != user_version.value()) {
        logger().warning("manifest db_schema_version " + std::to_string(*declared) +
                         " differs from database user_version " +
                         std::to_string(user_version.value()));
    }

    logger().debug("decoded archive: " + std::to_string(zip.entries().size()) + " entries, " +
                   std::to_string(store.value().size()) + " attachments");

    return Document::from_parts(to_text(markdown_bytes),
                                std::move(manifest.value()),
                                std::move(store.value()),
                                std::move(db.value()));
}

Result<Bytes> build_archive(const Document& doc, const WriteMode& mode) {
    auto valid = doc.validate();
    if (!valid.ok()) {
        return valid.error();
    }

    auto db_bytes = doc.db().to_bytes();
    if (!db_bytes.ok()) {
        return db_bytes.error();
    }
    if (!has_sqlite_magic(db_bytes.value().data(), db_bytes.value().size())) {
        return Error(ErrorCode::INTERNAL_ERROR, "database file is not a SQLite database");
    }

    std::vector<AttachmentMeta> attachments = doc.list_attachments();
    std::vector<AttachmentRecord> records;
    records.reserve(attachments.size());
    for (const auto& meta : attachments) {
        records.push_back(to_record(meta, mode.compute_hashes));
    }

    auto manifest_json = manifest_to_json(doc.manifest());
    if (!manifest_json.ok()) {
        return manifest_json.error();
    }
    auto records_json = attachment_records_to_json(records);
    if (!records_json.ok()) {
        return records_json.error();
    }

    ZipWriter zip;
    Result<void> added = zip.add_entry(MANIFEST_ENTRY, manifest_json.value());
    if (added.ok()) added = zip.add_entry(MARKDOWN_ENTRY, doc.markdown());
    if (added.ok()) added = zip.add_entry(ATTACHMENTS_ENTRY, records_json.value());
    if (added.ok()) added = zip.add_entry(DATABASE_ENTRY, db_bytes.value());
    if (!added.ok()) {
        return added.error();
    }

    // ZIP cannot share payloads between entries, so identical attachments
    // are still stored once each
    std::set<Sha256Digest> seen;
    size_t duplicates = 0;
    for (const auto& meta : attachments) {
        const Bytes* data = doc.attachment_data(meta.id);
        if (!data) {
            return Error(ErrorCode::INTERNAL_ERROR, "attachment '" + meta.logical_path + "' has no data");
        }
        if (mode.dedup_by_hash && !seen.insert(meta.sha256).second) {
            ++duplicates;
        }

        auto entry = zip.add_entry(meta.logical_path, *data);
        if (!entry.ok()) {
            return entry.error();
        }
    }

    if (duplicates > 0) {
        logger().debug(std::to_string(duplicates) + " attachments duplicate the content of another");
    }
    return zip.finish();
}

}  // namespace

// ============================================================================
// Format detection
// ============================================================================

std::optional<Format> sniff_format(const uint8_t* data, size_t size) {
    static const uint8_t ZIP_MAGIC[] = {'P', 'K', 0x03, 0x04};
    // Markdown may itself begin with the ZIP magic, so the trailer decides first
    if (codec::has_tmd_trailer(data, size)) {
        return Format::TMD;
    }
    if (size >= sizeof(ZIP_MAGIC) && std::equal(ZIP_MAGIC, ZIP_MAGIC + sizeof(ZIP_MAGIC), data)) {
        return Format::TMDZ;
    }
    if (size > 0) {
        return Format::TMD;
    }
    return std::nullopt;
}

std::optional<Format> format_from_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".tmd") return Format::TMD;
    if (ext == ".tmdz") return Format::TMDZ;
    return std::nullopt;
}

// ============================================================================
// Decoding
// ============================================================================

Result<Document> read_tmdz(const uint8_t* data, size_t size, const ReadMode& mode) {
    return read_archive(data, size, mode);
}

Result<Document> read_tmd(const uint8_t* data, size_t size, const ReadMode& mode) {
    auto parts = codec::split_tmd(data, size);
    if (!parts.ok()) {
        return parts.error();
    }
    const codec::TmdParts& p = parts.value();

    if (!is_valid_utf8(p.markdown, p.markdown_size)) {
        return Error(ErrorCode::INVALID_FORMAT, "markdown section is not valid UTF-8");
    }

    auto doc = read_archive(p.archive, p.archive_size, mode);
    if (!doc.ok()) {
        return doc;
    }

    const std::string& archived = doc.value().markdown();
    if (archived.size() != p.markdown_size ||
        !std::equal(archived.begin(), archived.end(), reinterpret_cast<const char*>(p.markdown))) {
        return Error(ErrorCode::INVALID_FORMAT, "markdown prefix does not match index.md");
    }

    logger().debug("decoded tmd: " + std::to_string(p.markdown_size) + " bytes of markdown");
    return doc;
}

Result<Document> read_document(const Bytes& data, std::optional<Format> format, const ReadMode& mode) {
    if (!format) {
        format = sniff_format(data);
        if (!format) {
            return Error(ErrorCode::INVALID_FORMAT, "unable to detect container format of empty input");
        }
    }
    return *format == Format::TMD ? read_tmd(data.data(), data.size(), mode)
                                  : read_tmdz(data.data(), data.size(), mode);
}

Result<Document> read_document(std::istream& in, std::optional<Format> format, const ReadMode& mode) {
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error(ErrorCode::IO_ERROR, "failed to read container stream");
    }
    return read_document(data, format, mode);
}

Result<Document> read_from_path(const fs::path& path, std::optional<Format> format, const ReadMode& mode) {
    auto data = read_file(path);
    if (!data.ok()) {
        return data.error();
    }
    auto doc = read_document(data.value(), format, mode);
    if (!doc.ok()) {
        return doc.error().with_context(path.string());
    }
    return doc;
}

// ============================================================================
// Encoding
// ============================================================================

Result<Bytes> write_tmdz(const Document& doc, const WriteMode& mode) {
    auto archive = build_archive(doc, mode);
    if (archive.ok()) {
        logger().debug("encoded tmdz: " + std::to_string(archive.value().size()) + " bytes");
    }
    return archive;
}

Result<Bytes> write_tmd(const Document& doc, const WriteMode& mode) {
    auto archive = build_archive(doc, mode);
    if (!archive.ok()) {
        return archive;
    }

    const std::string& markdown = doc.markdown();
    auto patched = codec::patch_comment(archive.value(), codec::encode_trailer(markdown.size()));
    if (!patched.ok()) {
        return patched.error();
    }

    Bytes out;
    out.reserve(markdown.size() + archive.value().size());
    out.insert(out.end(), markdown.begin(), markdown.end());
    out.insert(out.end(), archive.value().begin(), archive.value().end());

    logger().debug("encoded tmd: " + std::to_string(markdown.size()) + " bytes of markdown, " +
                   std::to_string(archive.value().size()) + " bytes of archive");
    return Result<Bytes>(std::move(out));
}

Result<Bytes> write_document(const Document& doc, Format format, const WriteMode& mode) {
    return format == Format::TMD ? write_tmd(doc, mode) : write_tmdz(doc, mode);
}

Result<void> write_document(const Document& doc, Format format, std::ostream& out, const WriteMode& mode) {
    auto bytes = write_document(doc, format, mode);
    if (!bytes.ok()) {
        return bytes.error();
    }
    out.write(reinterpret_cast<const char*>(bytes.value().data()),
              static_cast<std::streamsize>(bytes.value().size()));
    if (!out) {
        return Error(ErrorCode::IO_ERROR, "failed to write container stream");
    }
    return Ok();
}

Result<void> write_to_path(const Document& doc, const fs::path& path,
                           std::optional<Format> format, const WriteMode& mode) {
    if (!format) {
        format = format_from_extension(path);
        if (!format) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "cannot infer container format from '" + path.string() + "'; use .tmd or .tmdz");
        }
    }

    auto bytes = write_document(doc, *format, mode);
    if (!bytes.ok()) {
        return bytes.error();
    }
    return write_file_atomic(path, bytes.value());
}

}  // namespace tmd
