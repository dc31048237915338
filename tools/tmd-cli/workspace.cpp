#include "workspace.hpp"

#include <tmd/manifest.hpp>
#include <tmd/util/file_io.hpp>
#include <tmd/util/logger.hpp>

namespace tmd::cli {

namespace fs = std::filesystem;

namespace {

Result<std::string> read_text(const fs::path& path) {
    auto bytes = read_file(path);
    if (!bytes.ok()) {
        return bytes.error();
    }
    return std::string(bytes.value().begin(), bytes.value().end());
}

Result<void> write_text(const fs::path& path, const std::string& text) {
    return write_file_atomic(path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Result<void> make_parent(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }
    return Ok();
}

Result<AttachmentStore> read_attachment_files(const fs::path& dir) {
    AttachmentStore store;

    std::error_code ec;
    fs::path index = dir / ATTACHMENTS_ENTRY;
    if (!fs::exists(index, ec)) {
        return Result<AttachmentStore>(std::move(store));
    }

    auto text = read_text(index);
    if (!text.ok()) {
        return text.error();
    }
    auto records = attachment_records_from_json(text.value());
    if (!records.ok()) {
        return records.error();
    }

    for (const auto& record : records.value()) {
        fs::path file = dir / record.logical_path;
        if (!fs::exists(file, ec)) {
            return Error(ErrorCode::NOT_FOUND,
                         "attachment file missing from workspace: " + file.string());
        }
        auto data = read_file(file);
        if (!data.ok()) {
            return data.error();
        }
        if (data.value().size() != record.length) {
            logger().info("attachment '" + record.logical_path + "' changed on disk");
        }

        auto inserted = store.insert(record.id, record.logical_path, record.mime, std::move(data.value()));
        if (!inserted.ok()) {
            return inserted.error().with_context("attachment error");
        }

        Result<void> updated = store.set_title(record.id, record.title);
        if (updated.ok()) updated = store.set_alt(record.id, record.alt);
        if (updated.ok()) updated = store.set_extras(record.id, record.extras);
        if (!updated.ok()) {
            return updated.error();
        }
    }
    return Result<AttachmentStore>(std::move(store));
}

}  // namespace

Result<Document> read_workspace(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error(ErrorCode::NOT_FOUND, "no such directory: " + dir.string());
    }

    auto manifest_text = read_text(dir / MANIFEST_ENTRY);
    if (!manifest_text.ok()) {
        return manifest_text.error();
    }
    auto manifest = manifest_from_json(manifest_text.value());
    if (!manifest.ok()) {
        return manifest.error();
    }

    auto markdown = read_text(dir / MARKDOWN_ENTRY);
    if (!markdown.ok()) {
        return markdown.error();
    }

    auto store = read_attachment_files(dir);
    if (!store.ok()) {
        return store.error();
    }

    fs::path db_file = dir / DATABASE_ENTRY;
    auto db = DbHandle::new_empty();
    if (!db.ok()) {
        return db.error();
    }
    if (fs::exists(db_file, ec)) {
        auto imported = db.value().import_from(db_file);
        if (!imported.ok()) {
            return imported.error().with_context(db_file.string());
        }
    }

    auto doc = Document::from_parts(std::move(markdown.value()),
                                    std::move(manifest.value()),
                                    std::move(store.value()),
                                    std::move(db.value()));
    if (!doc.ok()) {
        return doc;
    }

    // Files may have been edited since unpacking
    doc.value().touch();
    return doc;
}

Result<void> write_workspace(const Document& doc, const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir / "db", ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "failed to create " + dir.string() + ": " + ec.message());
    }

    std::vector<AttachmentMeta> attachments = doc.list_attachments();
    std::vector<AttachmentRecord> records;
    for (const auto& meta : attachments) {
        records.push_back(to_record(meta, true));
    }

    auto manifest_json = manifest_to_json(doc.manifest());
    if (!manifest_json.ok()) {
        return manifest_json.error();
    }
    auto records_json = attachment_records_to_json(records);
    if (!records_json.ok()) {
        return records_json.error();
    }

    Result<void> written = write_text(dir / MARKDOWN_ENTRY, doc.markdown());
    if (written.ok()) written = write_text(dir / MANIFEST_ENTRY, manifest_json.value());
    if (written.ok()) written = write_text(dir / ATTACHMENTS_ENTRY, records_json.value());
    if (written.ok()) written = doc.db_export(dir / DATABASE_ENTRY);
    if (!written.ok()) {
        return written;
    }

    for (const auto& meta : attachments) {
        fs::path file = dir / meta.logical_path;
        auto parent = make_parent(file);
        if (!parent.ok()) {
            return parent;
        }
        const Bytes* data = doc.attachment_data(meta.id);
        if (!data) {
            return Error(ErrorCode::INTERNAL_ERROR, "attachment '" + meta.logical_path + "' has no data");
        }
        auto file_written = write_file_atomic(file, *data);
        if (!file_written.ok()) {
            return file_written;
        }
    }

    logger().debug("unpacked " + std::to_string(attachments.size()) + " attachments to " + dir.string());
    return Ok();
}

}  // namespace tmd::cli
