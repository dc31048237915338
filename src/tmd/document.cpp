#include <tmd/document.hpp>
#include <tmd/manifest.hpp>
#include <tmd/util/encoding.hpp>
#include <tmd/util/logger.hpp>

#include <algorithm>
#include <iterator>

namespace tmd {

namespace {

constexpr const char* ATTACHMENT_CONTEXT = "attachment error";

template<typename T>
Result<T> relabel(Result<T> result) {
    if (!result.ok()) {
        return result.error().with_context(ATTACHMENT_CONTEXT);
    }
    return result;
}

bool all_valid_utf8(const std::vector<std::string>& values) {
    return std::all_of(values.begin(), values.end(),
                       [](const std::string& v) { return is_valid_utf8(v); });
}

// Every string that ends up in manifest.json
Result<void> check_manifest_text(const Manifest& m) {
    if (m.title && !is_valid_utf8(*m.title)) {
        return Error(ErrorCode::INVALID_FORMAT, "title is not valid UTF-8");
    }
    if (!all_valid_utf8(m.authors) || !all_valid_utf8(m.tags)) {
        return Error(ErrorCode::INVALID_FORMAT, "authors or tags are not valid UTF-8");
    }
    for (const auto& link : m.links) {
        if (!is_valid_utf8(link.rel) || !is_valid_utf8(link.href)) {
            return Error(ErrorCode::INVALID_FORMAT, "link is not valid UTF-8");
        }
    }
    if (!is_valid_utf8_json(m.extras)) {
        return Error(ErrorCode::INVALID_FORMAT, "manifest extras contain invalid UTF-8");
    }
    return Ok();
}

// Every string that ends up in attachments.json
Result<void> check_attachment_text(const AttachmentMeta& meta) {
    bool valid = is_valid_utf8(meta.logical_path) && is_valid_utf8(meta.mime) &&
                 (!meta.title || is_valid_utf8(*meta.title)) &&
                 (!meta.alt || is_valid_utf8(*meta.alt)) &&
                 is_valid_utf8_json(meta.extras);
    if (!valid) {
        return Error(ErrorCode::INVALID_FORMAT,
                     "attachment " + meta.id.to_string() + " has metadata that is not valid UTF-8");
    }
    return Ok();
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Result<Document> Document::create(std::string markdown) {
    auto manifest = make_manifest();
    if (!manifest.ok()) {
        return manifest.error();
    }
    auto db = DbHandle::new_empty();
    if (!db.ok()) {
        return db.error();
    }

    Manifest m = std::move(manifest.value());
    m.db_schema_version = 0;
    return Document(std::move(markdown), std::move(m), AttachmentStore(), std::move(db.value()));
}

Result<Document> Document::from_parts(std::string markdown,
                                      Manifest manifest,
                                      AttachmentStore attachments,
                                      DbHandle db) {
    if (manifest.cover_image && !attachments.lookup_by_id(*manifest.cover_image)) {
        return Error(ErrorCode::INVALID_FORMAT,
                     "cover_image references unknown attachment " + manifest.cover_image->to_string());
    }
    return Document(std::move(markdown), std::move(manifest), std::move(attachments), std::move(db));
}

Result<Document> Document::clone() const {
    auto db = db_.clone();
    if (!db.ok()) {
        return db.error();
    }
    return Document(markdown_, manifest_, attachments_, std::move(db.value()));
}

// ============================================================================
// Markdown and manifest
// ============================================================================

void Document::touch() {
    manifest_.modified_utc = std::max(now_utc(), manifest_.created_utc);
}

void Document::set_markdown(std::string markdown) {
    markdown_ = std::move(markdown);
    touch();
}

Result<void> Document::set_title(std::optional<std::string> title) {
    if (title && !is_valid_utf8(*title)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "title is not valid UTF-8");
    }
    manifest_.title = std::move(title);
    touch();
    return Ok();
}

Result<void> Document::set_authors(std::vector<std::string> authors) {
    if (!all_valid_utf8(authors)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "author is not valid UTF-8");
    }
    manifest_.authors = std::move(authors);
    touch();
    return Ok();
}

Result<void> Document::set_tags(std::vector<std::string> tags) {
    if (!all_valid_utf8(tags)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "tag is not valid UTF-8");
    }
    manifest_.tags = std::move(tags);
    touch();
    return Ok();
}

Result<void> Document::add_link(LinkRef link) {
    if (!is_valid_utf8(link.rel) || !is_valid_utf8(link.href)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "link is not valid UTF-8");
    }
    manifest_.links.push_back(std::move(link));
    touch();
    return Ok();
}

Result<void> Document::set_extras(nlohmann::json extras) {
    if (!is_valid_utf8_json(extras)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "extras contain invalid UTF-8");
    }
    manifest_.extras = std::move(extras);
    touch();
    return Ok();
}

Result<void> Document::set_cover_image(std::optional<AttachmentId> id) {
    if (id && !attachments_.lookup_by_id(*id)) {
        return Error(ErrorCode::NOT_FOUND, "attachment " + id->to_string() + " not found")
            .with_context(ATTACHMENT_CONTEXT);
    }
    manifest_.cover_image = std::move(id);
    touch();
    return Ok();
}

// ============================================================================
// Attachments
// ============================================================================

Result<AttachmentId> Document::add_attachment(const std::string& logical_path,
                                              const std::string& mime,
                                              Bytes data) {
    auto id = Uuid::generate_v4();
    if (!id.ok()) {
        return id.error();
    }
    auto inserted = relabel(attachments_.insert(id.value(), logical_path, mime, std::move(data)));
    if (inserted.ok()) {
        touch();
    }
    return inserted;
}

Result<AttachmentId> Document::add_attachment_stream(const std::string& logical_path,
                                                     const std::string& mime,
                                                     std::istream& in) {
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error(ErrorCode::IO_ERROR, "failed to read attachment stream for '" + logical_path + "'");
    }
    return add_attachment(logical_path, mime, std::move(data));
}

Result<void> Document::remove_attachment(const AttachmentId& id) {
    // id may refer into the entry being erased
    bool was_cover = manifest_.cover_image == id;
    auto removed = relabel(attachments_.remove(id));
    if (!removed.ok()) {
        return removed;
    }
    if (was_cover) {
        manifest_.cover_image.reset();
    }
    touch();
    return Ok();
}

Result<void> Document::rename_attachment(const AttachmentId& id, const std::string& new_path) {
    auto renamed = relabel(attachments_.rename(id, new_path));
    if (renamed.ok()) {
        touch();
    }
    return renamed;
}

Result<void> Document::set_attachment_title(const AttachmentId& id, std::optional<std::string> title) {
    auto updated = relabel(attachments_.set_title(id, std::move(title)));
    if (updated.ok()) {
        touch();
    }
    return updated;
}

Result<void> Document::set_attachment_alt(const AttachmentId& id, std::optional<std::string> alt) {
    auto updated = relabel(attachments_.set_alt(id, std::move(alt)));
    if (updated.ok()) {
        touch();
    }
    return updated;
}

const AttachmentMeta* Document::attachment(const AttachmentId& id) const {
    return attachments_.lookup_by_id(id);
}

const AttachmentMeta* Document::attachment_by_path(const std::string& logical_path) const {
    return attachments_.lookup_by_path(logical_path);
}

const Bytes* Document::attachment_data(const AttachmentId& id) const {
    return attachments_.data(id);
}

std::vector<AttachmentMeta> Document::list_attachments() const {
    return attachments_.list();
}

Result<void> Document::mutate_attachment(const AttachmentId& id, const AttachmentStore::BytesFn& fn) {
    auto mutated = attachments_.mutate_bytes(id, fn);
    if (!mutated.ok()) {
        return mutated.error().with_context(ATTACHMENT_CONTEXT);
    }
    touch();
    return Ok();
}

// ============================================================================
// Database
// ============================================================================

Result<void> Document::sync_schema_version() {
    auto version = db_.user_version();
    if (!version.ok()) {
        return version.error();
    }
    manifest_.db_schema_version = version.value();
    touch();
    return Ok();
}

Result<void> Document::db_with_read(const DbHandle::ConnectionFn& fn) const {
    return db_.with_read(fn);
}

Result<void> Document::db_with_write(const DbHandle::ConnectionFn& fn) {
    auto written = db_.with_write(fn);
    if (!written.ok()) {
        return written;
    }
    return sync_schema_version();
}

Result<void> Document::db_reset(const std::string& schema_sql, uint32_t version) {
    auto reset = db_.reset(schema_sql, version);
    if (!reset.ok()) {
        return reset;
    }
    return sync_schema_version();
}

Result<void> Document::db_migrate(const std::string& step_sql, uint32_t from, uint32_t to) {
    auto migrated = db_.migrate(step_sql, from, to);
    if (!migrated.ok()) {
        return migrated;
    }
    return sync_schema_version();
}

Result<void> Document::db_import(const fs::path& in) {
    auto imported = db_.import_from(in);
    if (!imported.ok()) {
        return imported;
    }
    return sync_schema_version();
}

Result<void> Document::db_import_bytes(const Bytes& bytes) {
    auto imported = db_.import_bytes(bytes);
    if (!imported.ok()) {
        return imported;
    }
    return sync_schema_version();
}

Result<void> Document::db_export(const fs::path& out) const {
    return db_.export_to(out);
}

Result<void> Document::db_configure(const DbOptions& options) {
    auto configured = db_.configure(options);
    if (configured.ok()) {
        touch();
    }
    return configured;
}

Result<uint32_t> Document::db_schema_version() const {
    return db_.user_version();
}

// ============================================================================
// Validation
// ============================================================================

Result<void> Document::validate() const {
    if (!is_valid_utf8(markdown_)) {
        return Error(ErrorCode::INVALID_FORMAT, "markdown is not valid UTF-8");
    }
    if (manifest_.modified_utc < manifest_.created_utc) {
        return Error(ErrorCode::INVALID_FORMAT, "modified_utc is earlier than created_utc");
    }
    auto manifest_text = check_manifest_text(manifest_);
    if (!manifest_text.ok()) {
        return manifest_text;
    }
    for (const auto& meta : attachments_.list()) {
        auto attachment_text = check_attachment_text(meta);
        if (!attachment_text.ok()) {
            return attachment_text.error().with_context(ATTACHMENT_CONTEXT);
        }
    }

    auto consistent = attachments_.check_consistency();
    if (!consistent.ok()) {
        return consistent.error().with_context(ATTACHMENT_CONTEXT);
    }

    if (manifest_.cover_image && !attachments_.lookup_by_id(*manifest_.cover_image)) {
        return Error(ErrorCode::NOT_FOUND,
                     "cover_image references unknown attachment " + manifest_.cover_image->to_string())
            .with_context(ATTACHMENT_CONTEXT);
    }
    return Ok();
}

}  // namespace tmd
