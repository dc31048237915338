#pragma once

#include <tmd/attachment_store.hpp>
#include <tmd/db/db_handle.hpp>
#include <tmd/result.hpp>
#include <tmd/types.hpp>

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace tmd {

/**
 * Document - The unit of work: Markdown, manifest, attachments and the
 * embedded database.
 *
 * A Document exclusively owns all four parts. It is move-only; clone()
 * produces an independent deep copy including a new database file.
 * Nothing is persisted until the document is written by the codec.
 */
class Document {
public:
    /**
     * Create a fresh document with a new doc_id, no attachments and an
     * empty database.
     *
     * @param markdown Initial Markdown body
     * @return The document, or error if the database could not be created
     */
    static Result<Document> create(std::string markdown = "");

    /**
     * Assemble a document from decoded parts. Used by the codec read path.
     * Fails with INVALID_FORMAT if the cover image references an unknown
     * attachment.
     */
    static Result<Document> from_parts(std::string markdown,
                                       Manifest manifest,
                                       AttachmentStore attachments,
                                       DbHandle db);

    Document(Document&&) = default;
    Document& operator=(Document&&) = default;
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    /**
     * Deep copy. The copy keeps the doc_id.
     */
    Result<Document> clone() const;

    // ========================================================================
    // Markdown and manifest
    // ========================================================================

    const std::string& markdown() const { return markdown_; }
    void set_markdown(std::string markdown);

    const Manifest& manifest() const { return manifest_; }

    // Manifest fields; INVALID_ARGUMENT for text that is not valid UTF-8
    Result<void> set_title(std::optional<std::string> title);
    Result<void> set_authors(std::vector<std::string> authors);
    Result<void> set_tags(std::vector<std::string> tags);
    Result<void> add_link(LinkRef link);
    Result<void> set_extras(nlohmann::json extras);

    /**
     * Set or clear the cover image.
     *
     * @return NOT_FOUND if id does not name an attachment
     */
    Result<void> set_cover_image(std::optional<AttachmentId> id);

    /**
     * Set modified_utc to now, never earlier than created_utc.
     */
    void touch();

    // ========================================================================
    // Attachments
    // ========================================================================

    /**
     * Add an attachment under a new random id.
     *
     * @param logical_path Path inside the container (normalized)
     * @param mime Media type
     * @param data Payload
     * @return The new id
     */
    Result<AttachmentId> add_attachment(const std::string& logical_path,
                                        const std::string& mime,
                                        Bytes data);

    // Same, reading the payload from a stream until EOF
    Result<AttachmentId> add_attachment_stream(const std::string& logical_path,
                                               const std::string& mime,
                                               std::istream& in);

    /**
     * Remove an attachment. A cover image pointing at it is cleared.
     */
    Result<void> remove_attachment(const AttachmentId& id);

    Result<void> rename_attachment(const AttachmentId& id, const std::string& new_path);
    Result<void> set_attachment_title(const AttachmentId& id, std::optional<std::string> title);
    Result<void> set_attachment_alt(const AttachmentId& id, std::optional<std::string> alt);

    const AttachmentMeta* attachment(const AttachmentId& id) const;
    const AttachmentMeta* attachment_by_path(const std::string& logical_path) const;
    const Bytes* attachment_data(const AttachmentId& id) const;
    std::vector<AttachmentMeta> list_attachments() const;

    /**
     * Edit an attachment payload through fn; see AttachmentStore::mutate_bytes.
     */
    Result<void> mutate_attachment(const AttachmentId& id, const AttachmentStore::BytesFn& fn);

    const AttachmentStore& attachments() const { return attachments_; }

    // ========================================================================
    // Database
    // ========================================================================

    Result<void> db_with_read(const DbHandle::ConnectionFn& fn) const;

    // The functions below keep manifest().db_schema_version equal to the
    // database user_version.
    Result<void> db_with_write(const DbHandle::ConnectionFn& fn);
    Result<void> db_reset(const std::string& schema_sql, uint32_t version);
    Result<void> db_migrate(const std::string& step_sql, uint32_t from, uint32_t to);
    Result<void> db_import(const fs::path& in);
    Result<void> db_import_bytes(const Bytes& bytes);

    Result<void> db_export(const fs::path& out) const;
    Result<void> db_configure(const DbOptions& options);
    Result<uint32_t> db_schema_version() const;

    const DbHandle& db() const { return db_; }

    // ========================================================================
    // Validation
    // ========================================================================

    /**
     * Check everything the codec relies on before writing: Markdown and
     * every manifest and attachment string are UTF-8, timestamps are
     * ordered, every attachment's length and digest match its bytes, the
     * indexes agree, and the cover image exists.
     */
    Result<void> validate() const;

private:
    Document(std::string markdown, Manifest manifest, AttachmentStore attachments, DbHandle db)
        : markdown_(std::move(markdown))
        , manifest_(std::move(manifest))
        , attachments_(std::move(attachments))
        , db_(std::move(db))
    {}

    Result<void> sync_schema_version();

    std::string markdown_;
    Manifest manifest_;
    AttachmentStore attachments_;
    DbHandle db_;
};

}  // namespace tmd
