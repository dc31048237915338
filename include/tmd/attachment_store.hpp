#pragma once

#include <tmd/result.hpp>
#include <tmd/types.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tmd {

/**
 * AttachmentStore - Owns every attachment of one document.
 *
 * Maintains two indexes that always agree:
 * - Primary: AttachmentId -> entry (metadata + bytes)
 * - Secondary: logical path -> AttachmentId (unique)
 */
class AttachmentStore {
public:
    using BytesFn = std::function<Result<void>(Bytes& bytes)>;

    AttachmentStore() = default;

    // Deep copy; the copy owns independent buffers
    AttachmentStore(const AttachmentStore&) = default;
    AttachmentStore& operator=(const AttachmentStore&) = default;
    AttachmentStore(AttachmentStore&&) = default;
    AttachmentStore& operator=(AttachmentStore&&) = default;

    /**
     * Insert a new attachment.
     *
     * @param id Identifier for the new entry
     * @param logical_path Path inside the container (normalized here)
     * @param mime Declared media type
     * @param data Payload
     * @return The id, or ALREADY_EXISTS / INVALID_PATH, or
     *         INVALID_ARGUMENT if mime is not valid UTF-8
     */
    Result<AttachmentId> insert(const AttachmentId& id,
                                const std::string& logical_path,
                                const std::string& mime,
                                Bytes data);

    /**
     * Insert an entry decoded from a container.
     *
     * The length is always checked against the payload. With verify set
     * and a declared digest, the digest is checked too. The stored digest
     * is always computed from data.
     */
    Result<void> insert_verified(const AttachmentRecord& record, Bytes data, bool verify);

    Result<void> remove(const AttachmentId& id);

    /**
     * Move an attachment to a new logical path.
     * Renaming onto its own current path succeeds without change.
     */
    Result<void> rename(const AttachmentId& id, const std::string& new_path);

    // Display metadata; INVALID_ARGUMENT for text that is not valid UTF-8
    Result<void> set_title(const AttachmentId& id, std::optional<std::string> title);
    Result<void> set_alt(const AttachmentId& id, std::optional<std::string> alt);
    Result<void> set_extras(const AttachmentId& id, nlohmann::json extras);

    /**
     * Metadata lookups. Return nullptr when absent; the pointer is valid
     * until the next mutation of the store.
     */
    const AttachmentMeta* lookup_by_id(const AttachmentId& id) const;
    const AttachmentMeta* lookup_by_path(const std::string& logical_path) const;

    // Read-only payload view, or nullptr
    const Bytes* data(const AttachmentId& id) const;

    /**
     * Edit one payload inside a bounded scope.
     *
     * fn receives a working copy of the bytes. When it returns success
     * the copy becomes the payload and the length and SHA-256 are
     * recomputed before the store is observable again. When it fails the
     * payload is left untouched. Lookups made from inside fn see the
     * previous bytes with their matching metadata.
     *
     * @return NOT_FOUND if id is unknown or the entry was removed by fn,
     *         otherwise fn's result
     */
    Result<void> mutate_bytes(const AttachmentId& id, const BytesFn& fn);

    /**
     * Snapshot of all metadata, sorted by logical path.
     */
    std::vector<AttachmentMeta> list() const;

    /**
     * Check that both indexes agree and that every length and digest
     * matches its payload.
     */
    Result<void> check_consistency() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    struct Entry {
        AttachmentMeta meta;
        Bytes data;
    };

    Entry* find_entry(const AttachmentId& id);
    const Entry* find_entry(const AttachmentId& id) const;

    // Normalize and reject reserved container entry names
    static Result<LogicalPath> checked_path(const std::string& logical_path);

    std::unordered_map<AttachmentId, Entry> entries_;
    std::map<LogicalPath, AttachmentId> by_path_;
};

}  // namespace tmd
