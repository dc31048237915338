#include <tmd/attachment_store.hpp>
#include <tmd/manifest.hpp>
#include <tmd/util/encoding.hpp>
#include <tmd/util/path.hpp>
#include <tmd/util/sha256.hpp>

#include <algorithm>

namespace tmd {

// ============================================================================
// AttachmentStore
// ============================================================================

Result<LogicalPath> AttachmentStore::checked_path(const std::string& logical_path) {
    if (!is_valid_utf8(logical_path)) {
        return Error(ErrorCode::INVALID_PATH, "logical path is not valid UTF-8");
    }
    auto normalized = normalize_logical_path(logical_path);
    if (!normalized.ok()) {
        return normalized.error();
    }
    if (is_reserved_entry(normalized.value())) {
        return Error(ErrorCode::INVALID_PATH,
                     "logical path '" + normalized.value() + "' is reserved by the container");
    }
    return normalized;
}

AttachmentStore::Entry* AttachmentStore::find_entry(const AttachmentId& id) {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

const AttachmentStore::Entry* AttachmentStore::find_entry(const AttachmentId& id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

Result<AttachmentId> AttachmentStore::insert(const AttachmentId& id,
                                             const std::string& logical_path,
                                             const std::string& mime,
                                             Bytes data) {
    auto path = checked_path(logical_path);
    if (!path.ok()) {
        return path.error();
    }
    if (!is_valid_utf8(mime)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "mime type of '" + path.value() + "' is not valid UTF-8");
    }
    if (entries_.count(id) != 0) {
        return Error(ErrorCode::ALREADY_EXISTS,
                     "attachment id " + id.to_string() + " already exists");
    }
    if (by_path_.count(path.value()) != 0) {
        return Error(ErrorCode::ALREADY_EXISTS,
                     "attachment '" + path.value() + "' already exists");
    }

    Entry entry;
    entry.meta.id = id;
    entry.meta.logical_path = path.value();
    entry.meta.mime = mime;
    entry.meta.length = static_cast<uint64_t>(data.size());
    entry.meta.sha256 = SHA256::digest(data);
    entry.data = std::move(data);

    by_path_.emplace(path.value(), id);
    entries_.emplace(id, std::move(entry));
    return id;
}

Result<void> AttachmentStore::insert_verified(const AttachmentRecord& record,
                                              Bytes data,
                                              bool verify) {
    if (!is_normalized_logical_path(record.logical_path)) {
        return Error(ErrorCode::INVALID_PATH,
                     "attachment '" + record.logical_path + "' has a non-normalized logical path");
    }
    if (is_reserved_entry(record.logical_path)) {
        return Error(ErrorCode::INVALID_PATH,
                     "logical path '" + record.logical_path + "' is reserved by the container");
    }
    if (entries_.count(record.id) != 0) {
        return Error(ErrorCode::ALREADY_EXISTS,
                     "attachment id " + record.id.to_string() + " already exists");
    }
    if (by_path_.count(record.logical_path) != 0) {
        return Error(ErrorCode::ALREADY_EXISTS,
                     "attachment '" + record.logical_path + "' already exists");
    }

    uint64_t actual_length = static_cast<uint64_t>(data.size());
    if (actual_length != record.length) {
        return Error(ErrorCode::LENGTH_MISMATCH,
                     "attachment '" + record.logical_path + "' length mismatch: manifest=" +
                     std::to_string(record.length) + " actual=" + std::to_string(actual_length));
    }

    Sha256Digest actual = SHA256::digest(data);
    if (verify && record.sha256 && *record.sha256 != actual) {
        return Error(ErrorCode::DIGEST_MISMATCH,
                     "attachment '" + record.logical_path + "' sha256 mismatch: manifest=" +
                     hex_encode(*record.sha256) + " actual=" + hex_encode(actual));
    }

    Entry entry;
    entry.meta.id = record.id;
    entry.meta.logical_path = record.logical_path;
    entry.meta.mime = record.mime;
    entry.meta.length = actual_length;
    entry.meta.sha256 = actual;
    entry.meta.title = record.title;
    entry.meta.alt = record.alt;
    entry.meta.extras = record.extras;
    entry.data = std::move(data);

    by_path_.emplace(record.logical_path, record.id);
    entries_.emplace(record.id, std::move(entry));
    return Ok();
}

Result<void> AttachmentStore::remove(const AttachmentId& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Error(ErrorCode::NOT_FOUND, "attachment id " + id.to_string() + " not found");
    }
    by_path_.erase(it->second.meta.logical_path);
    entries_.erase(it);
    return Ok();
}

Result<void> AttachmentStore::rename(const AttachmentId& id, const std::string& new_path) {
    Entry* entry = find_entry(id);
    if (!entry) {
        return Error(ErrorCode::NOT_FOUND, "attachment id " + id.to_string() + " not found");
    }

    auto path = checked_path(new_path);
    if (!path.ok()) {
        return path.error();
    }

    auto existing = by_path_.find(path.value());
    if (existing != by_path_.end()) {
        if (existing->second == id) {
            return Ok();
        }
        return Error(ErrorCode::ALREADY_EXISTS,
                     "attachment '" + path.value() + "' already exists");
    }

    // Insert the new key first: if it throws, the old mapping is intact
    by_path_.emplace(path.value(), id);
    by_path_.erase(entry->meta.logical_path);
    entry->meta.logical_path = path.value();
    return Ok();
}

Result<void> AttachmentStore::set_title(const AttachmentId& id, std::optional<std::string> title) {
    Entry* entry = find_entry(id);
    if (!entry) {
        return Error(ErrorCode::NOT_FOUND, "attachment id " + id.to_string() + " not found");
    }
    if (title && !is_valid_utf8(*title)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "attachment title is not valid UTF-8");
    }
    entry->meta.title = std::move(title);
    return Ok();
}

Result<void> AttachmentStore::set_alt(const AttachmentId& id, std::optional<std::string> alt) {
    Entry* entry = find_entry(id);
    if (!entry) {
        return Error(ErrorCode::NOT_FOUND, "attachment id " + id.to_string() + " not found");
    }
    if (alt && !is_valid_utf8(*alt)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "attachment alt text is not valid UTF-8");
    }
    entry->meta.alt = std::move(alt);
    return Ok();
}

Result<void> AttachmentStore::set_extras(const AttachmentId& id, nlohmann::json extras) {
    Entry* entry = find_entry(id);
    if (!entry) {
        return Error(ErrorCode::NOT_FOUND, "attachment id " + id.to_string() + " not found");
    }
    if (!extras.is_null() && !extras.is_object()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "attachment extras must be a JSON object");
    }
    if (!is_valid_utf8_json(extras)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "attachment extras contain invalid UTF-8");
    }
    entry->meta.extras = extras.is_null() ? nlohmann::json::object() : std::move(extras);
    return Ok();
}

const AttachmentMeta* AttachmentStore::lookup_by_id(const AttachmentId& id) const {
    const Entry* entry = find_entry(id);
    return entry ? &entry->meta : nullptr;
}

const AttachmentMeta* AttachmentStore::lookup_by_path(const std::string& logical_path) const {
    auto normalized = normalize_logical_path(logical_path);
    if (!normalized.ok()) {
        return nullptr;
    }
    auto it = by_path_.find(normalized.value());
    if (it == by_path_.end()) {
        return nullptr;
    }
    return lookup_by_id(it->second);
}

const Bytes* AttachmentStore::data(const AttachmentId& id) const {
    const Entry* entry = find_entry(id);
    return entry ? &entry->data : nullptr;
}

Result<void> AttachmentStore::mutate_bytes(const AttachmentId& id, const BytesFn& fn) {
    // id may refer into an entry that fn removes
    const AttachmentId key = id;
    const Entry* entry = find_entry(key);
    if (!entry) {
        return Error(ErrorCode::NOT_FOUND, "attachment id " + key.to_string() + " not found");
    }

    Bytes working = entry->data;
    auto edited = fn(working);
    if (!edited.ok()) {
        return edited;
    }

    // fn may have touched the store, so look the entry up again
    Entry* current = find_entry(key);
    if (!current) {
        return Error(ErrorCode::NOT_FOUND,
                     "attachment id " + key.to_string() + " was removed while its bytes were edited");
    }
    current->meta.length = static_cast<uint64_t>(working.size());
    current->meta.sha256 = SHA256::digest(working);
    current->data = std::move(working);
    return Ok();
}

std::vector<AttachmentMeta> AttachmentStore::list() const {
    std::vector<AttachmentMeta> out;
    out.reserve(by_path_.size());
    for (const auto& kv : by_path_) {
        const Entry* entry = find_entry(kv.second);
        if (entry) {
            out.push_back(entry->meta);
        }
    }
    return out;
}

Result<void> AttachmentStore::check_consistency() const {
    if (by_path_.size() != entries_.size()) {
        return Error(ErrorCode::INTERNAL_ERROR,
                     "attachment path index has " + std::to_string(by_path_.size()) +
                     " entries but the table has " + std::to_string(entries_.size()));
    }

    for (const auto& kv : by_path_) {
        const Entry* entry = find_entry(kv.second);
        if (!entry || entry->meta.logical_path != kv.first) {
            return Error(ErrorCode::INTERNAL_ERROR,
                         "attachment path index entry '" + kv.first + "' is stale");
        }
        if (entry->meta.length != entry->data.size()) {
            return Error(ErrorCode::LENGTH_MISMATCH,
                         "attachment '" + kv.first + "' length mismatch: recorded=" +
                         std::to_string(entry->meta.length) +
                         " actual=" + std::to_string(entry->data.size()));
        }
        Sha256Digest actual = SHA256::digest(entry->data);
        if (actual != entry->meta.sha256) {
            return Error(ErrorCode::DIGEST_MISMATCH,
                         "attachment '" + kv.first + "' sha256 mismatch: recorded=" +
                         hex_encode(entry->meta.sha256) + " actual=" + hex_encode(actual));
        }
    }
    return Ok();
}

}  // namespace tmd
