#include <tmd/codec/zip_archive.hpp>
#include <tmd/util/logger.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <cstring>
#include <memory>

namespace tmd::codec {

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using ArchiveReadPtr = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveEntryPtr = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

std::string archive_message(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

// libarchive write callback: append every block to the output buffer
la_ssize_t append_block(struct archive* /* a */, void* client, const void* buffer, size_t length) {
    auto* out = static_cast<Bytes*>(client);
    const auto* bytes = static_cast<const uint8_t*>(buffer);
    out->insert(out->end(), bytes, bytes + length);
    return static_cast<la_ssize_t>(length);
}

// The zip reader names the format after the current entry's method,
// e.g. "ZIP 2.0 (deflation)"
bool entry_is_stored(struct archive* a) {
    const char* format = archive_format_name(a);
    return format && std::strstr(format, "(uncompressed)") != nullptr;
}

Result<void> read_entry_data(struct archive* a, ZipEntry& entry) {
    const void* block = nullptr;
    size_t length = 0;
    la_int64_t offset = 0;

    for (;;) {
        int r = archive_read_data_block(a, &block, &length, &offset);
        if (r == ARCHIVE_EOF) {
            return Ok();
        }
        if (r < ARCHIVE_WARN) {
            return Error(ErrorCode::INVALID_FORMAT,
                         "failed to read '" + entry.name + "': " + archive_message(a));
        }
        if (offset < 0 || static_cast<uint64_t>(offset) != entry.data.size()) {
            return Error(ErrorCode::INVALID_FORMAT, "entry '" + entry.name + "' has a gap in its data");
        }

        const auto* bytes = static_cast<const uint8_t*>(block);
        entry.data.insert(entry.data.end(), bytes, bytes + length);

        // Raised with the last block when the stored CRC-32 or size is wrong
        if (r == ARCHIVE_WARN) {
            logger().debug("entry '" + entry.name + "': " + archive_message(a));
            entry.crc_ok = false;
            return Ok();
        }
    }
}

}  // namespace

// ============================================================================
// ZipWriter
// ============================================================================

ZipWriter::~ZipWriter() {
    if (archive_) {
        archive_write_free(archive_);
    }
}

Result<void> ZipWriter::open() {
    if (archive_) {
        return Ok();
    }

    archive_ = archive_write_new();
    if (!archive_) {
        return Error(ErrorCode::INTERNAL_ERROR, "failed to allocate ZIP writer");
    }
    if (archive_write_set_format_zip(archive_) != ARCHIVE_OK ||
        archive_write_set_options(archive_, ZIP_WRITE_OPTIONS) != ARCHIVE_OK ||
        archive_write_set_bytes_per_block(archive_, 0) != ARCHIVE_OK ||
        archive_write_open(archive_, &out_, nullptr, append_block, nullptr) != ARCHIVE_OK) {
        return Error(ErrorCode::INTERNAL_ERROR,
                     "failed to initialize ZIP writer: " + archive_message(archive_));
    }
    return Ok();
}

Result<void> ZipWriter::add_entry(const std::string& name, const uint8_t* data, size_t size) {
    if (finished_) {
        return Error(ErrorCode::INTERNAL_ERROR, "archive already finished");
    }
    if (name.empty() || name.size() > ZIP16_LIMIT) {
        return Error(ErrorCode::INVALID_ARGUMENT, "invalid entry name length");
    }
    if (names_.count(name) != 0) {
        return Error(ErrorCode::ALREADY_EXISTS, "duplicate archive entry '" + name + "'");
    }
    if (names_.size() >= ZIP16_LIMIT - 1) {
        return Error(ErrorCode::UNSUPPORTED, "too many entries for a non-ZIP64 archive");
    }
    if (size >= ZIP32_LIMIT || out_.size() >= ZIP32_LIMIT) {
        return Error(ErrorCode::UNSUPPORTED, "entry '" + name + "' exceeds the 4 GiB ZIP limit");
    }

    auto opened = open();
    if (!opened.ok()) {
        return opened;
    }

    ArchiveEntryPtr entry(archive_entry_new());
    if (!entry) {
        return Error(ErrorCode::INTERNAL_ERROR, "failed to allocate ZIP entry");
    }
    archive_entry_set_pathname_utf8(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), ZIP_FILE_MODE);
    archive_entry_set_uid(entry.get(), 0);
    archive_entry_set_gid(entry.get(), 0);
    archive_entry_set_mtime(entry.get(), ZIP_FIXED_MTIME, 0);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));

    int r = archive_write_header(archive_, entry.get());
    if (r < ARCHIVE_WARN) {
        return Error(ErrorCode::INTERNAL_ERROR,
                     "failed to write header for '" + name + "': " + archive_message(archive_));
    }
    if (r == ARCHIVE_WARN) {
        logger().warning("entry '" + name + "': " + archive_message(archive_));
    }

    if (size > 0) {
        la_ssize_t written = archive_write_data(archive_, data, size);
        if (written < 0 || static_cast<size_t>(written) != size) {
            return Error(ErrorCode::INTERNAL_ERROR,
                         "failed to write data for '" + name + "': " + archive_message(archive_));
        }
    }
    if (archive_write_finish_entry(archive_) < ARCHIVE_WARN) {
        return Error(ErrorCode::INTERNAL_ERROR,
                     "failed to finish '" + name + "': " + archive_message(archive_));
    }

    names_.insert(name);
    return Ok();
}

Result<Bytes> ZipWriter::finish(const Bytes& comment) {
    if (finished_) {
        return Error(ErrorCode::INTERNAL_ERROR, "archive already finished");
    }
    if (comment.size() > EOCD_MAX_COMMENT) {
        return Error(ErrorCode::INVALID_ARGUMENT, "archive comment exceeds 65535 bytes");
    }

    auto opened = open();
    if (!opened.ok()) {
        return opened.error();
    }
    finished_ = true;

    if (archive_write_close(archive_) != ARCHIVE_OK) {
        return Error(ErrorCode::INTERNAL_ERROR,
                     "failed to finish ZIP archive: " + archive_message(archive_));
    }
    archive_write_free(archive_);
    archive_ = nullptr;

    Bytes out = std::move(out_);
    if (out.size() >= ZIP32_LIMIT) {
        return Error(ErrorCode::UNSUPPORTED, "archive exceeds 4 GiB");
    }
    if (!comment.empty()) {
        auto patched = patch_comment(out, comment);
        if (!patched.ok()) {
            return patched.error();
        }
    }
    return Result<Bytes>(std::move(out));
}

// ============================================================================
// ZipReader
// ============================================================================

Result<ZipReader> ZipReader::open(const uint8_t* data, size_t size) {
    auto eocd = read_eocd(data, size);
    if (!eocd.ok()) {
        return eocd.error();
    }

    ArchiveReadPtr a(archive_read_new());
    if (!a) {
        return Error(ErrorCode::INTERNAL_ERROR, "failed to allocate ZIP reader");
    }
    archive_read_support_format_zip_seekable(a.get());
    if (archive_read_open_memory(a.get(), data, size) != ARCHIVE_OK) {
        return Error(ErrorCode::INVALID_FORMAT, "unreadable archive: " + archive_message(a.get()));
    }

    ZipReader zip;
    struct archive_entry* header = nullptr;
    for (;;) {
        int r = archive_read_next_header(a.get(), &header);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return Error(ErrorCode::INVALID_FORMAT,
                         "unreadable archive entry: " + archive_message(a.get()));
        }

        const char* name = archive_entry_pathname_utf8(header);
        if (!name) {
            name = archive_entry_pathname(header);
        }
        if (!name || name[0] == '\0') {
            return Error(ErrorCode::INVALID_FORMAT, "archive entry without a name");
        }

        ZipEntry entry;
        entry.name = name;
        if (archive_entry_is_encrypted(header)) {
            return Error(ErrorCode::UNSUPPORTED, "encrypted entry '" + entry.name + "' is not supported");
        }
        if (!entry_is_stored(a.get())) {
            return Error(ErrorCode::UNSUPPORTED,
                         "entry '" + entry.name + "' is compressed (" +
                         archive_format_name(a.get()) + ")");
        }

        auto read = read_entry_data(a.get(), entry);
        if (!read.ok()) {
            return read.error();
        }
        if (archive_entry_size_is_set(header) &&
            static_cast<uint64_t>(archive_entry_size(header)) != entry.data.size()) {
            return Error(ErrorCode::INVALID_FORMAT, "data of '" + entry.name + "' is truncated");
        }

        if (!zip.by_name_.emplace(entry.name, zip.entries_.size()).second) {
            return Error(ErrorCode::INVALID_FORMAT, "duplicate archive entry '" + entry.name + "'");
        }
        zip.entries_.push_back(std::move(entry));
    }

    if (zip.entries_.size() != eocd.value().entry_count) {
        return Error(ErrorCode::INVALID_FORMAT,
                     "end record lists " + std::to_string(eocd.value().entry_count) +
                     " entries but " + std::to_string(zip.entries_.size()) + " were read");
    }
    return zip;
}

const ZipEntry* ZipReader::find(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : &entries_[it->second];
}

}  // namespace tmd::codec
