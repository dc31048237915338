#pragma once

#include <tmd/codec/trailer.hpp>
#include <tmd/core_types.hpp>
#include <tmd/result.hpp>

#include <cstdint>
#include <ctime>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct archive;

namespace tmd::codec {

// Every entry is written with the same timestamp, owner and mode
constexpr time_t ZIP_FIXED_MTIME = 315576000;      // 1980-01-01T12:00:00Z
constexpr unsigned ZIP_FILE_MODE = 0644;
constexpr const char* ZIP_WRITE_OPTIONS = "zip:compression=store,zip:hdrcharset=UTF-8";

/**
 * One entry of an opened archive, with its payload already read.
 */
struct ZipEntry {
    std::string name;
    Bytes data;
    bool crc_ok = true;   // Stored CRC-32 matched the payload
};

/**
 * ZipWriter - Builds a STORED-only ZIP archive in memory with libarchive.
 *
 * Every entry gets the same fixed timestamp and permissions, so the
 * output depends only on the entry names, order and contents.
 *
 * Usage:
 *     ZipWriter zip;
 *     zip.add_entry("a.txt", bytes);
 *     auto archive = zip.finish();
 */
class ZipWriter {
public:
    ZipWriter() = default;
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * Append a STORED entry.
     *
     * @param name Entry name (UTF-8)
     * @param data Payload
     * @param size Payload size
     */
    Result<void> add_entry(const std::string& name, const uint8_t* data, size_t size);

    Result<void> add_entry(const std::string& name, const Bytes& data) {
        return add_entry(name, data.data(), data.size());
    }

    Result<void> add_entry(const std::string& name, const std::string& text) {
        return add_entry(name, reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    /**
     * Write the central directory and end record and hand back the
     * archive. A non-empty comment is patched into the end record
     * afterwards. The writer cannot be used once finished.
     */
    Result<Bytes> finish(const Bytes& comment = {});

    size_t entry_count() const { return names_.size(); }

private:
    Result<void> open();

    struct archive* archive_ = nullptr;
    Bytes out_;
    std::unordered_set<std::string> names_;
    bool finished_ = false;
};

/**
 * ZipReader - Reads every entry of a STORED-only archive through
 * libarchive's central-directory reader.
 *
 * The end record is checked first: ZIP64 and multi-disk archives are
 * rejected with UNSUPPORTED. Compressed or encrypted entries are
 * UNSUPPORTED; unreadable or truncated entries, duplicate names and a
 * central directory whose entry count disagrees with the end record
 * are INVALID_FORMAT.
 */
class ZipReader {
public:
    static Result<ZipReader> open(const uint8_t* data, size_t size);

    // Entries in archive order
    const std::vector<ZipEntry>& entries() const { return entries_; }

    const ZipEntry* find(const std::string& name) const;

    const Bytes& read(const ZipEntry& entry) const { return entry.data; }

    bool crc_matches(const ZipEntry& entry) const { return entry.crc_ok; }

private:
    ZipReader() = default;

    std::vector<ZipEntry> entries_;
    std::unordered_map<std::string, size_t> by_name_;
};

}  // namespace tmd::codec
