#include <tmd/codec/trailer.hpp>
#include <tmd/util/serializer.hpp>

#include <algorithm>

namespace tmd::codec {

Result<EocdLocation> locate_eocd(const uint8_t* data, size_t size) {
    if (size < EOCD_MIN_SIZE) {
        return Error(ErrorCode::INVALID_FORMAT,
                     "input too small to contain an end-of-central-directory record");
    }

    size_t last = size - EOCD_MIN_SIZE;
    size_t first = size > EOCD_MAX_SCAN ? size - EOCD_MAX_SCAN : 0;
    bool seen_signature = false;

    for (size_t idx = last + 1; idx-- > first;) {
        ByteReader reader(data + idx, size - idx);
        uint32_t signature = 0;
        reader.read_uint32(&signature);
        if (signature != EOCD_SIGNATURE) continue;

        seen_signature = true;
        uint16_t comment_length = 0;
        reader.seek(EOCD_COMMENT_LENGTH_OFFSET);
        reader.read_uint16(&comment_length);
        if (EOCD_MIN_SIZE + comment_length == size - idx) {
            return EocdLocation{idx, comment_length};
        }
    }

    if (seen_signature) {
        return Error(ErrorCode::INVALID_FORMAT, "EOCD comment length does not match buffer");
    }
    return Error(ErrorCode::INVALID_FORMAT, "end-of-central-directory signature not found");
}

Result<EocdRecord> read_eocd(const uint8_t* data, size_t size) {
    auto eocd = locate_eocd(data, size);
    if (!eocd.ok()) {
        return eocd.error();
    }

    EocdRecord record;
    record.location = eocd.value();
    size_t offset = record.location.offset;

    ByteReader reader(data + offset, size - offset);
    uint32_t signature = 0;
    uint16_t disk = 0, cd_disk = 0, disk_entries = 0;
    if (!reader.read_uint32(&signature) || !reader.read_uint16(&disk) ||
        !reader.read_uint16(&cd_disk) || !reader.read_uint16(&disk_entries) ||
        !reader.read_uint16(&record.entry_count) || !reader.read_uint32(&record.cd_size) ||
        !reader.read_uint32(&record.cd_offset)) {
        return Error(ErrorCode::INVALID_FORMAT, "truncated end-of-central-directory record");
    }

    if (record.entry_count == ZIP16_LIMIT || record.cd_size == ZIP32_LIMIT ||
        record.cd_offset == ZIP32_LIMIT) {
        return Error(ErrorCode::UNSUPPORTED, "ZIP64 archives are not supported");
    }
    if (disk != 0 || cd_disk != 0 || disk_entries != record.entry_count) {
        return Error(ErrorCode::UNSUPPORTED, "multi-disk archives are not supported");
    }
    if (record.cd_offset > offset || record.cd_size > offset - record.cd_offset) {
        return Error(ErrorCode::INVALID_FORMAT, "central directory lies outside the archive");
    }
    return record;
}

bool has_tmd_trailer(const uint8_t* data, size_t size) {
    auto eocd = locate_eocd(data, size);
    if (!eocd.ok()) {
        return false;
    }
    const uint8_t* comment = data + eocd.value().offset + EOCD_MIN_SIZE;
    return eocd.value().comment_length >= TMD_TRAILER_SIGNATURE_SIZE &&
           std::equal(TMD_TRAILER_SIGNATURE, TMD_TRAILER_SIGNATURE + TMD_TRAILER_SIGNATURE_SIZE, comment);
}

Bytes encode_trailer(uint64_t markdown_length) {
    ByteWriter writer;
    writer.reserve(TMD_TRAILER_SIZE);
    writer.write_raw(TMD_TRAILER_SIGNATURE, TMD_TRAILER_SIGNATURE_SIZE);
    writer.write_uint64(markdown_length);
    return writer.release();
}

Result<uint64_t> decode_trailer(const uint8_t* comment, size_t size) {
    if (size < TMD_TRAILER_SIGNATURE_SIZE ||
        !std::equal(TMD_TRAILER_SIGNATURE, TMD_TRAILER_SIGNATURE + TMD_TRAILER_SIGNATURE_SIZE, comment)) {
        return Error(ErrorCode::INVALID_FORMAT, "missing TMD comment signature");
    }
    if (size != TMD_TRAILER_SIZE) {
        return Error(ErrorCode::INVALID_FORMAT,
                     "unexpected TMD comment length: expected " + std::to_string(TMD_TRAILER_SIZE) +
                     " bytes, got " + std::to_string(size));
    }

    ByteReader reader(comment + TMD_TRAILER_SIGNATURE_SIZE, 8);
    uint64_t length = 0;
    reader.read_uint64(&length);
    return length;
}

Result<TmdParts> split_tmd(const uint8_t* data, size_t size) {
    auto eocd = locate_eocd(data, size);
    if (!eocd.ok()) {
        return eocd.error();
    }

    const uint8_t* comment = data + eocd.value().offset + EOCD_MIN_SIZE;
    auto length = decode_trailer(comment, eocd.value().comment_length);
    if (!length.ok()) {
        return length.error();
    }

    // The prefix can never reach into the EOCD record itself
    uint64_t markdown_length = length.value();
    if (markdown_length > eocd.value().offset) {
        return Error(ErrorCode::INVALID_FORMAT,
                     "markdown length " + std::to_string(markdown_length) + " exceeds buffer");
    }

    TmdParts parts;
    parts.markdown = data;
    parts.markdown_size = static_cast<size_t>(markdown_length);
    parts.archive = data + parts.markdown_size;
    parts.archive_size = size - parts.markdown_size;
    return parts;
}

Result<void> patch_comment(Bytes& archive, const Bytes& comment) {
    if (comment.size() > EOCD_MAX_COMMENT) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "comment of " + std::to_string(comment.size()) +
                     " bytes exceeds the ZIP maximum of 65535");
    }

    auto eocd = locate_eocd(archive.data(), archive.size());
    if (!eocd.ok()) {
        return eocd.error();
    }

    size_t offset = eocd.value().offset;
    ByteWriter writer(std::move(archive));
    writer.patch_uint16(offset + EOCD_COMMENT_LENGTH_OFFSET, static_cast<uint16_t>(comment.size()));
    archive = writer.release();
    archive.resize(offset + EOCD_MIN_SIZE);
    archive.insert(archive.end(), comment.begin(), comment.end());
    return Ok();
}

}  // namespace tmd::codec
