#pragma once

#include <tmd/core_types.hpp>

#include <cstdint>
#include <string>

namespace tmd {

/**
 * ByteWriter - Little-endian binary serialization into a Bytes buffer.
 *
 * Multi-byte integers are always emitted least significant byte first,
 * independent of host byte order, as the ZIP format requires.
 */
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(Bytes initial) : buffer_(std::move(initial)) {}

    void reserve(size_t size) { buffer_.reserve(size); }

    void write_uint16(uint16_t v) {
        buffer_.push_back(static_cast<uint8_t>(v & 0xFF));
        buffer_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }

    void write_uint32(uint32_t v) {
        for (int shift = 0; shift < 32; shift += 8) {
            buffer_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void write_uint64(uint64_t v) {
        for (int shift = 0; shift < 64; shift += 8) {
            buffer_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    // Raw string bytes, no length prefix
    void write_string(const std::string& s) {
        write_raw(s.data(), s.size());
    }

    void write_raw(const void* data, size_t size) {
        const auto* p = static_cast<const uint8_t*>(data);
        buffer_.insert(buffer_.end(), p, p + size);
    }

    // Overwrite an already written uint16 at the given offset
    bool patch_uint16(size_t offset, uint16_t v) {
        if (offset > buffer_.size() || buffer_.size() - offset < 2) return false;
        buffer_[offset] = static_cast<uint8_t>(v & 0xFF);
        buffer_[offset + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
        return true;
    }

    const Bytes& data() const { return buffer_; }
    Bytes release() { return std::move(buffer_); }

    size_t size() const { return buffer_.size(); }

private:
    Bytes buffer_;
};

/**
 * ByteReader - Bounds-checked little-endian reads over a borrowed buffer.
 *
 * Every read returns false instead of touching memory past the end, so
 * callers can treat all length fields as untrusted.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size)
        : data_(data), size_(size), pos_(0) {}

    explicit ByteReader(const Bytes& data)
        : ByteReader(data.data(), data.size()) {}

    bool has_remaining(size_t n) const { return size_ - pos_ >= n; }
    size_t remaining() const { return size_ - pos_; }
    size_t position() const { return pos_; }

    bool seek(size_t offset) {
        if (offset > size_) return false;
        pos_ = offset;
        return true;
    }

    bool skip(size_t n) {
        if (!has_remaining(n)) return false;
        pos_ += n;
        return true;
    }

    bool read_uint16(uint16_t* v) {
        if (!has_remaining(2)) return false;
        *v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return true;
    }

    bool read_uint32(uint32_t* v) {
        if (!has_remaining(4)) return false;
        uint32_t out = 0;
        for (int i = 3; i >= 0; --i) {
            out = (out << 8) | data_[pos_ + static_cast<size_t>(i)];
        }
        *v = out;
        pos_ += 4;
        return true;
    }

    bool read_uint64(uint64_t* v) {
        if (!has_remaining(8)) return false;
        uint64_t out = 0;
        for (int i = 7; i >= 0; --i) {
            out = (out << 8) | data_[pos_ + static_cast<size_t>(i)];
        }
        *v = out;
        pos_ += 8;
        return true;
    }

    // Read exactly len bytes as a string
    bool read_string(size_t len, std::string* s) {
        if (!has_remaining(len)) return false;
        s->assign(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return true;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
};

}  // namespace tmd
