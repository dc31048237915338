#pragma once

#include <tmd/result.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tmd {

/**
 * 128-bit identifier in RFC 4122 layout, printed in the canonical
 * 8-4-4-4-12 lowercase form.
 */
class Uuid {
public:
    Uuid() : bytes_{} {}
    explicit Uuid(const std::array<uint8_t, 16>& bytes) : bytes_(bytes) {}

    /**
     * Random (version 4) identifier from OpenSSL's CSPRNG.
     */
    static Result<Uuid> generate_v4();

    /**
     * Parse the canonical hyphenated form (case-insensitive).
     */
    static std::optional<Uuid> parse(const std::string& text);

    std::string to_string() const;

    bool is_nil() const;
    int version() const { return bytes_[6] >> 4; }
    const std::array<uint8_t, 16>& bytes() const { return bytes_; }

    bool operator==(const Uuid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Uuid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Uuid& other) const { return bytes_ < other.bytes_; }

private:
    std::array<uint8_t, 16> bytes_;
};

}  // namespace tmd

namespace std {

template<>
struct hash<tmd::Uuid> {
    size_t operator()(const tmd::Uuid& id) const noexcept {
        // FNV-1a over the raw bytes
        size_t h = 1469598103934665603ull;
        for (uint8_t b : id.bytes()) {
            h ^= b;
            h *= 1099511628211ull;
        }
        return h;
    }
};

}  // namespace std
