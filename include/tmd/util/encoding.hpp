#pragma once

#include <tmd/core_types.hpp>

#include <optional>
#include <string>

namespace tmd {

// Lowercase hexadecimal encoding
std::string hex_encode(const uint8_t* data, size_t len);

inline std::string hex_encode(const Sha256Digest& digest) {
    return hex_encode(digest.data(), digest.size());
}

// Accepts upper or lower case; nullopt on odd length or non-hex characters
std::optional<Bytes> hex_decode(const std::string& hex);

std::optional<Sha256Digest> parse_sha256_hex(const std::string& hex);

// Strict UTF-8 check (rejects overlong forms, surrogates and values above U+10FFFF)
bool is_valid_utf8(const uint8_t* data, size_t len);

inline bool is_valid_utf8(const std::string& s) {
    return is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

}  // namespace tmd
