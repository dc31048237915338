#include <tmd/util/uuid.hpp>
#include <tmd/util/encoding.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>

namespace tmd {

Result<Uuid> Uuid::generate_v4() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        unsigned long code = ERR_get_error();
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        return Error(ErrorCode::INTERNAL_ERROR,
                     std::string("RAND_bytes failed: ") + buf);
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(const std::string& text) {
    if (text.size() != 36) return std::nullopt;
    if (text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        return std::nullopt;
    }

    std::string hex;
    hex.reserve(32);
    for (char c : text) {
        if (c != '-') hex.push_back(c);
    }
    if (hex.size() != 32) return std::nullopt;

    auto decoded = hex_decode(hex);
    if (!decoded) return std::nullopt;

    std::array<uint8_t, 16> bytes{};
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::string hex = hex_encode(bytes_.data(), bytes_.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool Uuid::is_nil() const {
    for (uint8_t b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

}  // namespace tmd
