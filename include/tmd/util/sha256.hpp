#pragma once

#include <tmd/core_types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace tmd {

/**
 * SHA-256 through OpenSSL's EVP interface.
 *
 * Throws std::runtime_error only if libcrypto itself fails (allocation
 * failure inside EVP_MD_CTX_new), which callers treat as fatal.
 */
class SHA256 {
public:
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    void update(const uint8_t* data, size_t len);
    Sha256Digest finish();

    static Sha256Digest digest(const uint8_t* data, size_t len);
    static Sha256Digest digest(const Bytes& data) { return digest(data.data(), data.size()); }
    static Sha256Digest digest(const std::string& data);

private:
    void* ctx_;  // EVP_MD_CTX*
    bool finished_ = false;
};

}  // namespace tmd
