#include <tmd/util/sha256.hpp>

// OpenSSL 3.x deprecates the low-level SHA256_* functions; EVP is the supported path.
#include <openssl/evp.h>

#include <stdexcept>

namespace tmd {

namespace {

EVP_MD_CTX* as_ctx(void* p) {
    return static_cast<EVP_MD_CTX*>(p);
}

}  // namespace

SHA256::SHA256()
    : ctx_(EVP_MD_CTX_new())
{
    if (!ctx_) {
        throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(as_ctx(ctx_));
        throw std::runtime_error("OpenSSL: EVP_DigestInit_ex failed");
    }
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(as_ctx(ctx_));
}

void SHA256::update(const uint8_t* data, size_t len) {
    if (finished_) {
        throw std::logic_error("SHA256::update called after finish");
    }
    if (len == 0) return;
    if (EVP_DigestUpdate(as_ctx(ctx_), data, len) != 1) {
        throw std::runtime_error("OpenSSL: EVP_DigestUpdate failed");
    }
}

Sha256Digest SHA256::finish() {
    if (finished_) {
        throw std::logic_error("SHA256::finish called twice");
    }
    Sha256Digest out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(as_ctx(ctx_), out.data(), &out_len) != 1) {
        throw std::runtime_error("OpenSSL: EVP_DigestFinal_ex failed");
    }
    if (out_len != out.size()) {
        throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");
    }
    finished_ = true;
    return out;
}

Sha256Digest SHA256::digest(const uint8_t* data, size_t len) {
    SHA256 hasher;
    hasher.update(data, len);
    return hasher.finish();
}

Sha256Digest SHA256::digest(const std::string& data) {
    return digest(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

}  // namespace tmd
