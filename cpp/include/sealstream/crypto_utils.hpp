#pragma once

#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "sealstream/crypto.hpp"

namespace sealstream::crypto::detail {

// RAII wrapper for the OpenSSL cipher context; EVP_CIPHER_CTX_free also wipes the key schedule
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;

// Wipes a key buffer when it goes out of scope
class ScopedCleanse {
public:
    explicit ScopedCleanse(Bytes& data) noexcept : data_(data) {}
    ~ScopedCleanse() { Cleanse(data_); }

    ScopedCleanse(const ScopedCleanse&) = delete;
    ScopedCleanse& operator=(const ScopedCleanse&) = delete;

private:
    Bytes& data_;
};

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::uint8_t* src, std::size_t len) {
    if (len == 0) return;
    dest.insert(dest.end(), src, src + len);
}

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::vector<std::uint8_t>& src) {
    if (src.empty()) return;
    AppendBytes(dest, src.data(), src.size());
}

}  // namespace sealstream::crypto::detail
