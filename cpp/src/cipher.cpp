#include "sealstream/cipher.hpp"

#include "sealstream/constants.hpp"
#include "sealstream/errors.hpp"
#include "sealstream/format.hpp"

#include <openssl/evp.h>

#include <array>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace sealstream::cipher {

namespace {

using sealstream::constants::kBlockSize;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw CryptographicFailure(message);
    }
}

const EVP_CIPHER* AesCbc(std::size_t key_size) {
    switch (key_size) {
        case 16:
            return EVP_aes_128_cbc();
        case 24:
            return EVP_aes_192_cbc();
        case 32:
            return EVP_aes_256_cbc();
        default:
            throw InvalidArgument("Unsupported AES key size: " + std::to_string(key_size));
    }
}

std::uint64_t Run(BlockTransform& transform, std::istream& source, std::ostream& dest) {
    std::uint64_t written = 0;
    std::array<std::uint8_t, kBlockSize> buffer{};
    while (source) {
        source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = source.gcount();
        if (got <= 0) {
            break;
        }
        Bytes out = transform.Update(buffer.data(), static_cast<std::size_t>(got));
        if (!out.empty()) {
            sealstream::format::WriteBytes(dest, out);
            dest.flush();
            written += static_cast<std::uint64_t>(out.size());
        }
    }
    if (source.bad()) {
        throw std::runtime_error("Failed to read input stream");
    }

    Bytes last = transform.Finalize();
    sealstream::format::WriteBytes(dest, last);
    dest.flush();
    if (!dest) {
        throw std::runtime_error("Failed to flush output stream");
    }
    written += static_cast<std::uint64_t>(last.size());
    return written;
}

}  // namespace

void ValidateKey(const Bytes& key) {
    if (!sealstream::constants::IsValidKeySize(key.size())) {
        throw InvalidArgument("key must be 16, 24 or 32 bytes in length, got " + std::to_string(key.size()));
    }
}

void ValidateIv(const Bytes& iv) {
    if (iv.size() != sealstream::constants::kIvLen) {
        throw InvalidArgument("iv must be 16 bytes in length, got " + std::to_string(iv.size()));
    }
}

BlockTransform::BlockTransform(Direction direction,
                               const Bytes& key,
                               const Bytes& iv,
                               random::RandomSource& rng)
    : direction_(direction), rng_(&rng) {
    ValidateIv(iv);
    ValidateKey(key);
    ctx_.reset(EVP_CIPHER_CTX_new());
    if (!ctx_) {
        throw CryptographicFailure("AES-CBC context allocation failed");
    }
    int enc = direction_ == Direction::kEncrypt ? 1 : 0;
    Ensure(EVP_CipherInit_ex(ctx_.get(), AesCbc(key.size()), nullptr, key.data(), iv.data(), enc) == 1,
           "AES-CBC init failed");
    Ensure(EVP_CIPHER_CTX_set_padding(ctx_.get(), 0) == 1, "AES-CBC disable padding failed");
}

Bytes BlockTransform::Update(const Bytes& chunk) {
    return Update(chunk.data(), chunk.size());
}

Bytes BlockTransform::Update(const std::uint8_t* data, std::size_t len) {
    if (finalized_) {
        throw std::logic_error("BlockTransform::Update called after Finalize");
    }
    if (len == 0) {
        return {};
    }
    if (len > static_cast<std::size_t>(std::numeric_limits<int>::max()) - kBlockSize) {
        throw InvalidArgument("BlockTransform chunk too large");
    }
    Bytes out(len + kBlockSize);
    int out_len = 0;
    Ensure(EVP_CipherUpdate(ctx_.get(), out.data(), &out_len, data, static_cast<int>(len)) == 1,
           "AES-CBC update failed");
    out.resize(static_cast<std::size_t>(out_len));
    partial_ = (partial_ + len) % kBlockSize;

    if (direction_ == Direction::kEncrypt || out.empty()) {
        return out;
    }
    Bytes ready;
    ready.reserve(held_.size() + out.size());
    crypto::detail::AppendBytes(ready, held_);
    crypto::detail::AppendBytes(ready, out);
    held_.assign(ready.end() - static_cast<std::ptrdiff_t>(kBlockSize), ready.end());
    ready.resize(ready.size() - kBlockSize);
    return ready;
}

Bytes BlockTransform::Finalize() {
    if (finalized_) {
        throw std::logic_error("BlockTransform::Finalize called twice");
    }
    finalized_ = true;
    Bytes out = direction_ == Direction::kEncrypt ? FinalizeEncrypt() : FinalizeDecrypt();
    ctx_.reset();
    return out;
}

Bytes BlockTransform::FinalizeEncrypt() {
    std::size_t pad_len = kBlockSize - partial_;
    Bytes pad = rng_->Generate(pad_len - 1);
    if (pad.size() != pad_len - 1) {
        throw CryptographicFailure("random source returned short padding");
    }
    pad.push_back(static_cast<std::uint8_t>(pad_len));

    Bytes out(pad.size() + 2 * kBlockSize);
    int out_len = 0;
    int total_len = 0;
    Ensure(EVP_CipherUpdate(ctx_.get(), out.data(), &out_len, pad.data(), static_cast<int>(pad.size())) == 1,
           "AES-CBC update failed");
    total_len += out_len;
    Ensure(EVP_CipherFinal_ex(ctx_.get(), out.data() + total_len, &out_len) == 1, "AES-CBC final failed");
    total_len += out_len;
    out.resize(static_cast<std::size_t>(total_len));
    partial_ = 0;
    return out;
}

Bytes BlockTransform::FinalizeDecrypt() {
    if (partial_ != 0) {
        throw CryptographicFailure("ciphertext length is not a multiple of the block size");
    }
    std::array<std::uint8_t, kBlockSize> tail{};
    int tail_len = 0;
    Ensure(EVP_CipherFinal_ex(ctx_.get(), tail.data(), &tail_len) == 1 && tail_len == 0,
           "AES-CBC final failed");
    if (held_.size() != kBlockSize) {
        throw CryptographicFailure("ciphertext is empty");
    }
    std::uint8_t pad_len = held_.back();
    if (pad_len == 0 || pad_len > kBlockSize) {
        throw CryptographicFailure("invalid padding");
    }
    Bytes out(held_.begin(), held_.end() - pad_len);
    crypto::Cleanse(held_);
    held_.clear();
    return out;
}

std::uint64_t Encrypt(std::istream& source,
                      const Bytes& key,
                      const Bytes& iv,
                      std::ostream& dest,
                      random::RandomSource& rng) {
    BlockTransform transform(Direction::kEncrypt, key, iv, rng);
    return Run(transform, source, dest);
}

std::uint64_t Decrypt(std::istream& source,
                      const Bytes& key,
                      const Bytes& iv,
                      std::ostream& dest) {
    BlockTransform transform(Direction::kDecrypt, key, iv);
    return Run(transform, source, dest);
}

}  // namespace sealstream::cipher
