#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sealstream/constants.hpp"
#include "sealstream/errors.hpp"
#include "sealstream/password.hpp"
#include "sealstream/random.hpp"

namespace sealstream {

using Bytes = std::vector<std::uint8_t>;

struct InspectResult {
    std::size_t header_len = 0;
    std::size_t salt_len = 0;
    std::size_t key_size = 0;
    std::string iv_base64;
    std::size_t ciphertext_len = 0;
    bool ciphertext_aligned = false;
};

// Password form: int32_le(salt_len) || salt || iv[16] || ciphertext
Bytes EncryptWithPassword(const Bytes& plaintext, const std::string& password, const password::Options& options = {});
Bytes DecryptWithPassword(const Bytes& envelope, const std::string& password, const password::Options& options = {});

// UTF-8 text in, Base64 envelope out, and back.
std::string EncryptTextWithPassword(const std::string& text,
                                    const std::string& password,
                                    const password::Options& options = {});
std::string DecryptTextWithPassword(const std::string& envelope_base64,
                                    const std::string& password,
                                    const password::Options& options = {});

// Keyed form: iv[16] || ciphertext
Bytes EncryptWithKey(const Bytes& plaintext, const Bytes& key, random::RandomSource* rng = nullptr);
Bytes DecryptWithKey(const Bytes& envelope, const Bytes& key);

// Bare ciphertext; the caller keeps the IV.
Bytes Encrypt(const Bytes& plaintext, const Bytes& key, const Bytes& iv, random::RandomSource* rng = nullptr);
Bytes Decrypt(const Bytes& ciphertext, const Bytes& key, const Bytes& iv);

std::uint64_t EncryptFileWithPassword(const std::string& path_in,
                                      const std::string& path_out,
                                      const std::string& password,
                                      const password::Options& options = {});
std::uint64_t DecryptFileWithPassword(const std::string& path_in,
                                      const std::string& path_out,
                                      const std::string& password,
                                      const password::Options& options = {});
std::uint64_t EncryptFileWithKey(const std::string& path_in, const std::string& path_out, const Bytes& key);
std::uint64_t DecryptFileWithKey(const std::string& path_in, const std::string& path_out, const Bytes& key);

InspectResult InspectEnvelope(const Bytes& envelope, password::KeySizeEncoding encoding);
Bytes GenerateKey(std::size_t key_size = constants::kDefaultKeySize, random::RandomSource* rng = nullptr);

// Decimal 16, 24 or 32 with nothing else around it.
std::size_t ParseKeySize(const std::string& text);

Bytes ReadFile(const std::string& path);
std::string ResolvePassword(const std::string& input);

}  // namespace sealstream
