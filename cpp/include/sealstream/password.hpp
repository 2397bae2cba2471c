#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "sealstream/constants.hpp"
#include "sealstream/kdf.hpp"
#include "sealstream/random.hpp"

namespace sealstream::password {

using Bytes = std::vector<std::uint8_t>;

// kSaltLength:    int32_le(salt_len) || salt || iv[16] || ciphertext
//                 (key size recovered from salt_len)
// kExplicitField: int32_le(salt_len) || salt || key_size[1] || iv[16] || ciphertext
enum class KeySizeEncoding { kSaltLength, kExplicitField };

struct Options {
    std::size_t key_size = constants::kDefaultKeySize;
    KeySizeEncoding encoding = KeySizeEncoding::kSaltLength;
    // 0 selects constants::Pbkdf2Iterations(); ignored when kdf is set.
    std::uint32_t pbkdf2_iterations = 0;
    random::RandomSource* rng = nullptr;
    const kdf::KeyDeriver* kdf = nullptr;
};

struct Header {
    Bytes salt;
    std::size_t key_size = 0;
    std::size_t length = 0;
};

Header ReadHeader(std::istream& source, KeySizeEncoding encoding);
std::uint64_t WriteHeader(std::ostream& dest, const Bytes& salt, std::size_t key_size, KeySizeEncoding encoding);

std::uint64_t EncryptWithPassword(std::istream& source,
                                  const std::string& password,
                                  std::ostream& dest,
                                  const Options& options = {});

std::uint64_t DecryptWithPassword(std::istream& source,
                                  const std::string& password,
                                  std::ostream& dest,
                                  const Options& options = {});

}  // namespace sealstream::password
