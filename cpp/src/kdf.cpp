#include "sealstream/kdf.hpp"

#include "sealstream/constants.hpp"
#include "sealstream/crypto.hpp"
#include "sealstream/errors.hpp"

#include <string>

namespace sealstream::kdf {

namespace {

void CheckKeySize(std::size_t key_size) {
    if (!sealstream::constants::IsValidKeySize(key_size)) {
        throw InvalidArgument("key size must be 16, 24 or 32 bytes, got " + std::to_string(key_size));
    }
}

}  // namespace

Pbkdf2KeyDeriver::Pbkdf2KeyDeriver()
    : Pbkdf2KeyDeriver(sealstream::constants::Pbkdf2Iterations()) {}

Pbkdf2KeyDeriver::Pbkdf2KeyDeriver(std::uint32_t iterations, random::RandomSource& rng)
    : iterations_(iterations), rng_(&rng) {
    if (iterations_ == 0) {
        throw InvalidArgument("PBKDF2 iteration count must be positive");
    }
}

DerivedKey Pbkdf2KeyDeriver::Derive(const std::string& password, std::size_t key_size) const {
    CheckKeySize(key_size);
    DerivedKey out;
    out.salt = rng_->Generate(key_size);
    if (out.salt.size() != key_size) {
        throw CryptographicFailure("random source returned a short salt");
    }
    out.key = sealstream::crypto::Pbkdf2HmacSha256(password, out.salt, iterations_, key_size);
    return out;
}

Bytes Pbkdf2KeyDeriver::DeriveWithSalt(const std::string& password, const Bytes& salt, std::size_t key_size) const {
    CheckKeySize(key_size);
    if (salt.empty()) {
        throw InvalidArgument("salt must not be empty");
    }
    return sealstream::crypto::Pbkdf2HmacSha256(password, salt, iterations_, key_size);
}

}  // namespace sealstream::kdf
