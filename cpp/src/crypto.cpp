#include "sealstream/crypto.hpp"

#include "sealstream/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <limits>

namespace sealstream::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw CryptographicFailure(message);
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw InvalidArgument("RandomBytes request too large");
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    if (iterations == 0 || iterations > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw InvalidArgument("PBKDF2 iteration count out of range");
    }
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                             static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

void Cleanse(Bytes& data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
}

}  // namespace sealstream::crypto
