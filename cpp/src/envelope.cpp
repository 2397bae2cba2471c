#include "sealstream/envelope.hpp"

#include "sealstream/cipher.hpp"
#include "sealstream/constants.hpp"
#include "sealstream/errors.hpp"
#include "sealstream/format.hpp"

#include <istream>
#include <ostream>

namespace sealstream::envelope {

std::uint64_t EncryptAndEmbedIv(std::istream& source,
                                const Bytes& key,
                                std::ostream& dest,
                                random::RandomSource& rng) {
    sealstream::cipher::ValidateKey(key);
    Bytes iv = rng.Generate(sealstream::constants::kIvLen);
    if (iv.size() != sealstream::constants::kIvLen) {
        throw CryptographicFailure("random source returned a short IV");
    }
    sealstream::format::WriteBytes(dest, iv);
    return static_cast<std::uint64_t>(iv.size()) + sealstream::cipher::Encrypt(source, key, iv, dest, rng);
}

std::uint64_t DecryptWithEmbeddedIv(std::istream& source,
                                    const Bytes& key,
                                    std::ostream& dest) {
    sealstream::cipher::ValidateKey(key);
    Bytes iv = sealstream::format::ReadExact(source, sealstream::constants::kIvLen, "IV");
    return sealstream::cipher::Decrypt(source, key, iv, dest);
}

}  // namespace sealstream::envelope
