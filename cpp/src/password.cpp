#include "sealstream/password.hpp"

#include "sealstream/cipher.hpp"
#include "sealstream/crypto_utils.hpp"
#include "sealstream/envelope.hpp"
#include "sealstream/errors.hpp"
#include "sealstream/format.hpp"

#include <array>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace sealstream::password {

namespace {

using sealstream::constants::IsValidKeySize;

random::RandomSource& ResolveRandom(const Options& options) {
    return options.rng ? *options.rng : random::SystemSource();
}

const kdf::KeyDeriver& ResolveKdf(const Options& options,
                                  random::RandomSource& rng,
                                  std::optional<kdf::Pbkdf2KeyDeriver>& local) {
    if (options.kdf) {
        return *options.kdf;
    }
    std::uint32_t iters = options.pbkdf2_iterations > 0 ? options.pbkdf2_iterations
                                                        : sealstream::constants::Pbkdf2Iterations();
    local.emplace(iters, rng);
    return *local;
}

}  // namespace

Header ReadHeader(std::istream& source, KeySizeEncoding encoding) {
    Header header;
    std::array<std::uint8_t, sealstream::constants::kSaltLenPrefix> prefix{};
    sealstream::format::ReadExact(source, prefix.data(), prefix.size(), "salt length");
    std::int32_t salt_len = sealstream::format::GetI32Le(prefix.data());
    if (salt_len <= 0 || static_cast<std::size_t>(salt_len) > sealstream::constants::kMaxSaltLen) {
        throw MalformedEnvelope("Invalid salt length: " + std::to_string(salt_len));
    }
    header.salt = sealstream::format::ReadExact(source, static_cast<std::size_t>(salt_len), "salt");
    header.length = prefix.size() + header.salt.size();

    if (encoding == KeySizeEncoding::kSaltLength) {
        header.key_size = header.salt.size();
        if (!IsValidKeySize(header.key_size)) {
            throw MalformedEnvelope("Salt length " + std::to_string(salt_len)
                                    + " does not name a supported key size");
        }
        return header;
    }

    std::uint8_t key_size = 0;
    sealstream::format::ReadExact(source, &key_size, sealstream::constants::kKeySizeFieldLen, "key size");
    header.length += sealstream::constants::kKeySizeFieldLen;
    if (!IsValidKeySize(key_size)) {
        throw MalformedEnvelope("Unsupported key size field: " + std::to_string(key_size));
    }
    header.key_size = key_size;
    return header;
}

std::uint64_t WriteHeader(std::ostream& dest, const Bytes& salt, std::size_t key_size, KeySizeEncoding encoding) {
    if (!IsValidKeySize(key_size)) {
        throw InvalidArgument("keySize must be 16, 24 or 32 bytes");
    }
    if (salt.empty() || salt.size() > sealstream::constants::kMaxSaltLen) {
        throw InvalidArgument("salt length out of range: " + std::to_string(salt.size()));
    }
    if (encoding == KeySizeEncoding::kSaltLength && salt.size() != key_size) {
        throw InvalidArgument("salt length must equal key size when the envelope infers key size from it");
    }
    Bytes header;
    header.reserve(sealstream::constants::kSaltLenPrefix + salt.size() + sealstream::constants::kKeySizeFieldLen);
    sealstream::format::PutI32Le(header, static_cast<std::int32_t>(salt.size()));
    crypto::detail::AppendBytes(header, salt);
    if (encoding == KeySizeEncoding::kExplicitField) {
        header.push_back(static_cast<std::uint8_t>(key_size));
    }
    sealstream::format::WriteBytes(dest, header);
    return static_cast<std::uint64_t>(header.size());
}

std::uint64_t EncryptWithPassword(std::istream& source,
                                  const std::string& password,
                                  std::ostream& dest,
                                  const Options& options) {
    if (!IsValidKeySize(options.key_size)) {
        throw InvalidArgument("keySize must be 16, 24 or 32 bytes");
    }
    random::RandomSource& rng = ResolveRandom(options);
    std::optional<kdf::Pbkdf2KeyDeriver> local;
    const kdf::KeyDeriver& deriver = ResolveKdf(options, rng, local);

    kdf::DerivedKey derived = deriver.Derive(password, options.key_size);
    crypto::detail::ScopedCleanse wipe(derived.key);
    if (derived.key.size() != options.key_size) {
        throw CryptographicFailure("key derivation returned " + std::to_string(derived.key.size())
                                   + " bytes, expected " + std::to_string(options.key_size));
    }

    std::uint64_t written = WriteHeader(dest, derived.salt, options.key_size, options.encoding);
    return written + sealstream::envelope::EncryptAndEmbedIv(source, derived.key, dest, rng);
}

std::uint64_t DecryptWithPassword(std::istream& source,
                                  const std::string& password,
                                  std::ostream& dest,
                                  const Options& options) {
    Header header = ReadHeader(source, options.encoding);
    // Whole header, IV included, is read before any key derivation.
    Bytes iv = sealstream::format::ReadExact(source, sealstream::constants::kIvLen, "IV");
    std::optional<kdf::Pbkdf2KeyDeriver> local;
    const kdf::KeyDeriver& deriver = ResolveKdf(options, ResolveRandom(options), local);

    Bytes key = deriver.DeriveWithSalt(password, header.salt, header.key_size);
    crypto::detail::ScopedCleanse wipe(key);
    return sealstream::cipher::Decrypt(source, key, iv, dest);
}

}  // namespace sealstream::password
