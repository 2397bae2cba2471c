#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sealstream/random.hpp"

namespace sealstream::kdf {

using Bytes = std::vector<std::uint8_t>;

struct DerivedKey {
    Bytes key;
    Bytes salt;
};

class KeyDeriver {
public:
    virtual ~KeyDeriver() = default;

    // Fresh salt, key of key_size bytes.
    virtual DerivedKey Derive(const std::string& password, std::size_t key_size) const = 0;
    virtual Bytes DeriveWithSalt(const std::string& password, const Bytes& salt, std::size_t key_size) const = 0;
};

// PBKDF2-HMAC-SHA256. The salt is as long as the requested key, which is what
// lets the default password envelope recover the key size from the salt.
class Pbkdf2KeyDeriver final : public KeyDeriver {
public:
    Pbkdf2KeyDeriver();
    explicit Pbkdf2KeyDeriver(std::uint32_t iterations,
                              random::RandomSource& rng = random::SystemSource());

    DerivedKey Derive(const std::string& password, std::size_t key_size) const override;
    Bytes DeriveWithSalt(const std::string& password, const Bytes& salt, std::size_t key_size) const override;

    std::uint32_t iterations() const noexcept { return iterations_; }

private:
    std::uint32_t iterations_;
    random::RandomSource* rng_;
};

}  // namespace sealstream::kdf
