#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

#include "sealstream/crypto_utils.hpp"
#include "sealstream/random.hpp"

namespace sealstream::cipher {

using Bytes = std::vector<std::uint8_t>;

enum class Direction { kEncrypt, kDecrypt };

void ValidateKey(const Bytes& key);
void ValidateIv(const Bytes& iv);

// AES-CBC with ISO 10126 padding (random fill, last byte holds the pad
// length). Update never buffers more than one block of output; the decrypt
// side keeps the newest plaintext block back until Finalize strips its pad.
class BlockTransform {
public:
    BlockTransform(Direction direction,
                   const Bytes& key,
                   const Bytes& iv,
                   random::RandomSource& rng = random::SystemSource());

    Bytes Update(const std::uint8_t* data, std::size_t len);
    Bytes Update(const Bytes& chunk);
    Bytes Finalize();

    Direction direction() const noexcept { return direction_; }

private:
    Bytes FinalizeEncrypt();
    Bytes FinalizeDecrypt();

    Direction direction_;
    random::RandomSource* rng_;
    crypto::detail::UniqueCipherCtx ctx_;
    std::size_t partial_ = 0;
    Bytes held_;
    bool finalized_ = false;
};

// Reads source in block-sized chunks and flushes each transformed chunk to
// dest as soon as it exists. Returns the number of bytes written.
std::uint64_t Encrypt(std::istream& source,
                      const Bytes& key,
                      const Bytes& iv,
                      std::ostream& dest,
                      random::RandomSource& rng = random::SystemSource());

std::uint64_t Decrypt(std::istream& source,
                      const Bytes& key,
                      const Bytes& iv,
                      std::ostream& dest);

}  // namespace sealstream::cipher
