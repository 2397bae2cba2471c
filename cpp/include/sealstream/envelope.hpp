#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

#include "sealstream/random.hpp"

namespace sealstream::envelope {

using Bytes = std::vector<std::uint8_t>;

// Keyed envelope: iv[16] || ciphertext. A fresh IV is drawn on every call.
std::uint64_t EncryptAndEmbedIv(std::istream& source,
                                const Bytes& key,
                                std::ostream& dest,
                                random::RandomSource& rng = random::SystemSource());

std::uint64_t DecryptWithEmbeddedIv(std::istream& source,
                                    const Bytes& key,
                                    std::ostream& dest);

}  // namespace sealstream::envelope
