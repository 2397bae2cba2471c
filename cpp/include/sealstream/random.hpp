#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sealstream::random {

using Bytes = std::vector<std::uint8_t>;

// Source of IV, salt and padding bytes. Implementations used from several
// threads at once must be safe for that themselves.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual Bytes Generate(std::size_t size) = 0;
};

// OpenSSL RAND_bytes; holds no state of its own.
class SystemRandom final : public RandomSource {
public:
    Bytes Generate(std::size_t size) override;
};

RandomSource& SystemSource();

}  // namespace sealstream::random
