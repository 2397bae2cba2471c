#include "sealstream/random.hpp"

#include "sealstream/crypto.hpp"

namespace sealstream::random {

Bytes SystemRandom::Generate(std::size_t size) {
    return sealstream::crypto::RandomBytes(size);
}

RandomSource& SystemSource() {
    static SystemRandom source;
    return source;
}

}  // namespace sealstream::random
