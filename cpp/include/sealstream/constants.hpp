#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "sealstream/env.hpp"

namespace sealstream::constants {

inline constexpr std::size_t kBlockSize = 16;
inline constexpr std::size_t kIvLen = 16;
inline constexpr std::size_t kDefaultKeySize = 32;
inline constexpr std::size_t kSaltLenPrefix = 4;
inline constexpr std::size_t kKeySizeFieldLen = 1;
inline constexpr std::size_t kMaxSaltLen = 1024;

inline constexpr std::uint32_t kPbkdf2Iterations = 25000;

inline constexpr std::string_view kEncryptedExt = ".sse";
inline constexpr std::string_view kVersion = "1.0.0";

inline constexpr bool IsValidKeySize(std::size_t size) {
    return size == 16 || size == 24 || size == 32;
}

// SEALSTREAM_PBKDF2_ITERS, then SEALSTREAM_TEST_KDF_ITERS, then the default.
inline std::uint32_t Pbkdf2Iterations() {
    return sealstream::env::PositiveUint32({"SEALSTREAM_PBKDF2_ITERS", "SEALSTREAM_TEST_KDF_ITERS"})
        .value_or(kPbkdf2Iterations);
}

}  // namespace sealstream::constants
