#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sealstream::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);
void Cleanse(Bytes& data) noexcept;

}  // namespace sealstream::crypto
