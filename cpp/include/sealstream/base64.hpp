#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sealstream::base64 {

std::string Encode(const std::uint8_t* data, std::size_t len);
std::string Encode(const std::vector<std::uint8_t>& data);

// Standard alphabet, '=' padding. Whitespace is skipped; anything else
// outside the alphabet, or data after padding, clears *ok.
std::vector<std::uint8_t> Decode(std::string_view input, bool* ok = nullptr);

}  // namespace sealstream::base64
