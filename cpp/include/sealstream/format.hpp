#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace sealstream::format {

using Bytes = std::vector<std::uint8_t>;

void PutI32Le(Bytes& out, std::int32_t value);
std::int32_t GetI32Le(const std::uint8_t* ptr);

// Reads up to len bytes, stopping early only at end of stream.
std::size_t ReadUpTo(std::istream& source, std::uint8_t* out, std::size_t len);

// Throws MalformedEnvelope naming the missing field on a short read.
void ReadExact(std::istream& source, std::uint8_t* out, std::size_t len, std::string_view field);
Bytes ReadExact(std::istream& source, std::size_t len, std::string_view field);

void WriteBytes(std::ostream& dest, const std::uint8_t* data, std::size_t len);
void WriteBytes(std::ostream& dest, const Bytes& data);

}  // namespace sealstream::format
