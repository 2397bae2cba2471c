#include "sealstream/format.hpp"

#include "sealstream/errors.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace sealstream::format {

void PutI32Le(Bytes& out, std::int32_t value) {
    std::uint32_t bits = static_cast<std::uint32_t>(value);
    out.push_back(static_cast<std::uint8_t>(bits & 0xFF));
    out.push_back(static_cast<std::uint8_t>((bits >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((bits >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((bits >> 24) & 0xFF));
}

std::int32_t GetI32Le(const std::uint8_t* ptr) {
    std::uint32_t bits = static_cast<std::uint32_t>(ptr[0])
                         | (static_cast<std::uint32_t>(ptr[1]) << 8)
                         | (static_cast<std::uint32_t>(ptr[2]) << 16)
                         | (static_cast<std::uint32_t>(ptr[3]) << 24);
    return static_cast<std::int32_t>(bits);
}

std::size_t ReadUpTo(std::istream& source, std::uint8_t* out, std::size_t len) {
    std::size_t total = 0;
    while (total < len && source) {
        source.read(reinterpret_cast<char*>(out + total), static_cast<std::streamsize>(len - total));
        std::streamsize got = source.gcount();
        if (got <= 0) {
            break;
        }
        total += static_cast<std::size_t>(got);
    }
    if (source.bad()) {
        throw std::runtime_error("Failed to read input stream");
    }
    return total;
}

void ReadExact(std::istream& source, std::uint8_t* out, std::size_t len, std::string_view field) {
    std::size_t got = ReadUpTo(source, out, len);
    if (got != len) {
        throw MalformedEnvelope("Envelope truncated: expected " + std::to_string(len) + " bytes of "
                                + std::string(field) + ", got " + std::to_string(got));
    }
}

Bytes ReadExact(std::istream& source, std::size_t len, std::string_view field) {
    Bytes out(len);
    if (len > 0) {
        ReadExact(source, out.data(), len, field);
    }
    return out;
}

void WriteBytes(std::ostream& dest, const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    dest.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!dest) {
        throw std::runtime_error("Failed to write output stream");
    }
}

void WriteBytes(std::ostream& dest, const Bytes& data) {
    WriteBytes(dest, data.data(), data.size());
}

}  // namespace sealstream::format
