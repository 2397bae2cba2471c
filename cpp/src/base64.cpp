#include "sealstream/base64.hpp"

#include <array>
#include <cctype>

namespace sealstream::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

std::string Encode(const std::uint8_t* data, std::size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 2 < len; i += 3) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(kEncTable[(triple >> 6) & 0x3F]);
        out.push_back(kEncTable[triple & 0x3F]);
    }
    std::size_t rest = len - i;
    if (rest == 0) {
        return out;
    }
    std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
    if (rest == 2) {
        triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
    }
    out.push_back(kEncTable[(triple >> 18) & 0x3F]);
    out.push_back(kEncTable[(triple >> 12) & 0x3F]);
    out.push_back(rest == 2 ? kEncTable[(triple >> 6) & 0x3F] : '=');
    out.push_back('=');
    return out;
}

std::string Encode(const std::vector<std::uint8_t>& data) {
    return Encode(data.data(), data.size());
}

std::vector<std::uint8_t> Decode(std::string_view input, bool* ok) {
    bool success = true;
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 4) * 3);

    std::uint32_t acc = 0;
    int bits = 0;
    std::size_t symbols = 0;
    std::size_t padding = 0;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        std::uint8_t decoded = kDecTable[c];
        if (decoded == 0xFF || padding > 0) {
            success = false;
            break;
        }
        ++symbols;
        acc = (acc << 6) | decoded;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    if (success) {
        std::size_t tail = symbols % 4;
        if (tail == 1 || padding > 2 || (padding > 0 && (symbols + padding) % 4 != 0)) {
            success = false;
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace sealstream::base64
