#include "sealstream/sealstream.hpp"

#include "sealstream/base64.hpp"
#include "sealstream/cipher.hpp"
#include "sealstream/envelope.hpp"
#include "sealstream/env.hpp"
#include "sealstream/format.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace sealstream {

namespace {

// Runs a stream operation over an in-memory copy of data and returns
// everything it wrote.
template <typename Action>
Bytes HandleByteToStream(const Bytes& data, Action&& action) {
    std::istringstream input(std::string(data.begin(), data.end()), std::ios::binary);
    std::ostringstream output(std::ios::binary);
    action(input, output);
    std::string result = output.str();
    return Bytes(result.begin(), result.end());
}

random::RandomSource& OrSystem(random::RandomSource* rng) {
    return rng ? *rng : random::SystemSource();
}

std::ifstream OpenInput(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return input;
}

std::ofstream OpenOutput(const std::string& path) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    return output;
}

void CheckDistinct(const std::string& path_in, const std::string& path_out) {
    std::error_code ec;
    if (path_in == path_out || std::filesystem::equivalent(path_in, path_out, ec)) {
        throw InvalidArgument("Input and output paths must differ: " + path_in);
    }
}

// Sibling of path_out that the operation writes into before the rename.
std::filesystem::path TempOutputPath(const std::string& path_out) {
    static const char kHex[] = "0123456789abcdef";
    std::string token;
    for (std::uint8_t b : random::SystemSource().Generate(4)) {
        token.push_back(kHex[b >> 4]);
        token.push_back(kHex[b & 0x0F]);
    }
    std::filesystem::path temp(path_out);
    temp += "." + token + "._tmp";
    return temp;
}

// path_out is only replaced once the operation has succeeded; a failure
// leaves whatever was there before and removes the temp file.
template <typename Action>
std::uint64_t StreamFile(const std::string& path_in, const std::string& path_out, Action&& action) {
    CheckDistinct(path_in, path_out);
    std::ifstream input = OpenInput(path_in);
    std::filesystem::path temp = TempOutputPath(path_out);
    std::uint64_t written = 0;
    {
        std::ofstream output = OpenOutput(temp.string());
        try {
            written = action(input, output);
            output.close();
            if (!output) {
                throw std::runtime_error("Failed to finish output file: " + path_out);
            }
        } catch (...) {
            output.close();
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            throw;
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path_out, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw std::runtime_error("Failed to finalize output file: " + path_out);
    }
    return written;
}

}  // namespace

Bytes EncryptWithPassword(const Bytes& plaintext, const std::string& password, const password::Options& options) {
    return HandleByteToStream(plaintext, [&](std::istream& in, std::ostream& out) {
        password::EncryptWithPassword(in, password, out, options);
    });
}

Bytes DecryptWithPassword(const Bytes& envelope, const std::string& password, const password::Options& options) {
    return HandleByteToStream(envelope, [&](std::istream& in, std::ostream& out) {
        password::DecryptWithPassword(in, password, out, options);
    });
}

std::string EncryptTextWithPassword(const std::string& text,
                                    const std::string& password,
                                    const password::Options& options) {
    Bytes data(text.begin(), text.end());
    return base64::Encode(EncryptWithPassword(data, password, options));
}

std::string DecryptTextWithPassword(const std::string& envelope_base64,
                                    const std::string& password,
                                    const password::Options& options) {
    bool ok = false;
    Bytes envelope = base64::Decode(envelope_base64, &ok);
    if (!ok) {
        throw MalformedEnvelope("Invalid base64 envelope");
    }
    Bytes plain = DecryptWithPassword(envelope, password, options);
    return std::string(plain.begin(), plain.end());
}

Bytes EncryptWithKey(const Bytes& plaintext, const Bytes& key, random::RandomSource* rng) {
    return HandleByteToStream(plaintext, [&](std::istream& in, std::ostream& out) {
        envelope::EncryptAndEmbedIv(in, key, out, OrSystem(rng));
    });
}

Bytes DecryptWithKey(const Bytes& envelope, const Bytes& key) {
    return HandleByteToStream(envelope, [&](std::istream& in, std::ostream& out) {
        envelope::DecryptWithEmbeddedIv(in, key, out);
    });
}

Bytes Encrypt(const Bytes& plaintext, const Bytes& key, const Bytes& iv, random::RandomSource* rng) {
    return HandleByteToStream(plaintext, [&](std::istream& in, std::ostream& out) {
        cipher::Encrypt(in, key, iv, out, OrSystem(rng));
    });
}

Bytes Decrypt(const Bytes& ciphertext, const Bytes& key, const Bytes& iv) {
    return HandleByteToStream(ciphertext, [&](std::istream& in, std::ostream& out) {
        cipher::Decrypt(in, key, iv, out);
    });
}

std::uint64_t EncryptFileWithPassword(const std::string& path_in,
                                      const std::string& path_out,
                                      const std::string& password,
                                      const password::Options& options) {
    if (!constants::IsValidKeySize(options.key_size)) {
        throw InvalidArgument("keySize must be 16, 24 or 32 bytes");
    }
    return StreamFile(path_in, path_out, [&](std::istream& in, std::ostream& out) {
        return password::EncryptWithPassword(in, password, out, options);
    });
}

std::uint64_t DecryptFileWithPassword(const std::string& path_in,
                                      const std::string& path_out,
                                      const std::string& password,
                                      const password::Options& options) {
    return StreamFile(path_in, path_out, [&](std::istream& in, std::ostream& out) {
        return password::DecryptWithPassword(in, password, out, options);
    });
}

std::uint64_t EncryptFileWithKey(const std::string& path_in, const std::string& path_out, const Bytes& key) {
    cipher::ValidateKey(key);
    return StreamFile(path_in, path_out, [&](std::istream& in, std::ostream& out) {
        return envelope::EncryptAndEmbedIv(in, key, out);
    });
}

std::uint64_t DecryptFileWithKey(const std::string& path_in, const std::string& path_out, const Bytes& key) {
    cipher::ValidateKey(key);
    return StreamFile(path_in, path_out, [&](std::istream& in, std::ostream& out) {
        return envelope::DecryptWithEmbeddedIv(in, key, out);
    });
}

InspectResult InspectEnvelope(const Bytes& envelope, password::KeySizeEncoding encoding) {
    std::istringstream input(std::string(envelope.begin(), envelope.end()), std::ios::binary);
    password::Header header = password::ReadHeader(input, encoding);
    Bytes iv = format::ReadExact(input, constants::kIvLen, "IV");

    InspectResult result;
    result.header_len = header.length;
    result.salt_len = header.salt.size();
    result.key_size = header.key_size;
    result.iv_base64 = base64::Encode(iv);
    result.ciphertext_len = envelope.size() - header.length - iv.size();
    result.ciphertext_aligned = result.ciphertext_len > 0 && result.ciphertext_len % constants::kBlockSize == 0;
    return result;
}

Bytes GenerateKey(std::size_t key_size, random::RandomSource* rng) {
    if (!constants::IsValidKeySize(key_size)) {
        throw InvalidArgument("keySize must be 16, 24 or 32 bytes");
    }
    Bytes key = OrSystem(rng).Generate(key_size);
    if (key.size() != key_size) {
        throw CryptographicFailure("random source returned a short key");
    }
    return key;
}

std::size_t ParseKeySize(const std::string& text) {
    std::size_t value = 0;
    std::size_t pos = 0;
    try {
        if (!text.empty() && std::isdigit(static_cast<unsigned char>(text.front()))) {
            value = static_cast<std::size_t>(std::stoul(text, &pos));
        }
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != text.size()) {
        throw InvalidArgument("Invalid key size: " + text);
    }
    if (!constants::IsValidKeySize(value)) {
        throw InvalidArgument("Key size must be 16, 24 or 32, got " + text);
    }
    return value;
}

Bytes ReadFile(const std::string& path) {
    std::ifstream input = OpenInput(path);
    std::string data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw std::runtime_error("Failed to read file: " + path);
    }
    return Bytes(data.begin(), data.end());
}

std::string ResolvePassword(const std::string& input) {
    if (input.empty()) {
        return input;
    }
    std::filesystem::path candidate(input);
    if (input.rfind("~/", 0) == 0) {
        std::string home = env::HomeDir();
        if (!home.empty()) {
            candidate = std::filesystem::path(home) / input.substr(2);
        }
    }
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec) && std::filesystem::is_regular_file(candidate, ec)) {
        Bytes data = ReadFile(candidate.string());
        return std::string(data.begin(), data.end());
    }
    return input;
}

}  // namespace sealstream
