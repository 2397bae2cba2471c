#pragma once

#include "sealstream/kdf.hpp"
#include "sealstream/password.hpp"
#include "sealstream/random.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>

namespace sealstream::test {

using Bytes = std::vector<std::uint8_t>;

inline Bytes FromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("odd hex length");
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

inline Bytes ToBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

inline Bytes Pattern(std::size_t len, std::uint8_t seed = 7) {
    Bytes out(len);
    for (std::size_t i = 0; i < len; ++i) {
        out[i] = static_cast<std::uint8_t>((i * 31 + seed) & 0xFF);
    }
    return out;
}

// Counts up from a seed and remembers every block it handed out.
class CountingRandom final : public sealstream::random::RandomSource {
public:
    explicit CountingRandom(std::uint8_t seed = 0xA0) : next_(seed) {}

    Bytes Generate(std::size_t size) override {
        Bytes out(size);
        for (auto& b : out) {
            b = next_++;
        }
        issued_.push_back(out);
        return out;
    }

    const std::vector<Bytes>& issued() const noexcept { return issued_; }

private:
    std::uint8_t next_;
    std::vector<Bytes> issued_;
};

// Key derivation that ignores the password-to-salt coupling: fixed-length salt
// regardless of key size.
class ShortSaltDeriver final : public sealstream::kdf::KeyDeriver {
public:
    explicit ShortSaltDeriver(std::size_t salt_len) : salt_len_(salt_len) {}

    sealstream::kdf::DerivedKey Derive(const std::string& password, std::size_t key_size) const override {
        sealstream::kdf::DerivedKey out;
        out.salt = Pattern(salt_len_, 3);
        out.key = DeriveWithSalt(password, out.salt, key_size);
        return out;
    }

    Bytes DeriveWithSalt(const std::string& password, const Bytes& salt, std::size_t key_size) const override {
        return inner_.DeriveWithSalt(password, salt, key_size);
    }

private:
    std::size_t salt_len_;
    sealstream::kdf::Pbkdf2KeyDeriver inner_{1000};
};

inline sealstream::password::Options FastOptions(std::size_t key_size = 32) {
    sealstream::password::Options options;
    options.key_size = key_size;
    options.pbkdf2_iterations = 1000;
    return options;
}

// Generates `total` pattern bytes, handing out at most `max_chunk` per refill.
class ThrottledSource final : public std::streambuf {
public:
    ThrottledSource(std::size_t total, std::size_t max_chunk)
        : total_(total), buffer_(max_chunk) {}

    std::size_t produced() const noexcept { return produced_; }

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }
        if (produced_ >= total_) {
            return traits_type::eof();
        }
        std::size_t n = std::min(buffer_.size(), total_ - produced_);
        for (std::size_t i = 0; i < n; ++i) {
            buffer_[i] = static_cast<char>(((produced_ + i) * 31 + 7) & 0xFF);
        }
        produced_ += n;
        setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
        return traits_type::to_int_type(*gptr());
    }

private:
    std::size_t total_;
    std::size_t produced_ = 0;
    std::vector<char> buffer_;
};

// Keeps everything written and, for each write, how much the paired source
// had produced at that moment.
class RecordingSink final : public std::streambuf {
public:
    struct Write {
        std::size_t bytes_before = 0;
        std::size_t length = 0;
        std::size_t source_produced = 0;
    };

    explicit RecordingSink(const ThrottledSource* source = nullptr) : source_(source) {}

    const std::string& data() const noexcept { return data_; }
    const std::vector<Write>& writes() const noexcept { return writes_; }
    std::size_t flushes() const noexcept { return flushes_; }

protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        Record(static_cast<std::size_t>(n));
        data_.append(s, static_cast<std::size_t>(n));
        return n;
    }

    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        Record(1);
        data_.push_back(traits_type::to_char_type(ch));
        return ch;
    }

    int sync() override {
        ++flushes_;
        return 0;
    }

private:
    void Record(std::size_t n) {
        writes_.push_back({data_.size(), n, source_ ? source_->produced() : 0});
    }

    const ThrottledSource* source_;
    std::string data_;
    std::vector<Write> writes_;
    std::size_t flushes_ = 0;
};

}  // namespace sealstream::test
