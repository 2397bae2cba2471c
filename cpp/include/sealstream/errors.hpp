#pragma once

#include <stdexcept>
#include <string>

namespace sealstream {

// Bad key, IV or key-size selector. Raised before any stream I/O.
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Envelope header is truncated or carries a value no encoder produces.
class MalformedEnvelope : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// OpenSSL failure or bad ciphertext (length, padding).
class CryptographicFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace sealstream
