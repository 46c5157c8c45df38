#ifndef FARMTRACE_CRYPTO_ERROR_HPP
#define FARMTRACE_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace farmtrace::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// OpenSSL digest context could not be created or driven
class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

// The CSPRNG refused to produce bytes; callers must not fall back
class EntropyError : public CryptoError {
public:
    explicit EntropyError(const std::string& message)
        : CryptoError("Entropy error: " + message) {}
};

} // namespace farmtrace::crypto

#endif // FARMTRACE_CRYPTO_ERROR_HPP
