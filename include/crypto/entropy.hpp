#ifndef FARMTRACE_CRYPTO_ENTROPY_HPP
#define FARMTRACE_CRYPTO_ENTROPY_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto/crypto_error.hpp"

namespace farmtrace::crypto {

// All functions draw from OpenSSL's CSPRNG and throw EntropyError when it
// cannot deliver.

std::vector<uint8_t> random_bytes(size_t count);

// 128-bit nonce, hex encoded (32 characters)
std::string generate_nonce();

// RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form
std::string generate_uuid_v4();

// "did:<method>:<uuid-v4>"
std::string generate_did(const std::string& method);

} // namespace farmtrace::crypto

#endif // FARMTRACE_CRYPTO_ENTROPY_HPP
