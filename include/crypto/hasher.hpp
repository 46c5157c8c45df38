#ifndef FARMTRACE_CRYPTO_HASHER_HPP
#define FARMTRACE_CRYPTO_HASHER_HPP

#include <cstdint>
#include <cstddef>
#include <ostream>
#include <string>
#include "crypto/crypto_error.hpp"

namespace farmtrace::crypto {

enum class HashFamily {
  Solidity,  // keccak256, verifiable on-chain
  General    // sha256, used for internal chaining
};

const char* to_string(HashFamily family);

// Hex digest tagged with the family that produced it. The text form is
// "0x" + 64 lowercase hex characters for both families.
struct Digest {
  HashFamily family;
  std::string text;

  const std::string& str() const { return text; }
};

bool operator==(const Digest& lhs, const Digest& rhs);
bool operator!=(const Digest& lhs, const Digest& rhs);
std::ostream& operator<<(std::ostream& os, const Digest& digest);


// ---- HASH FUNCTIONS ----
// Keccak-256 compatible with Solidity's keccak256()
Digest solidity_hash(const std::string& bytes);
// SHA-256 through OpenSSL EVP
Digest general_hash(const std::string& bytes);
Digest hash(HashFamily family, const std::string& bytes);


// ---- ENCODING ----
std::string to_hex(const uint8_t* data, size_t length);

} // namespace farmtrace::crypto

#endif // FARMTRACE_CRYPTO_HASHER_HPP
