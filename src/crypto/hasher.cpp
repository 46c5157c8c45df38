#include "crypto/hasher.hpp"
#include "crypto/keccak.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace farmtrace::crypto {

namespace {

constexpr const char* DIGEST_PREFIX = "0x";

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Hasher: Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace

//==============================================
// DIGEST TYPE
//==============================================

const char* to_string(HashFamily family) {
  switch (family) {
    case HashFamily::Solidity: return "solidity-compatible";
    case HashFamily::General:  return "general-purpose";
    default:                   return "unknown";
  }
}

bool operator==(const Digest& lhs, const Digest& rhs) {
  return lhs.family == rhs.family && lhs.text == rhs.text;
}

bool operator!=(const Digest& lhs, const Digest& rhs) {
  return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
  return os << digest.text;
}


//==============================================
// HASH FUNCTIONS
//==============================================

Digest solidity_hash(const std::string& bytes) {
  auto raw = Keccak256::digest(bytes);
  return Digest{HashFamily::Solidity, DIGEST_PREFIX + to_hex(raw.data(), raw.size())};
}

Digest general_hash(const std::string& bytes) {
  unsigned char raw[EVP_MAX_MD_SIZE];
  unsigned int raw_len = 0;

  DigestContext context;

  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw DigestError("Hasher: Failed to initialize digest context");
  }

  if (!EVP_DigestUpdate(context.get(), bytes.data(), bytes.size())) {
    throw DigestError("Hasher: Failed to update digest");
  }

  if (!EVP_DigestFinal_ex(context.get(), raw, &raw_len)) {
    throw DigestError("Hasher: Failed to finalize digest");
  }

  return Digest{HashFamily::General, DIGEST_PREFIX + to_hex(raw, raw_len)};
}

Digest hash(HashFamily family, const std::string& bytes) {
  if (family == HashFamily::Solidity) {
    return solidity_hash(bytes);
  }
  return general_hash(bytes);
}


//==============================================
// ENCODING
//==============================================

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace farmtrace::crypto
