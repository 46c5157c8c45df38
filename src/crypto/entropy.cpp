#include "crypto/entropy.hpp"
#include "crypto/hasher.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <boost/log/trivial.hpp>

namespace farmtrace::crypto {

namespace {

constexpr size_t NONCE_SIZE = 16;  // 128 bits
constexpr size_t UUID_SIZE = 16;

} // namespace

std::vector<uint8_t> random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count == 0) {
    return bytes;
  }

  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    unsigned long code = ERR_get_error();
    char reason[256] = {0};
    ERR_error_string_n(code, reason, sizeof(reason));
    BOOST_LOG_TRIVIAL(error) << "Entropy: RAND_bytes failed: " << reason;
    throw EntropyError("Failed to generate " + std::to_string(count) + " random bytes");
  }
  return bytes;
}

std::string generate_nonce() {
  auto bytes = random_bytes(NONCE_SIZE);
  return to_hex(bytes.data(), bytes.size());
}

std::string generate_uuid_v4() {
  auto bytes = random_bytes(UUID_SIZE);

  // Version 4, variant 10xx
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  std::string hex = to_hex(bytes.data(), bytes.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-"
       + hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string generate_did(const std::string& method) {
  return "did:" + method + ":" + generate_uuid_v4();
}

} // namespace farmtrace::crypto
