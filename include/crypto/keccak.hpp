#ifndef FARMTRACE_CRYPTO_KECCAK_HPP
#define FARMTRACE_CRYPTO_KECCAK_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace farmtrace::crypto {

// Keccak-256 sponge with the original 0x01 domain padding (EVM keccak256),
// not the FIPS 202 SHA3-256 padding.
class Keccak256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;
  static constexpr size_t RATE = 136;  // (1600 - 2 * 256) / 8

  // ---- CONSTRUCTOR ----
  Keccak256();


  // ---- HASHING ----
  // Absorbs more input; may be called repeatedly
  void update(const uint8_t* data, size_t length);
  void update(const std::string& data);
  // Pads, squeezes and resets the sponge for reuse
  std::array<uint8_t, DIGEST_SIZE> finalize();

  // One-shot convenience
  static std::array<uint8_t, DIGEST_SIZE> digest(const std::string& data);

private:
  // ---- PARAMETERS ----
  std::array<uint64_t, 25> state_;
  std::array<uint8_t, RATE> buffer_;
  size_t buffered_;


  // ---- PERMUTATION ----
  void reset();
  void absorb_block(const uint8_t* block);
  static void keccak_f1600(std::array<uint64_t, 25>& st);
};

} // namespace farmtrace::crypto

#endif // FARMTRACE_CRYPTO_KECCAK_HPP
