#include "crypto/keccak.hpp"
#include <algorithm>

namespace farmtrace::crypto {

namespace {

constexpr std::array<uint64_t, 24> ROUND_CONSTANTS = {
  0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
  0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
  0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
  0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
  0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
  0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

constexpr std::array<int, 24> PI_LANES = {
  10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

constexpr std::array<int, 24> RHO_OFFSETS = {
  1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

inline uint64_t rotl64(uint64_t x, int n) {
  return (x << n) | (x >> (64 - n));
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Keccak256::Keccak256() {
  reset();
}

void Keccak256::reset() {
  state_.fill(0);
  buffer_.fill(0);
  buffered_ = 0;
}


//==============================================
// HASHING
//==============================================

void Keccak256::update(const uint8_t* data, size_t length) {
  while (length > 0) {
    size_t take = std::min(RATE - buffered_, length);
    std::copy(data, data + take, buffer_.begin() + buffered_);
    buffered_ += take;
    data += take;
    length -= take;

    if (buffered_ == RATE) {
      absorb_block(buffer_.data());
      buffered_ = 0;
    }
  }
}

void Keccak256::update(const std::string& data) {
  update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::array<uint8_t, Keccak256::DIGEST_SIZE> Keccak256::finalize() {
  // pad10*1 with the keccak domain byte
  std::fill(buffer_.begin() + buffered_, buffer_.end(), 0);
  buffer_[buffered_] |= 0x01;
  buffer_[RATE - 1] |= 0x80;
  absorb_block(buffer_.data());

  std::array<uint8_t, DIGEST_SIZE> out;
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    out[i] = static_cast<uint8_t>(state_[i / 8] >> (8 * (i % 8)));
  }

  reset();
  return out;
}

std::array<uint8_t, Keccak256::DIGEST_SIZE> Keccak256::digest(const std::string& data) {
  Keccak256 sponge;
  sponge.update(data);
  return sponge.finalize();
}


//==============================================
// PERMUTATION
//==============================================

void Keccak256::absorb_block(const uint8_t* block) {
  // Lanes are little-endian 64-bit words
  for (size_t i = 0; i < RATE / 8; ++i) {
    uint64_t lane = 0;
    for (size_t j = 0; j < 8; ++j) {
      lane |= static_cast<uint64_t>(block[i * 8 + j]) << (8 * j);
    }
    state_[i] ^= lane;
  }
  keccak_f1600(state_);
}

void Keccak256::keccak_f1600(std::array<uint64_t, 25>& st) {
  for (int round = 0; round < 24; ++round) {
    uint64_t bc[5];

    // Theta
    for (int i = 0; i < 5; ++i) {
      bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
    }
    for (int i = 0; i < 5; ++i) {
      uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
      for (int j = 0; j < 25; j += 5) {
        st[j + i] ^= t;
      }
    }

    // Rho and Pi
    uint64_t current = st[1];
    for (int i = 0; i < 24; ++i) {
      int lane = PI_LANES[i];
      uint64_t next = st[lane];
      st[lane] = rotl64(current, RHO_OFFSETS[i]);
      current = next;
    }

    // Chi
    for (int j = 0; j < 25; j += 5) {
      for (int i = 0; i < 5; ++i) {
        bc[i] = st[j + i];
      }
      for (int i = 0; i < 5; ++i) {
        st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
      }
    }

    // Iota
    st[0] ^= ROUND_CONSTANTS[round];
  }
}

} // namespace farmtrace::crypto
