#ifndef FARMTRACE_CRYPTO_COMMIT_REVEAL_HPP
#define FARMTRACE_CRYPTO_COMMIT_REVEAL_HPP

#include <string>
#include "crypto/hasher.hpp"

namespace farmtrace::crypto {

// commit_hash = H(reveal_hash || nonce), reveal_hash = H(canonical payload)
struct CommitRevealPair {
  std::string nonce;
  Digest reveal_hash;
  Digest commit_hash;
};

class CommitRevealCodec {
public:
  // ---- CONSTRUCTOR ----
  explicit CommitRevealCodec(HashFamily family = HashFamily::General);


  // ---- COMMIT AND VERIFY ----
  // Draws a fresh 128-bit nonce; throws EntropyError if none is available
  CommitRevealPair commit(const std::string& canonical_payload) const;
  // True only if both reveal and commit hashes match the payload and nonce
  bool verify(const CommitRevealPair& pair, const std::string& canonical_payload) const;
  // Recomputes the commit hash for a published reveal hash and nonce
  Digest recompute_commit(const Digest& reveal_hash, const std::string& nonce) const;


  // ---- GETTERS ----
  HashFamily family() const { return family_; }

private:
  HashFamily family_;
};

} // namespace farmtrace::crypto

#endif // FARMTRACE_CRYPTO_COMMIT_REVEAL_HPP
