#include "crypto/commit_reveal.hpp"
#include "crypto/entropy.hpp"
#include <boost/log/trivial.hpp>

namespace farmtrace::crypto {

//==============================================
// CONSTRUCTOR
//==============================================

CommitRevealCodec::CommitRevealCodec(HashFamily family)
  : family_(family) {}


//==============================================
// COMMIT AND VERIFY
//==============================================

CommitRevealPair CommitRevealCodec::commit(const std::string& canonical_payload) const {
  // Entropy failure propagates; the commitment is worthless without a secret nonce
  std::string nonce = generate_nonce();

  Digest reveal_hash = hash(family_, canonical_payload);
  Digest commit_hash = recompute_commit(reveal_hash, nonce);

  BOOST_LOG_TRIVIAL(debug) << "Commit reveal: Committed payload of " << canonical_payload.size()
                           << " bytes as " << commit_hash;
  return CommitRevealPair{nonce, reveal_hash, commit_hash};
}

bool CommitRevealCodec::verify(const CommitRevealPair& pair, const std::string& canonical_payload) const {
  Digest reveal_hash = hash(family_, canonical_payload);
  if (reveal_hash != pair.reveal_hash) {
    BOOST_LOG_TRIVIAL(debug) << "Commit reveal: Reveal hash mismatch";
    return false;
  }

  if (recompute_commit(reveal_hash, pair.nonce) != pair.commit_hash) {
    BOOST_LOG_TRIVIAL(debug) << "Commit reveal: Commit hash mismatch";
    return false;
  }
  return true;
}

Digest CommitRevealCodec::recompute_commit(const Digest& reveal_hash, const std::string& nonce) const {
  return hash(family_, reveal_hash.text + nonce);
}

} // namespace farmtrace::crypto
