#ifndef FARMTRACE_RECORD_ENVELOPE_HPP
#define FARMTRACE_RECORD_ENVELOPE_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "crypto/commit_reveal.hpp"
#include "crypto/hasher.hpp"
#include "record/canonical.hpp"

namespace farmtrace::record {

// A stage payload wrapped with its creation time, the digests derived from
// it and the content address it was stored under. The content address can
// be bound exactly once; digests that depend on it are set afterwards.
template <typename Payload>
class RecordEnvelope {
public:
  // ---- CONSTRUCTOR ----
  RecordEnvelope(const Payload& payload, Timestamp created_at)
    : payload_(payload), created_at_(created_at) {}


  // ---- PAYLOAD ----
  const Payload& payload() const { return payload_; }
  Timestamp created_at() const { return created_at_; }


  // ---- IDENTIFIERS ----
  // Values generated for the record, such as the farmer DID
  void set_identifier(const std::string& name, const std::string& value) {
    identifiers_[name] = value;
  }

  const std::string& identifier(const std::string& name) const {
    auto it = identifiers_.find(name);
    if (it == identifiers_.end()) {
      throw std::out_of_range("RecordEnvelope: No identifier named " + name);
    }
    return it->second;
  }


  // ---- DIGESTS ----
  void set_digest(const std::string& name, const crypto::Digest& digest) {
    digests_.insert_or_assign(name, digest);
  }

  void set_digests(const std::string& name, const std::vector<crypto::Digest>& digests) {
    digest_lists_[name] = digests;
  }

  // nullptr while the digest has not been computed
  const crypto::Digest* find_digest(const std::string& name) const {
    auto it = digests_.find(name);
    return it == digests_.end() ? nullptr : &it->second;
  }

  const crypto::Digest& digest(const std::string& name) const {
    const crypto::Digest* found = find_digest(name);
    if (!found) {
      throw std::out_of_range("RecordEnvelope: No digest named " + name);
    }
    return *found;
  }

  const std::vector<crypto::Digest>& digests(const std::string& name) const {
    auto it = digest_lists_.find(name);
    if (it == digest_lists_.end()) {
      throw std::out_of_range("RecordEnvelope: No digest list named " + name);
    }
    return it->second;
  }

  void set_commitment(const crypto::CommitRevealPair& commitment) { commitment_ = commitment; }
  const std::optional<crypto::CommitRevealPair>& commitment() const { return commitment_; }


  // ---- CONTENT ADDRESS ----
  void bind_content_address(const std::string& content_address) {
    if (content_address_) {
      throw std::logic_error("RecordEnvelope: Content address already bound to " + *content_address_);
    }
    content_address_ = content_address;
  }

  const std::optional<std::string>& content_address() const { return content_address_; }

private:
  Payload payload_;
  Timestamp created_at_;
  std::map<std::string, std::string> identifiers_;
  std::map<std::string, crypto::Digest> digests_;
  std::map<std::string, std::vector<crypto::Digest>> digest_lists_;
  std::optional<crypto::CommitRevealPair> commitment_;
  std::optional<std::string> content_address_;
};

} // namespace farmtrace::record

#endif // FARMTRACE_RECORD_ENVELOPE_HPP
