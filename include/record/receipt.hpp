#ifndef FARMTRACE_RECORD_RECEIPT_HPP
#define FARMTRACE_RECORD_RECEIPT_HPP

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "crypto/commit_reveal.hpp"
#include "crypto/hasher.hpp"
#include "record/canonical.hpp"
#include "record/payload_json.hpp"

namespace farmtrace::record {

enum class StageKind {
  Registration,
  Purchase,
  Warehouse,
  Logistics,
  Processing,
  Packaging,
  AiScore
};

const char* to_string(StageKind kind);

// Response value of one completed stage. Only built after the record is
// stored and pinned; read-only once constructed.
class Receipt {
public:
  using DigestValue = std::variant<crypto::Digest, std::vector<crypto::Digest>>;
  using NamedIdentifier = std::pair<std::string, std::string>;
  using NamedDigest = std::pair<std::string, DigestValue>;

  // ---- CONSTRUCTOR ----
  Receipt(StageKind kind,
          std::vector<NamedIdentifier> identifiers,
          std::vector<NamedDigest> digests,
          std::optional<crypto::CommitRevealPair> commitment,
          std::string content_address,
          std::string timestamp_field,
          Timestamp timestamp);


  // ---- GETTERS ----
  StageKind kind() const { return kind_; }
  const std::string& content_address() const { return content_address_; }
  Timestamp timestamp() const { return timestamp_; }
  const std::string& timestamp_field() const { return timestamp_field_; }
  const std::optional<crypto::CommitRevealPair>& commitment() const { return commitment_; }

  // Throw std::out_of_range for unknown names
  const std::string& identifier(const std::string& name) const;
  const crypto::Digest& digest(const std::string& name) const;
  const std::vector<crypto::Digest>& digest_list(const std::string& name) const;


  // ---- SERIALIZATION ----
  // identifiers, digests, commit_hash/reveal_hash/nonce, ipfs_cid, timestamp
  Json to_json() const;

private:
  StageKind kind_;
  std::vector<NamedIdentifier> identifiers_;
  std::vector<NamedDigest> digests_;
  std::optional<crypto::CommitRevealPair> commitment_;
  std::string content_address_;
  std::string timestamp_field_;
  Timestamp timestamp_;

  const DigestValue& find_digest(const std::string& name) const;
};

} // namespace farmtrace::record

#endif // FARMTRACE_RECORD_RECEIPT_HPP
