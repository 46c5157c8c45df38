#include "record/receipt.hpp"
#include <stdexcept>

namespace farmtrace::record {

const char* to_string(StageKind kind) {
  switch (kind) {
    case StageKind::Registration: return "farmer_registration";
    case StageKind::Purchase:     return "fpo_purchase";
    case StageKind::Warehouse:    return "warehouse_update";
    case StageKind::Logistics:    return "logistics_milestone";
    case StageKind::Processing:   return "process_batch";
    case StageKind::Packaging:    return "create_sku";
    case StageKind::AiScore:      return "ai_score";
    default:                      return "unknown";
  }
}

//==============================================
// CONSTRUCTOR
//==============================================

Receipt::Receipt(StageKind kind,
                 std::vector<NamedIdentifier> identifiers,
                 std::vector<NamedDigest> digests,
                 std::optional<crypto::CommitRevealPair> commitment,
                 std::string content_address,
                 std::string timestamp_field,
                 Timestamp timestamp)
  : kind_(kind)
  , identifiers_(std::move(identifiers))
  , digests_(std::move(digests))
  , commitment_(std::move(commitment))
  , content_address_(std::move(content_address))
  , timestamp_field_(std::move(timestamp_field))
  , timestamp_(timestamp) {}


//==============================================
// GETTERS
//==============================================

const std::string& Receipt::identifier(const std::string& name) const {
  for (const auto& [key, value] : identifiers_) {
    if (key == name) {
      return value;
    }
  }
  throw std::out_of_range("Receipt: No identifier named " + name);
}

const Receipt::DigestValue& Receipt::find_digest(const std::string& name) const {
  for (const auto& [key, value] : digests_) {
    if (key == name) {
      return value;
    }
  }
  throw std::out_of_range("Receipt: No digest named " + name);
}

const crypto::Digest& Receipt::digest(const std::string& name) const {
  const auto& value = find_digest(name);
  if (const auto* single = std::get_if<crypto::Digest>(&value)) {
    return *single;
  }
  throw std::out_of_range("Receipt: Digest " + name + " is a list");
}

const std::vector<crypto::Digest>& Receipt::digest_list(const std::string& name) const {
  const auto& value = find_digest(name);
  if (const auto* list = std::get_if<std::vector<crypto::Digest>>(&value)) {
    return *list;
  }
  throw std::out_of_range("Receipt: Digest " + name + " is not a list");
}


//==============================================
// SERIALIZATION
//==============================================

Json Receipt::to_json() const {
  Json j = Json::object();

  for (const auto& [name, value] : identifiers_) {
    j[name] = value;
  }

  for (const auto& [name, value] : digests_) {
    if (const auto* single = std::get_if<crypto::Digest>(&value)) {
      j[name] = single->text;
    } else {
      Json list = Json::array();
      for (const auto& digest : std::get<std::vector<crypto::Digest>>(value)) {
        list.push_back(digest.text);
      }
      j[name] = list;
    }
  }

  if (commitment_) {
    j["commit_hash"] = commitment_->commit_hash.text;
    j["reveal_hash"] = commitment_->reveal_hash.text;
    j["nonce"] = commitment_->nonce;
  }

  j["ipfs_cid"] = content_address_;
  j[timestamp_field_] = format_timestamp_rfc3339(timestamp_);
  return j;
}

} // namespace farmtrace::record
