#include "pipeline/stages.hpp"
#include "crypto/merkle.hpp"
#include <boost/log/trivial.hpp>

namespace farmtrace::pipeline {

namespace {

using record::Json;
using record::Receipt;

Json content_address_json(const std::optional<std::string>& content_address) {
  if (!content_address) {
    return nullptr;
  }
  return *content_address;
}

Json optional_digest_json(const crypto::Digest* digest) {
  if (!digest) {
    return nullptr;
  }
  return digest->text;
}

Json digest_list_json(const std::vector<crypto::Digest>& digests) {
  Json list = Json::array();
  for (const auto& digest : digests) {
    list.push_back(digest.text);
  }
  return list;
}

// Receipts are only built once the record is stored
template <typename Envelope>
const std::string& bound_address(const Envelope& envelope) {
  if (!envelope.content_address()) {
    throw std::logic_error("Stage: Receipt requested before the content address was bound");
  }
  return *envelope.content_address();
}

} // namespace

//==============================================
// STAGE 1: FARMER REGISTRATION
//==============================================

void RegistrationStage::validate() const {
  record::validate(payload_);
}

void RegistrationStage::pre_hash(Envelope& envelope, const StageContext& context) const {
  const std::string farmer_did = context.next_did();
  envelope.set_identifier("farmer_did", farmer_did);

  const std::string crop_id_data = record::join_fields({
    farmer_did,
    payload_.crop_type,
    record::format_timestamp_display(envelope.created_at())
  });
  envelope.set_digest("crop_id_hash", crypto::solidity_hash(crop_id_data));
}

Json RegistrationStage::to_json(const Envelope& envelope) const {
  Json j = Json::object();
  j["farmer_did"] = envelope.identifier("farmer_did");
  j["registration_data"] = envelope.payload();
  j["registered_at"] = record::format_timestamp_rfc3339(envelope.created_at());
  j["ipfs_cid"] = content_address_json(envelope.content_address());
  j["crop_id_hash"] = envelope.digest("crop_id_hash").text;
  return j;
}

Receipt RegistrationStage::receipt(const Envelope& envelope) const {
  return Receipt(KIND,
                 {{"farmer_did", envelope.identifier("farmer_did")}},
                 {{"crop_id_hash", envelope.digest("crop_id_hash")}},
                 std::nullopt,
                 bound_address(envelope),
                 "registered_at",
                 envelope.created_at());
}


//==============================================
// STAGE 2: FPO PURCHASE
//==============================================

void PurchaseStage::validate() const {
  record::validate(payload_);
}

void PurchaseStage::pre_hash(Envelope& envelope, const StageContext&) const {
  const std::string batch_data = record::join_fields({
    payload_.farmer_did,
    payload_.batch_id,
    record::format_number(payload_.quantity_kg),
    payload_.fpo_name
  });
  envelope.set_digest("batch_hash", crypto::solidity_hash(batch_data));
}

Json PurchaseStage::to_json(const Envelope& envelope) const {
  Json j = Json::object();
  j["batch_hash"] = envelope.digest("batch_hash").text;
  j["purchase_data"] = envelope.payload();
  j["purchased_at"] = record::format_timestamp_rfc3339(envelope.created_at());
  j["ipfs_cid"] = content_address_json(envelope.content_address());
  return j;
}

Receipt PurchaseStage::receipt(const Envelope& envelope) const {
  return Receipt(KIND,
                 {{"batch_id", payload_.batch_id}},
                 {{"batch_hash", envelope.digest("batch_hash")}},
                 std::nullopt,
                 bound_address(envelope),
                 "purchased_at",
                 envelope.created_at());
}


//==============================================
// STAGE 3: WAREHOUSE STORAGE
//==============================================

void WarehouseStage::validate() const {
  record::validate(payload_);
}

Json WarehouseStage::to_json(const Envelope& envelope) const {
  Json j = Json::object();
  j["warehouse_id"] = payload_.warehouse_id;
  j["state_hash"] = optional_digest_json(envelope.find_digest("state_hash"));
  j["warehouse_data"] = envelope.payload();
  j["updated_at"] = record::format_timestamp_rfc3339(envelope.created_at());
  j["ipfs_cid"] = content_address_json(envelope.content_address());
  return j;
}

void WarehouseStage::post_hash(Envelope& envelope) const {
  const std::string state_data = record::join_fields({
    payload_.warehouse_id,
    payload_.batch_id,
    record::format_optional_debug(payload_.temperature_celsius),
    record::format_optional_debug(payload_.humidity_percentage),
    bound_address(envelope)
  });
  envelope.set_digest("state_hash", crypto::solidity_hash(state_data));
  BOOST_LOG_TRIVIAL(debug) << "Stage: Computed warehouse state hash over " << bound_address(envelope);
}

Receipt WarehouseStage::receipt(const Envelope& envelope) const {
  return Receipt(KIND,
                 {{"warehouse_id", payload_.warehouse_id}, {"batch_id", payload_.batch_id}},
                 {{"state_hash", envelope.digest("state_hash")}},
                 std::nullopt,
                 bound_address(envelope),
                 "updated_at",
                 envelope.created_at());
}


//==============================================
// STAGE 4: LOGISTICS
//==============================================

void LogisticsStage::validate() const {
  record::validate(payload_);
}

void LogisticsStage::pre_hash(Envelope& envelope, const StageContext&) const {
  const std::string location_data = record::join_fields({
    payload_.shipment_id,
    payload_.current_location,
    record::format_number(payload_.gps_coordinates.latitude),
    record::format_number(payload_.gps_coordinates.longitude)
  });
  envelope.set_digest("location_hash", crypto::solidity_hash(location_data));
}

Json LogisticsStage::to_json(const Envelope& envelope) const {
  Json j = Json::object();
  j["shipment_id"] = payload_.shipment_id;
  j["location_hash"] = envelope.digest("location_hash").text;
  j["milestone_data"] = envelope.payload();
  j["recorded_at"] = record::format_timestamp_rfc3339(envelope.created_at());
  j["ipfs_cid"] = content_address_json(envelope.content_address());
  return j;
}

Receipt LogisticsStage::receipt(const Envelope& envelope) const {
  return Receipt(KIND,
                 {{"shipment_id", payload_.shipment_id}},
                 {{"location_hash", envelope.digest("location_hash")}},
                 std::nullopt,
                 bound_address(envelope),
                 "recorded_at",
                 envelope.created_at());
}


//==============================================
// STAGE 5: PROCESSING
//==============================================

void ProcessingStage::validate() const {
  record::validate(payload_);
}

void ProcessingStage::pre_hash(Envelope& envelope, const StageContext&) const {
  const std::string input_data = record::join_fields({
    payload_.input_batch_id,
    payload_.processor_name,
    record::format_number(payload_.input_quantity_kg)
  });
  envelope.set_digest("input_batch_hash", crypto::solidity_hash(input_data));

  const std::string output_quantity = record::format_number(payload_.output_quantity_kg);
  std::vector<crypto::Digest> output_hashes;
  output_hashes.reserve(payload_.output_batch_ids.size());
  for (const auto& output_id : payload_.output_batch_ids) {
    output_hashes.push_back(crypto::solidity_hash(record::join_fields({output_id, output_quantity})));
  }
  envelope.set_digests("output_batch_hashes", output_hashes);

  const std::string transform_data = record::join_fields({
    record::debug_name(payload_.processing_type),
    record::format_number(payload_.yield_percentage),
    record::format_number(payload_.waste_percentage)
  });
  envelope.set_digest("transform_hash", crypto::solidity_hash(transform_data));
}

Json ProcessingStage::to_json(const Envelope& envelope) const {
  Json j = Json::object();
  j["input_batch_hash"] = envelope.digest("input_batch_hash").text;
  j["transform_hash"] = envelope.digest("transform_hash").text;
  j["output_batch_hashes"] = digest_list_json(envelope.digests("output_batch_hashes"));
  j["process_data"] = envelope.payload();
  j["processed_at"] = record::format_timestamp_rfc3339(envelope.created_at());
  j["ipfs_cid"] = content_address_json(envelope.content_address());
  return j;
}

Receipt ProcessingStage::receipt(const Envelope& envelope) const {
  return Receipt(KIND,
                 {{"input_batch_id", payload_.input_batch_id}},
                 {{"input_batch_hash", envelope.digest("input_batch_hash")},
                  {"transform_hash", envelope.digest("transform_hash")},
                  {"output_batch_hashes", envelope.digests("output_batch_hashes")}},
                 std::nullopt,
                 bound_address(envelope),
                 "processed_at",
                 envelope.created_at());
}


//==============================================
// STAGE 6: PACKAGING
//==============================================

void PackagingStage::validate() const {
  record::validate(payload_);
}

void PackagingStage::pre_hash(Envelope& envelope, const StageContext&) const {
  const std::string batch_data = record::join_fields({payload_.parent_batch_id, payload_.product_name});
  envelope.set_digest("parent_batch_hash", crypto::solidity_hash(batch_data));

  const std::vector<std::string> leaves = payload_.merkle_proof
    ? *payload_.merkle_proof
    : std::vector<std::string>{payload_.sku_id};
  // A single leaf is its own root, so the text is not always a hash
  envelope.set_digest("merkle_root",
                      crypto::Digest{crypto::HashFamily::General, crypto::MerkleAggregator::root(leaves)});
}

Json PackagingStage::to_json(const Envelope& envelope) const {
  Json j = Json::object();
  j["sku_id"] = payload_.sku_id;
  j["parent_batch_hash"] = envelope.digest("parent_batch_hash").text;
  j["merkle_root"] = envelope.digest("merkle_root").text;
  j["sku_data"] = envelope.payload();
  j["packaged_at"] = record::format_timestamp_rfc3339(envelope.created_at());
  j["ipfs_cid"] = content_address_json(envelope.content_address());
  return j;
}

Receipt PackagingStage::receipt(const Envelope& envelope) const {
  return Receipt(KIND,
                 {{"sku_id", payload_.sku_id}},
                 {{"parent_batch_hash", envelope.digest("parent_batch_hash")},
                  {"merkle_root", envelope.digest("merkle_root")}},
                 std::nullopt,
                 bound_address(envelope),
                 "packaged_at",
                 envelope.created_at());
}


//==============================================
// STAGE 7: AI SCORING
//==============================================

void AiScoreStage::validate() const {
  record::validate(payload_);
}

void AiScoreStage::pre_hash(Envelope& envelope, const StageContext& context) const {
  const std::string batch_data = record::join_fields({payload_.batch_id, payload_.model_name});
  envelope.set_digest("batch_hash", crypto::solidity_hash(batch_data));
  envelope.set_commitment(context.codec.commit(record::canonical_json(payload_)));
}

Json AiScoreStage::to_json(const Envelope& envelope) const {
  const auto& commitment = envelope.commitment();
  if (!commitment) {
    throw std::logic_error("Stage: AI score record serialized before its commitment was computed");
  }

  Json j = Json::object();
  j["batch_hash"] = envelope.digest("batch_hash").text;
  j["commit_hash"] = commitment->commit_hash.text;
  j["reveal_hash"] = commitment->reveal_hash.text;
  j["nonce"] = commitment->nonce;
  j["score_data"] = envelope.payload();
  j["scored_at"] = record::format_timestamp_rfc3339(envelope.created_at());
  j["ipfs_cid"] = content_address_json(envelope.content_address());
  return j;
}

Receipt AiScoreStage::receipt(const Envelope& envelope) const {
  return Receipt(KIND,
                 {{"batch_id", payload_.batch_id}},
                 {{"batch_hash", envelope.digest("batch_hash")}},
                 envelope.commitment(),
                 bound_address(envelope),
                 "scored_at",
                 envelope.created_at());
}

} // namespace farmtrace::pipeline
