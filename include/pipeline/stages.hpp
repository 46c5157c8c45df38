#ifndef FARMTRACE_PIPELINE_STAGES_HPP
#define FARMTRACE_PIPELINE_STAGES_HPP

#include <functional>
#include <string>
#include <utility>
#include <variant>
#include "crypto/commit_reveal.hpp"
#include "record/envelope.hpp"
#include "record/payload_json.hpp"
#include "record/payloads.hpp"
#include "record/receipt.hpp"

namespace farmtrace::pipeline {

// Collaborators a stage may draw on while computing its digests
struct StageContext {
  std::function<std::string()> next_did;
  const crypto::CommitRevealCodec& codec;
};

// Every stage case exposes the same operations, used by StagePipeline:
//   validate()                         reject bad input before any I/O
//   pre_hash(envelope, context)        digests computable before persisting
//   to_json(envelope)                  persisted record (ipfs_cid is null)
//   post_hash(envelope)                digests over the bound content address
//   receipt(envelope)                  response value
// Field order of each hash input is fixed and must not change, anchored
// hashes depend on the exact bytes.

// ---- STAGE 1: FARMER REGISTRATION ----
class RegistrationStage {
public:
  using Payload = record::FarmerRegistration;
  using Envelope = record::RecordEnvelope<Payload>;
  static constexpr record::StageKind KIND = record::StageKind::Registration;

  explicit RegistrationStage(Payload payload) : payload_(std::move(payload)) {}
  const Payload& payload() const { return payload_; }

  void validate() const;
  // crop_id_hash = keccak(farmer_did-crop_type-registered_at)
  void pre_hash(Envelope& envelope, const StageContext& context) const;
  record::Json to_json(const Envelope& envelope) const;
  void post_hash(Envelope&) const {}
  record::Receipt receipt(const Envelope& envelope) const;

private:
  Payload payload_;
};

// ---- STAGE 2: FPO PURCHASE ----
class PurchaseStage {
public:
  using Payload = record::FpoPurchase;
  using Envelope = record::RecordEnvelope<Payload>;
  static constexpr record::StageKind KIND = record::StageKind::Purchase;

  explicit PurchaseStage(Payload payload) : payload_(std::move(payload)) {}
  const Payload& payload() const { return payload_; }

  void validate() const;
  // batch_hash = keccak(farmer_did-batch_id-quantity_kg-fpo_name)
  void pre_hash(Envelope& envelope, const StageContext& context) const;
  record::Json to_json(const Envelope& envelope) const;
  void post_hash(Envelope&) const {}
  record::Receipt receipt(const Envelope& envelope) const;

private:
  Payload payload_;
};

// ---- STAGE 3: WAREHOUSE STORAGE ----
class WarehouseStage {
public:
  using Payload = record::WarehouseUpdate;
  using Envelope = record::RecordEnvelope<Payload>;
  static constexpr record::StageKind KIND = record::StageKind::Warehouse;

  explicit WarehouseStage(Payload payload) : payload_(std::move(payload)) {}
  const Payload& payload() const { return payload_; }

  void validate() const;
  void pre_hash(Envelope&, const StageContext&) const {}
  record::Json to_json(const Envelope& envelope) const;
  // state_hash = keccak(warehouse_id-batch_id-Some(t)|None-Some(h)|None-cid)
  void post_hash(Envelope& envelope) const;
  record::Receipt receipt(const Envelope& envelope) const;

private:
  Payload payload_;
};

// ---- STAGE 4: LOGISTICS ----
class LogisticsStage {
public:
  using Payload = record::LogisticsMilestone;
  using Envelope = record::RecordEnvelope<Payload>;
  static constexpr record::StageKind KIND = record::StageKind::Logistics;

  explicit LogisticsStage(Payload payload) : payload_(std::move(payload)) {}
  const Payload& payload() const { return payload_; }

  void validate() const;
  // location_hash = keccak(shipment_id-current_location-latitude-longitude)
  void pre_hash(Envelope& envelope, const StageContext& context) const;
  record::Json to_json(const Envelope& envelope) const;
  void post_hash(Envelope&) const {}
  record::Receipt receipt(const Envelope& envelope) const;

private:
  Payload payload_;
};

// ---- STAGE 5: PROCESSING ----
class ProcessingStage {
public:
  using Payload = record::ProcessBatch;
  using Envelope = record::RecordEnvelope<Payload>;
  static constexpr record::StageKind KIND = record::StageKind::Processing;

  explicit ProcessingStage(Payload payload) : payload_(std::move(payload)) {}
  const Payload& payload() const { return payload_; }

  void validate() const;
  // input_batch_hash = keccak(input_batch_id-processor_name-input_quantity_kg)
  // output hash      = keccak(output_batch_id-output_quantity_kg), per output
  // transform_hash   = keccak(ProcessingType-yield_percentage-waste_percentage)
  void pre_hash(Envelope& envelope, const StageContext& context) const;
  record::Json to_json(const Envelope& envelope) const;
  void post_hash(Envelope&) const {}
  record::Receipt receipt(const Envelope& envelope) const;

private:
  Payload payload_;
};

// ---- STAGE 6: PACKAGING ----
class PackagingStage {
public:
  using Payload = record::CreateSku;
  using Envelope = record::RecordEnvelope<Payload>;
  static constexpr record::StageKind KIND = record::StageKind::Packaging;

  explicit PackagingStage(Payload payload) : payload_(std::move(payload)) {}
  const Payload& payload() const { return payload_; }

  void validate() const;
  // parent_batch_hash = keccak(parent_batch_id-product_name)
  // merkle_root       = root(merkle_proof), or root([sku_id]) = sku_id
  void pre_hash(Envelope& envelope, const StageContext& context) const;
  record::Json to_json(const Envelope& envelope) const;
  void post_hash(Envelope&) const {}
  record::Receipt receipt(const Envelope& envelope) const;

private:
  Payload payload_;
};

// ---- STAGE 7: AI SCORING ----
class AiScoreStage {
public:
  using Payload = record::AiScore;
  using Envelope = record::RecordEnvelope<Payload>;
  static constexpr record::StageKind KIND = record::StageKind::AiScore;

  explicit AiScoreStage(Payload payload) : payload_(std::move(payload)) {}
  const Payload& payload() const { return payload_; }

  void validate() const;
  // batch_hash = keccak(batch_id-model_name), plus a commit-reveal pair over
  // the compact JSON of the payload
  void pre_hash(Envelope& envelope, const StageContext& context) const;
  record::Json to_json(const Envelope& envelope) const;
  void post_hash(Envelope&) const {}
  record::Receipt receipt(const Envelope& envelope) const;

private:
  Payload payload_;
};


using StageRequest = std::variant<
  RegistrationStage,
  PurchaseStage,
  WarehouseStage,
  LogisticsStage,
  ProcessingStage,
  PackagingStage,
  AiScoreStage>;

} // namespace farmtrace::pipeline

#endif // FARMTRACE_PIPELINE_STAGES_HPP
