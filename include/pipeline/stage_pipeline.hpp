#ifndef FARMTRACE_PIPELINE_STAGE_PIPELINE_HPP
#define FARMTRACE_PIPELINE_STAGE_PIPELINE_HPP

#include <cstdint>
#include <functional>
#include <string>
#include "crypto/commit_reveal.hpp"
#include "pipeline/stages.hpp"
#include "record/receipt.hpp"
#include "storage/storage_gateway.hpp"

namespace farmtrace::pipeline {

struct UploadReceipt {
  std::string cid;
  uint64_t size{0};
  bool pinned{false};
};

struct PinReceipt {
  std::string cid;
  bool pinned{false};
};

// Runs one custody stage through
//   validate -> pre-hash -> persist -> bind address -> post-hash -> pin -> receipt
// No digest is returned unless its record was stored and pinned. Every call
// is independent; the only shared state is the storage gateway, held by
// reference.
class StagePipeline {
public:
  using Clock = std::function<record::Timestamp()>;
  using IdentifierSource = std::function<std::string()>;

  // ---- CONSTRUCTOR ----
  // Uses the system clock and random "did:farmer:<uuid>" identifiers
  explicit StagePipeline(storage::StorageGateway& storage);
  StagePipeline(storage::StorageGateway& storage, Clock clock, IdentifierSource did_source);


  // ---- STAGE OPERATIONS ----
  // Throws ValidationError, StorageUnavailableError, PinFailedError or
  // SerializationError; no receipt exists on any of these paths.
  record::Receipt submit(const StageRequest& request);

  record::Receipt register_farmer(const record::FarmerRegistration& payload);
  record::Receipt record_purchase(const record::FpoPurchase& payload);
  record::Receipt update_warehouse(const record::WarehouseUpdate& payload);
  record::Receipt record_milestone(const record::LogisticsMilestone& payload);
  record::Receipt process_batch(const record::ProcessBatch& payload);
  record::Receipt create_sku(const record::CreateSku& payload);
  record::Receipt score_batch(const record::AiScore& payload);


  // ---- COMMIT VERIFICATION ----
  // True when the pair was produced from exactly this payload
  bool verify_commitment(const record::AiScore& payload, const crypto::CommitRevealPair& pair) const;


  // ---- STORAGE PASSTHROUGH ----
  UploadReceipt upload_document(const record::Json& document, bool pin);
  // Throws SerializationError when the stored bytes are not JSON
  record::Json fetch_document(const std::string& cid);
  std::string fetch_raw(const std::string& cid);
  PinReceipt pin(const std::string& cid);
  PinReceipt unpin(const std::string& cid);
  bool is_pinned(const std::string& cid);

private:
  // ---- PARAMETERS ----
  storage::StorageGateway& storage_;
  Clock clock_;
  IdentifierSource did_source_;
  crypto::CommitRevealCodec codec_;


  // ---- STATE MACHINE ----
  template <typename Stage>
  record::Receipt execute(const Stage& stage);

  std::string persist(const std::string& bytes, const char* stage_name);
  void pin_or_fail(const std::string& cid);
};

} // namespace farmtrace::pipeline

#endif // FARMTRACE_PIPELINE_STAGE_PIPELINE_HPP
