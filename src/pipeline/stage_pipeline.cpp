#include "pipeline/stage_pipeline.hpp"
#include "core/errors.hpp"
#include "crypto/entropy.hpp"
#include <chrono>
#include <boost/log/trivial.hpp>

namespace farmtrace::pipeline {

//==============================================
// CONSTRUCTOR
//==============================================

StagePipeline::StagePipeline(storage::StorageGateway& storage)
  : StagePipeline(storage,
                  [] { return std::chrono::system_clock::now(); },
                  [] { return crypto::generate_did("farmer"); }) {}

StagePipeline::StagePipeline(storage::StorageGateway& storage, Clock clock, IdentifierSource did_source)
  : storage_(storage)
  , clock_(std::move(clock))
  , did_source_(std::move(did_source))
  , codec_(crypto::HashFamily::General) {
  BOOST_LOG_TRIVIAL(debug) << "Pipeline: Initialized";
}


//==============================================
// STATE MACHINE
//==============================================

template <typename Stage>
record::Receipt StagePipeline::execute(const Stage& stage) {
  const char* stage_name = record::to_string(Stage::KIND);
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Running stage " << stage_name;

  // Validate: nothing touches storage before this passes
  stage.validate();

  // Pre-hash
  typename Stage::Envelope envelope(stage.payload(), clock_());
  StageContext context{did_source_, codec_};
  stage.pre_hash(envelope, context);

  // Persist
  std::string bytes;
  try {
    bytes = stage.to_json(envelope).dump();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Pipeline: Failed to serialize " << stage_name << " record: " << e.what();
    throw SerializationError(std::string("Failed to serialize record: ") + e.what());
  }
  envelope.bind_content_address(persist(bytes, stage_name));

  // Post-hash
  stage.post_hash(envelope);

  // Pin
  pin_or_fail(*envelope.content_address());

  BOOST_LOG_TRIVIAL(info) << "Pipeline: Stage " << stage_name << " anchored at " << *envelope.content_address();
  return stage.receipt(envelope);
}

std::string StagePipeline::persist(const std::string& bytes, const char* stage_name) {
  storage::UploadResult result = storage_.upload(bytes);
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Stored " << stage_name << " record (" << result.size
                          << " bytes) at " << result.cid;
  return result.cid;
}

void StagePipeline::pin_or_fail(const std::string& cid) {
  try {
    storage_.pin(cid);
  } catch (const Error& e) {
    BOOST_LOG_TRIVIAL(error) << "Pipeline: Failed to pin " << cid << ": " << e.what();
    throw PinFailedError(cid, std::string("Failed to pin ") + cid + ": " + e.what());
  }
}


//==============================================
// STAGE OPERATIONS
//==============================================

record::Receipt StagePipeline::submit(const StageRequest& request) {
  return std::visit([this](const auto& stage) { return execute(stage); }, request);
}

record::Receipt StagePipeline::register_farmer(const record::FarmerRegistration& payload) {
  return execute(RegistrationStage(payload));
}

record::Receipt StagePipeline::record_purchase(const record::FpoPurchase& payload) {
  return execute(PurchaseStage(payload));
}

record::Receipt StagePipeline::update_warehouse(const record::WarehouseUpdate& payload) {
  return execute(WarehouseStage(payload));
}

record::Receipt StagePipeline::record_milestone(const record::LogisticsMilestone& payload) {
  return execute(LogisticsStage(payload));
}

record::Receipt StagePipeline::process_batch(const record::ProcessBatch& payload) {
  return execute(ProcessingStage(payload));
}

record::Receipt StagePipeline::create_sku(const record::CreateSku& payload) {
  return execute(PackagingStage(payload));
}

record::Receipt StagePipeline::score_batch(const record::AiScore& payload) {
  return execute(AiScoreStage(payload));
}


//==============================================
// COMMIT VERIFICATION
//==============================================

bool StagePipeline::verify_commitment(const record::AiScore& payload,
                                      const crypto::CommitRevealPair& pair) const {
  bool valid = codec_.verify(pair, record::canonical_json(payload));
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Commitment for batch " << payload.batch_id
                          << (valid ? " verified" : " did not verify");
  return valid;
}


//==============================================
// STORAGE PASSTHROUGH
//==============================================

UploadReceipt StagePipeline::upload_document(const record::Json& document, bool pin) {
  std::string bytes;
  try {
    bytes = document.dump();
  } catch (const nlohmann::json::exception& e) {
    throw SerializationError(std::string("Failed to serialize document: ") + e.what());
  }

  storage::UploadResult result = storage_.upload(bytes);
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Uploaded document " << result.cid;
  if (pin) {
    pin_or_fail(result.cid);
  }
  return UploadReceipt{result.cid, result.size, pin};
}

record::Json StagePipeline::fetch_document(const std::string& cid) {
  std::string bytes = storage_.fetch(cid);
  try {
    return record::Json::parse(bytes);
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Pipeline: Content " << cid << " is not JSON: " << e.what();
    throw SerializationError("Content " + cid + " is not a JSON document");
  }
}

std::string StagePipeline::fetch_raw(const std::string& cid) {
  return storage_.fetch(cid);
}

PinReceipt StagePipeline::pin(const std::string& cid) {
  storage_.pin(cid);
  return PinReceipt{cid, true};
}

PinReceipt StagePipeline::unpin(const std::string& cid) {
  storage_.unpin(cid);
  return PinReceipt{cid, false};
}

bool StagePipeline::is_pinned(const std::string& cid) {
  return storage_.is_pinned(cid);
}

} // namespace farmtrace::pipeline
