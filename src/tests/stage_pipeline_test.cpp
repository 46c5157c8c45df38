#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <vector>
#include "core/errors.hpp"
#include "crypto/merkle.hpp"
#include "pipeline/stage_pipeline.hpp"
#include "test_utils.hpp"

using namespace farmtrace;
using namespace farmtrace::pipeline;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Throw;

class StagePipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
    // Content address is the digest of the stored bytes, like a real CAS
    ON_CALL(storage, upload(_)).WillByDefault(Invoke([this](const std::string& bytes) {
      uploads.push_back(bytes);
      return storage::UploadResult{crypto::general_hash(bytes).text.substr(2), bytes.size()};
    }));
    pipeline = std::make_unique<StagePipeline>(
      storage,
      [] { return test::fixed_time(); },
      [] { return std::string("did:farmer:fixed"); });
  }

  record::Json last_upload() const {
    return record::Json::parse(uploads.back());
  }

  NiceMock<test::MockStorageGateway> storage;
  std::unique_ptr<StagePipeline> pipeline;
  std::vector<std::string> uploads;
};

//==============================================
// DETERMINISM
//==============================================

TEST_F(StagePipelineTest, RegistrationIsDeterministic) {
  record::Receipt first = pipeline->register_farmer(test::sample_registration());
  record::Receipt second = pipeline->register_farmer(test::sample_registration());

  const std::string expected = crypto::solidity_hash("did:farmer:fixed-wheat-2024-05-01 10:20:30 UTC").text;
  EXPECT_EQ(first.digest("crop_id_hash").text, expected);
  EXPECT_EQ(second.digest("crop_id_hash"), first.digest("crop_id_hash"));
  EXPECT_EQ(first.identifier("farmer_did"), "did:farmer:fixed");
  EXPECT_EQ(first.content_address(), second.content_address());
}

TEST_F(StagePipelineTest, RegistrationRecordLayout) {
  record::Receipt receipt = pipeline->register_farmer(test::sample_registration());
  record::Json stored = last_upload();

  EXPECT_EQ(stored["farmer_did"], "did:farmer:fixed");
  EXPECT_EQ(stored["registration_data"]["farmer_name"], "Asha Patil");
  EXPECT_EQ(stored["registered_at"], "2024-05-01T10:20:30Z");
  EXPECT_TRUE(stored["ipfs_cid"].is_null());
  EXPECT_EQ(stored["crop_id_hash"], receipt.digest("crop_id_hash").text);

  record::Json body = receipt.to_json();
  EXPECT_EQ(body["ipfs_cid"], receipt.content_address());
  EXPECT_EQ(body["registered_at"], "2024-05-01T10:20:30Z");
}

TEST_F(StagePipelineTest, PurchaseHashUsesShortestNumber) {
  record::Receipt receipt = pipeline->record_purchase(test::sample_purchase());
  EXPECT_EQ(receipt.digest("batch_hash").text,
            crypto::solidity_hash("did:farmer:1234-BATCH-001-100-Green Valley FPO").text);
  EXPECT_EQ(receipt.identifier("batch_id"), "BATCH-001");
}

TEST_F(StagePipelineTest, LogisticsLocationHash) {
  record::Receipt receipt = pipeline->record_milestone(test::sample_milestone());
  EXPECT_EQ(receipt.digest("location_hash").text,
            crypto::solidity_hash("SHIP-9-Pune-18.52-73.85").text);
  EXPECT_EQ(last_upload()["milestone_data"]["milestone_type"], "in_transit");
}

TEST_F(StagePipelineTest, ProcessingHashes) {
  record::Receipt receipt = pipeline->process_batch(test::sample_process_batch());

  EXPECT_EQ(receipt.digest("input_batch_hash").text,
            crypto::solidity_hash("BATCH-001-Mill One-100").text);
  EXPECT_EQ(receipt.digest("transform_hash").text,
            crypto::solidity_hash("Milling-90-10").text);

  const auto& outputs = receipt.digest_list("output_batch_hashes");
  ASSERT_EQ(outputs.size(), 2u);
  EXPECT_EQ(outputs[0].text, crypto::solidity_hash("OUT-1-90").text);
  EXPECT_EQ(outputs[1].text, crypto::solidity_hash("OUT-2-90").text);
}

//==============================================
// WAREHOUSE POST-HASH
//==============================================

TEST_F(StagePipelineTest, WarehouseStateHashCoversContentAddress) {
  record::Receipt receipt = pipeline->update_warehouse(test::sample_warehouse());

  // Persisted before the state hash exists
  EXPECT_TRUE(last_upload()["state_hash"].is_null());
  const std::string expected_input = "WH-7-BATCH-001-Some(22.0)-None-" + receipt.content_address();
  EXPECT_EQ(receipt.digest("state_hash").text, crypto::solidity_hash(expected_input).text);
}

TEST_F(StagePipelineTest, WarehouseStateHashChangesWithContentAddress) {
  record::Receipt first = pipeline->update_warehouse(test::sample_warehouse());

  EXPECT_CALL(storage, upload(_)).WillOnce(
    Invoke([](const std::string& bytes) { return storage::UploadResult{"other-cid", bytes.size()}; }));
  record::Receipt second = pipeline->update_warehouse(test::sample_warehouse());

  EXPECT_NE(first.digest("state_hash"), second.digest("state_hash"));
}

TEST_F(StagePipelineTest, WarehouseUploadFailureYieldsNoReceipt) {
  EXPECT_CALL(storage, upload(_)).WillOnce(Throw(StorageUnavailableError("IPFS down")));
  EXPECT_CALL(storage, pin(_)).Times(0);

  EXPECT_THROW(pipeline->update_warehouse(test::sample_warehouse()), StorageUnavailableError);
}

//==============================================
// PACKAGING
//==============================================

TEST_F(StagePipelineTest, SkuMerkleRootOverProof) {
  record::CreateSku payload = test::sample_sku();
  payload.merkle_proof = std::vector<std::string>{"leaf1", "leaf2", "leaf3"};

  record::Receipt receipt = pipeline->create_sku(payload);
  const std::string h12 = crypto::general_hash("leaf1leaf2").text;
  const std::string h33 = crypto::general_hash("leaf3leaf3").text;
  EXPECT_EQ(receipt.digest("merkle_root").text, crypto::general_hash(h12 + h33).text);
  EXPECT_EQ(receipt.digest("parent_batch_hash").text, crypto::solidity_hash("OUT-1-Atta").text);
}

TEST_F(StagePipelineTest, SkuWithoutProofUsesSkuId) {
  record::Receipt receipt = pipeline->create_sku(test::sample_sku());
  EXPECT_EQ(receipt.digest("merkle_root").text, "SKU1");
}

//==============================================
// AI SCORE COMMITMENT
//==============================================

TEST_F(StagePipelineTest, ScoreCommitmentVerifies) {
  record::AiScore payload = test::sample_score();
  record::Receipt receipt = pipeline->score_batch(payload);

  ASSERT_TRUE(receipt.commitment());
  EXPECT_TRUE(pipeline->verify_commitment(payload, *receipt.commitment()));

  record::AiScore mutated = payload;
  mutated.quality_score = 12.0;
  EXPECT_FALSE(pipeline->verify_commitment(mutated, *receipt.commitment()));

  record::Json stored = last_upload();
  EXPECT_EQ(stored["commit_hash"], receipt.commitment()->commit_hash.text);
  EXPECT_EQ(stored["nonce"], receipt.commitment()->nonce);

  record::Json body = receipt.to_json();
  EXPECT_EQ(body["batch_hash"], crypto::solidity_hash("BATCH-001-grader").text);
  EXPECT_EQ(body["reveal_hash"], receipt.commitment()->reveal_hash.text);
}

//==============================================
// FAILURE PATHS
//==============================================

TEST_F(StagePipelineTest, ValidationFailureTouchesNoStorage) {
  EXPECT_CALL(storage, upload(_)).Times(0);
  EXPECT_CALL(storage, pin(_)).Times(0);

  record::FpoPurchase payload = test::sample_purchase();
  payload.farmer_did.clear();
  EXPECT_THROW(pipeline->record_purchase(payload), ValidationError);
}

TEST_F(StagePipelineTest, PinFailureCarriesContentAddress) {
  EXPECT_CALL(storage, pin(_)).WillOnce(Throw(StorageUnavailableError("pin service down")));

  try {
    pipeline->record_purchase(test::sample_purchase());
    FAIL() << "Expected PinFailedError";
  } catch (const PinFailedError& e) {
    ASSERT_FALSE(uploads.empty());
    EXPECT_EQ(e.content_address(), crypto::general_hash(uploads.back()).text.substr(2));
  }
}

TEST_F(StagePipelineTest, SubmitDispatchesByStage) {
  record::Receipt receipt = pipeline->submit(LogisticsStage(test::sample_milestone()));
  EXPECT_EQ(receipt.kind(), record::StageKind::Logistics);
  EXPECT_EQ(receipt.timestamp_field(), "recorded_at");
}

//==============================================
// STORAGE PASSTHROUGH
//==============================================

TEST_F(StagePipelineTest, UploadDocumentPinsOnRequest) {
  EXPECT_CALL(storage, pin(_)).Times(1);
  UploadReceipt pinned = pipeline->upload_document(record::Json{{"a", 1}}, true);
  EXPECT_TRUE(pinned.pinned);

  UploadReceipt unpinned = pipeline->upload_document(record::Json{{"a", 2}}, false);
  EXPECT_FALSE(unpinned.pinned);
  EXPECT_EQ(uploads.back(), R"({"a":2})");
}

TEST_F(StagePipelineTest, FetchDocumentRejectsNonJson) {
  EXPECT_CALL(storage, fetch("cid")).WillOnce(::testing::Return(std::string("not json")));
  EXPECT_THROW(pipeline->fetch_document("cid"), SerializationError);
}
