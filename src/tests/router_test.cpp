#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/errors.hpp"
#include "service/router.hpp"
#include "storage/local_store.hpp"
#include "test_utils.hpp"

using namespace farmtrace;
using namespace farmtrace::service;
using record::Json;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

class RouterTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
    test_dir = test::make_temp_dir("router_test_");
    store = std::make_unique<storage::LocalStore>(test_dir.string());
    pipeline = std::make_unique<pipeline::StagePipeline>(*store);
    router = std::make_unique<Router>(*pipeline);
  }

  void TearDown() override {
    router.reset();
    pipeline.reset();
    store.reset();
    std::filesystem::remove_all(test_dir);
  }

  Json post(const std::string& path, const Json& body, unsigned expected_status) {
    HttpResponse response = router->handle("POST", path, body.dump());
    EXPECT_EQ(response.status, expected_status) << response.body;
    return Json::parse(response.body);
  }

  std::filesystem::path test_dir;
  std::unique_ptr<storage::LocalStore> store;
  std::unique_ptr<pipeline::StagePipeline> pipeline;
  std::unique_ptr<Router> router;
};

TEST_F(RouterTest, Health) {
  HttpResponse response = router->handle("GET", "/health", "");
  EXPECT_EQ(response.status, 200u);
  Json body = Json::parse(response.body);
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_EQ(body["service"], "farmtrace-anchor");
  EXPECT_EQ(body["version"], FARMTRACE_VERSION);
}

TEST_F(RouterTest, RegisterFarmerAnchorsAndPins) {
  Json body = post("/api/v1/farmer/register", Json(test::sample_registration()), 201);

  ASSERT_TRUE(body["ipfs_cid"].is_string());
  const std::string cid = body["ipfs_cid"].get<std::string>();
  EXPECT_TRUE(store->is_pinned(cid));
  EXPECT_EQ(body["farmer_did"].get<std::string>().rfind("did:farmer:", 0), 0u);

  Json stored = Json::parse(store->fetch(cid));
  EXPECT_EQ(stored["crop_id_hash"], body["crop_id_hash"]);
}

TEST_F(RouterTest, EveryStageRouteAnswersCreated) {
  post("/api/v1/fpo/purchase", Json(test::sample_purchase()), 201);
  post("/api/v1/warehouse/update", Json(test::sample_warehouse()), 201);
  post("/api/v1/logistics/milestone", Json(test::sample_milestone()), 201);
  Json processed = post("/api/v1/processing/batch", Json(test::sample_process_batch()), 201);
  EXPECT_EQ(processed["output_batch_hashes"].size(), 2u);
  Json sku = post("/api/v1/packaging/sku", Json(test::sample_sku()), 201);
  EXPECT_EQ(sku["merkle_root"], "SKU1");
}

TEST_F(RouterTest, ScoreThenVerify) {
  Json payload = test::sample_score();
  Json receipt = post("/api/v1/ai/score", payload, 201);

  Json request = {
    {"payload", payload},
    {"nonce", receipt["nonce"]},
    {"reveal_hash", receipt["reveal_hash"]},
    {"commit_hash", receipt["commit_hash"]}
  };
  Json verdict = post("/api/v1/ai/verify", request, 200);
  EXPECT_EQ(verdict["batch_id"], "BATCH-001");
  EXPECT_EQ(verdict["valid"], true);

  request["payload"]["quality_score"] = 1.0;
  EXPECT_EQ(post("/api/v1/ai/verify", request, 200)["valid"], false);
}

TEST_F(RouterTest, ValidationErrorsAre400) {
  record::FpoPurchase purchase = test::sample_purchase();
  purchase.farmer_did.clear();
  Json body = post("/api/v1/fpo/purchase", Json(purchase), 400);
  EXPECT_EQ(body["error"], "validation");

  HttpResponse malformed = router->handle("POST", "/api/v1/fpo/purchase", "{not json");
  EXPECT_EQ(malformed.status, 400u);
}

TEST_F(RouterTest, UnknownRouteIs404) {
  EXPECT_EQ(router->handle("GET", "/api/v1/nothing", "").status, 404u);
  EXPECT_EQ(router->handle("DELETE", "/health", "").status, 404u);
}

TEST_F(RouterTest, NonUtf8PathStillGetsJsonError) {
  HttpResponse response;
  EXPECT_NO_THROW(response = router->handle("GET", std::string("/\xff"), ""));
  EXPECT_EQ(response.status, 404u);
  Json body = Json::parse(response.body);
  EXPECT_EQ(body["error"], "not_found");

  EXPECT_NO_THROW(response = router->handle("GET", std::string("/api/v1/ipfs/get/Qm\xfe\xff"), ""));
  EXPECT_EQ(response.status, 400u);
  EXPECT_NO_THROW(static_cast<void>(Json::parse(response.body)));
}

TEST_F(RouterTest, UploadGetPinCycle) {
  Json uploaded = post("/api/v1/ipfs/upload", Json::parse(R"({"data":{"k":"v"},"pin":false})"), 201);
  const std::string cid = uploaded["cid"].get<std::string>();
  EXPECT_EQ(uploaded["pinned"], false);

  HttpResponse fetched = router->handle("GET", "/api/v1/ipfs/get/" + cid, "");
  EXPECT_EQ(fetched.status, 200u);
  EXPECT_EQ(Json::parse(fetched.body)["data"]["k"], "v");

  EXPECT_EQ(post("/api/v1/ipfs/pin/" + cid, Json::object(), 200)["pinned"], true);
  EXPECT_EQ(Json::parse(router->handle("GET", "/api/v1/ipfs/pinned/" + cid, "").body)["pinned"], true);
  EXPECT_EQ(post("/api/v1/ipfs/unpin/" + cid, Json::object(), 200)["pinned"], false);
  // Second unpin has nothing to remove
  post("/api/v1/ipfs/unpin/" + cid, Json::object(), 404);
}

TEST_F(RouterTest, UploadRequiresPinFlag) {
  post("/api/v1/ipfs/upload", Json{{"data", 1}}, 400);
}

TEST_F(RouterTest, QueryStringIgnored) {
  EXPECT_EQ(router->handle("GET", "/health?verbose=1", "").status, 200u);
}

TEST(RouterErrorMappingTest, StatusCodes) {
  EXPECT_EQ(Router::status_for(ValidationError("x")), 400u);
  EXPECT_EQ(Router::status_for(StorageUnavailableError("x")), 503u);
  EXPECT_EQ(Router::status_for(PinFailedError("cid", "x")), 502u);
  EXPECT_EQ(Router::status_for(NotFoundError("x")), 404u);
  EXPECT_EQ(Router::status_for(SerializationError("x")), 500u);
  EXPECT_EQ(Router::status_for(std::runtime_error("x")), 500u);
}

TEST(RouterErrorMappingTest, InternalDetailsAreHidden) {
  Json body = Json::parse(Router::error_response(std::runtime_error("secret path /etc")).body);
  EXPECT_EQ(body["error"], "internal");
  EXPECT_EQ(body["message"], "Internal server error");
}

TEST(RouterErrorMappingTest, PinFailureReportsCid) {
  HttpResponse response = Router::error_response(PinFailedError("QmX", "pin service down"));
  EXPECT_EQ(response.status, 502u);
  Json body = Json::parse(response.body);
  EXPECT_EQ(body["error"], "pin_failed");
  EXPECT_EQ(body["cid"], "QmX");
}

TEST(RouterStorageFailureTest, StorageOutageIs503) {
  test::init_test_logging();
  NiceMock<test::MockStorageGateway> storage;
  ON_CALL(storage, upload(_)).WillByDefault(Throw(StorageUnavailableError("IPFS down")));
  pipeline::StagePipeline pipeline(storage);
  Router router(pipeline);

  HttpResponse response = router.handle("POST", "/api/v1/warehouse/update",
                                        Json(test::sample_warehouse()).dump());
  EXPECT_EQ(response.status, 503u);
  EXPECT_EQ(Json::parse(response.body)["error"], "storage_unavailable");
}
