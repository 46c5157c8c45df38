#include <gtest/gtest.h>
#include <limits>
#include "core/errors.hpp"
#include "record/payload_json.hpp"
#include "test_utils.hpp"

using namespace farmtrace;
using namespace farmtrace::record;

TEST(PayloadJsonTest, DecodeRegistrationWithDefaults) {
  Json j = Json::parse(R"({
    "farmer_name": "Asha", "crop_type": "wheat",
    "land_area_hectares": 2.5, "location": "Nashik"
  })");

  FarmerRegistration payload = j.get<FarmerRegistration>();
  EXPECT_EQ(payload.farmer_name, "Asha");
  EXPECT_DOUBLE_EQ(payload.land_area_hectares, 2.5);
  EXPECT_FALSE(payload.gps_coordinates);
  EXPECT_TRUE(payload.land_ownership_docs.empty());
  EXPECT_FALSE(payload.email);
}

TEST(PayloadJsonTest, MissingRequiredFieldIsValidationError) {
  Json j = Json::parse(R"({"farmer_name": "Asha", "land_area_hectares": 2.5, "location": "Nashik"})");
  try {
    j.get<FarmerRegistration>();
    FAIL() << "Expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_NE(std::string(e.what()).find("crop_type"), std::string::npos);
  }
}

TEST(PayloadJsonTest, WrongTypeIsValidationError) {
  Json j = Json::parse(R"({
    "farmer_name": "Asha", "crop_type": "wheat",
    "land_area_hectares": "big", "location": "Nashik"
  })");
  EXPECT_THROW(j.get<FarmerRegistration>(), ValidationError);
}

TEST(PayloadJsonTest, EnumsUseSnakeCase) {
  Json j = test::sample_milestone();
  EXPECT_EQ(j["milestone_type"], "in_transit");

  j["milestone_type"] = "at_checkpoint";
  EXPECT_EQ(j.get<LogisticsMilestone>().milestone_type, MilestoneType::AtCheckpoint);

  j["milestone_type"] = "teleported";
  EXPECT_THROW(j.get<LogisticsMilestone>(), ValidationError);
}

TEST(PayloadJsonTest, EncodeKeepsDeclarationOrderAndNulls) {
  Json j = test::sample_purchase();
  std::vector<std::string> keys;
  for (auto it = j.begin(); it != j.end(); ++it) {
    keys.push_back(it.key());
  }
  ASSERT_GE(keys.size(), 3u);
  EXPECT_EQ(keys[0], "farmer_did");
  EXPECT_EQ(keys[1], "fpo_name");
  EXPECT_EQ(keys[2], "batch_id");
  EXPECT_TRUE(j["quality_report_url"].is_null());
  EXPECT_TRUE(j["photos"].is_array());
}

TEST(PayloadJsonTest, TimestampsRoundTripAsRfc3339) {
  Json j = Json::parse(R"({
    "timestamp": "2024-05-01T10:20:30Z", "g_force": 3.5, "location": null
  })");
  ShockEvent event = j.get<ShockEvent>();
  EXPECT_EQ(event.timestamp, test::fixed_time());
  EXPECT_EQ(Json(event)["timestamp"], "2024-05-01T10:20:30Z");

  j["timestamp"] = "yesterday";
  EXPECT_THROW(j.get<ShockEvent>(), ValidationError);
}

TEST(PayloadJsonTest, UnitsPackagedMustFitU32) {
  Json j = test::sample_sku();
  j["units_packaged"] = -1;
  EXPECT_THROW(j.get<CreateSku>(), ValidationError);
  j["units_packaged"] = 4294967296ULL;
  EXPECT_THROW(j.get<CreateSku>(), ValidationError);
  j["units_packaged"] = 12;
  EXPECT_EQ(j.get<CreateSku>().units_packaged, 12u);
}

TEST(PayloadJsonTest, CanonicalJsonSortsFreeFormKeys) {
  AiScore score = test::sample_score();
  std::string canonical = canonical_json(score);
  EXPECT_NE(canonical.find(R"("features":{"color":"golden","moisture":11.2})"), std::string::npos);
  EXPECT_EQ(canonical.rfind(R"({"batch_id":"BATCH-001")", 0), 0u);
}

TEST(PayloadJsonTest, CanonicalJsonIsStableAcrossDecode) {
  AiScore score = test::sample_score();
  AiScore decoded = Json::parse(canonical_json(score)).get<AiScore>();
  EXPECT_EQ(canonical_json(decoded), canonical_json(score));
}

TEST(PayloadValidationTest, EmptyIdentifiersRejected) {
  FpoPurchase purchase = test::sample_purchase();
  purchase.fpo_name.clear();
  EXPECT_THROW(validate(purchase), ValidationError);

  WarehouseUpdate warehouse = test::sample_warehouse();
  warehouse.warehouse_id.clear();
  EXPECT_THROW(validate(warehouse), ValidationError);
}

TEST(PayloadValidationTest, NonFiniteNumbersRejected) {
  AiScore score = test::sample_score();
  score.confidence = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(validate(score), ValidationError);

  LogisticsMilestone milestone = test::sample_milestone();
  milestone.gps_coordinates.latitude = std::numeric_limits<double>::infinity();
  EXPECT_THROW(validate(milestone), ValidationError);
}

TEST(PayloadValidationTest, SamplesAreValid) {
  EXPECT_NO_THROW(validate(test::sample_registration()));
  EXPECT_NO_THROW(validate(test::sample_purchase()));
  EXPECT_NO_THROW(validate(test::sample_warehouse()));
  EXPECT_NO_THROW(validate(test::sample_milestone()));
  EXPECT_NO_THROW(validate(test::sample_process_batch()));
  EXPECT_NO_THROW(validate(test::sample_sku()));
  EXPECT_NO_THROW(validate(test::sample_score()));
}

TEST(PayloadNamesTest, ProcessingTypeNames) {
  EXPECT_STREQ(to_string(ProcessingType::Milling), "milling");
  EXPECT_STREQ(debug_name(ProcessingType::Milling), "Milling");
  EXPECT_EQ(processing_type_from_string("refining"), ProcessingType::Refining);
  EXPECT_THROW(processing_type_from_string("Refining"), ValidationError);
}
