#ifndef FARMTRACE_TEST_UTILS_HPP
#define FARMTRACE_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <gmock/gmock.h>
#include "logger/logger.hpp"
#include "record/canonical.hpp"
#include "record/payloads.hpp"
#include "storage/storage_gateway.hpp"

namespace farmtrace::test {

// Quiet console logging for test runs
inline void init_test_logging() {
  logger::init_logging("", logger::severity_level::warning);
}

class MockStorageGateway : public storage::StorageGateway {
public:
  MOCK_METHOD(storage::UploadResult, upload, (const std::string& bytes), (override));
  MOCK_METHOD(std::string, fetch, (const std::string& cid), (override));
  MOCK_METHOD(void, pin, (const std::string& cid), (override));
  MOCK_METHOD(void, unpin, (const std::string& cid), (override));
  MOCK_METHOD(bool, is_pinned, (const std::string& cid), (override));
};

inline record::Timestamp fixed_time() {
  return record::parse_timestamp_rfc3339("2024-05-01T10:20:30Z");
}

inline std::filesystem::path make_temp_dir(const std::string& prefix) {
  auto dir = std::filesystem::temp_directory_path() /
    (prefix + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);
  return dir;
}

// ---- SAMPLE PAYLOADS ----

inline record::FarmerRegistration sample_registration() {
  record::FarmerRegistration payload;
  payload.farmer_name = "Asha Patil";
  payload.crop_type = "wheat";
  payload.land_area_hectares = 2.5;
  payload.location = "Nashik";
  return payload;
}

inline record::FpoPurchase sample_purchase() {
  record::FpoPurchase payload;
  payload.farmer_did = "did:farmer:1234";
  payload.fpo_name = "Green Valley FPO";
  payload.batch_id = "BATCH-001";
  payload.quantity_kg = 100;
  payload.price_per_kg = 22.5;
  payload.quality_grade = "A";
  return payload;
}

inline record::WarehouseUpdate sample_warehouse() {
  record::WarehouseUpdate payload;
  payload.warehouse_id = "WH-7";
  payload.batch_id = "BATCH-001";
  payload.storage_location = "Bay 3";
  payload.temperature_celsius = 22.0;
  return payload;
}

inline record::LogisticsMilestone sample_milestone() {
  record::LogisticsMilestone payload;
  payload.shipment_id = "SHIP-9";
  payload.current_location = "Pune";
  payload.gps_coordinates = record::GpsCoordinates{18.52, 73.85, std::nullopt};
  payload.milestone_type = record::MilestoneType::InTransit;
  payload.carrier_name = "RoadCo";
  payload.vehicle_id = "MH12AB1234";
  return payload;
}

inline record::ProcessBatch sample_process_batch() {
  record::ProcessBatch payload;
  payload.input_batch_id = "BATCH-001";
  payload.processor_name = "Mill One";
  payload.processing_type = record::ProcessingType::Milling;
  payload.input_quantity_kg = 100;
  payload.output_quantity_kg = 90;
  payload.yield_percentage = 90;
  payload.waste_percentage = 10;
  payload.output_batch_ids = {"OUT-1", "OUT-2"};
  return payload;
}

inline record::CreateSku sample_sku() {
  record::CreateSku payload;
  payload.sku_id = "SKU1";
  payload.parent_batch_id = "OUT-1";
  payload.product_name = "Atta";
  payload.brand = "FarmFresh";
  payload.unit_weight_grams = 1000;
  payload.units_packaged = 90;
  payload.package_type = "pouch";
  return payload;
}

inline record::AiScore sample_score() {
  record::AiScore payload;
  payload.batch_id = "BATCH-001";
  payload.quality_score = 91.5;
  payload.sustainability_score = 80;
  payload.traceability_score = 99;
  payload.model_name = "grader";
  payload.model_version = "1.2.0";
  payload.features = nlohmann::json{{"moisture", 11.2}, {"color", "golden"}};
  payload.predictions = nlohmann::json{{"grade", "A"}};
  payload.confidence = 0.93;
  return payload;
}

} // namespace farmtrace::test

#endif // FARMTRACE_TEST_UTILS_HPP
