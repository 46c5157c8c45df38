#ifndef FARMTRACE_RECORD_PAYLOADS_HPP
#define FARMTRACE_RECORD_PAYLOADS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "record/canonical.hpp"

namespace farmtrace::record {

// Business payloads for each custody stage. Member order is the field order
// of the persisted JSON record.

struct GpsCoordinates {
  double latitude{0.0};
  double longitude{0.0};
  std::optional<double> altitude;
};

// ---- STAGE 1: FARMER REGISTRATION ----
struct FarmerRegistration {
  std::string farmer_name;
  std::string crop_type;
  double land_area_hectares{0.0};
  std::string location;
  std::optional<GpsCoordinates> gps_coordinates;

  // Off-chain references
  std::optional<std::string> kyc_document_url;
  std::vector<std::string> land_ownership_docs;
  std::optional<std::string> satellite_imagery_url;
  std::optional<std::string> soil_test_report;

  std::optional<std::string> phone_number;
  std::optional<std::string> email;
};

// ---- STAGE 2: FPO PURCHASE ----
struct FpoPurchase {
  std::string farmer_did;
  std::string fpo_name;
  std::string batch_id;
  double quantity_kg{0.0};
  double price_per_kg{0.0};
  std::string quality_grade;

  // Off-chain references
  std::optional<std::string> quality_report_url;
  std::optional<std::string> weight_slip_url;
  std::vector<std::string> photos;
  std::optional<double> moisture_content;
  std::optional<double> impurity_percentage;
  std::optional<std::string> payment_reference;
};

// ---- STAGE 3: WAREHOUSE STORAGE ----
struct PestInspection {
  Timestamp inspected_at;
  bool pest_found{false};
  std::optional<std::string> pest_type;
  std::optional<std::string> treatment_applied;
};

struct WarehouseUpdate {
  std::string warehouse_id;
  std::string batch_id;
  std::string storage_location;

  // IoT sensor readings
  std::optional<double> temperature_celsius;
  std::optional<double> humidity_percentage;
  std::optional<double> co2_level_ppm;

  std::optional<std::string> iot_logs_url;
  std::vector<std::string> inspection_reports;

  std::optional<PestInspection> pest_inspection;
  std::optional<double> quality_degradation;  // percentage
};

// ---- STAGE 4: LOGISTICS ----
enum class MilestoneType {
  PickedUp,
  InTransit,
  AtCheckpoint,
  Delivered,
  Delayed,
  Incident
};

struct ShockEvent {
  Timestamp timestamp;
  double g_force{0.0};
  std::optional<GpsCoordinates> location;
};

struct LogisticsMilestone {
  std::string shipment_id;
  std::string current_location;
  GpsCoordinates gps_coordinates;
  MilestoneType milestone_type{MilestoneType::PickedUp};

  std::optional<std::string> gps_history_url;

  std::string carrier_name;
  std::string vehicle_id;
  std::optional<std::string> driver_name;

  std::optional<std::string> temperature_log;
  std::vector<ShockEvent> shock_events;

  std::optional<Timestamp> estimated_arrival;
  bool is_delivered{false};
};

// ---- STAGE 5: PROCESSING ----
enum class ProcessingType {
  Cleaning,
  Drying,
  Milling,
  Extraction,
  Refining,
  Blending
};

struct ProcessingParameters {
  std::optional<double> temperature_celsius;
  std::optional<double> pressure_bar;
  std::optional<uint32_t> duration_minutes;
  std::string method;
};

struct ProcessBatch {
  std::string input_batch_id;
  std::string processor_name;
  ProcessingType processing_type{ProcessingType::Cleaning};

  double input_quantity_kg{0.0};
  double output_quantity_kg{0.0};

  double yield_percentage{0.0};
  double waste_percentage{0.0};

  std::vector<std::string> lab_results_url;
  std::vector<std::string> certifications;

  // Outputs produced by splitting or transforming the input batch
  std::vector<std::string> output_batch_ids;

  std::optional<ProcessingParameters> processing_parameters;
};

// ---- STAGE 6: PACKAGING ----
struct CreateSku {
  std::string sku_id;
  std::string parent_batch_id;
  std::string product_name;

  std::string brand;
  double unit_weight_grams{0.0};
  uint32_t units_packaged{0};

  std::string package_type;
  std::optional<std::string> barcode;
  std::optional<std::string> qr_code;

  std::optional<std::string> nutritional_info_url;
  std::vector<std::string> regulatory_certifications;

  std::vector<std::string> label_images;
  std::optional<Timestamp> expiry_date;
  std::optional<Timestamp> best_before_date;

  // Leaves for batch verification; the SKU id alone when absent
  std::optional<std::vector<std::string>> merkle_proof;
};

// ---- STAGE 7: AI SCORING ----
struct AiScore {
  std::string batch_id;

  double quality_score{0.0};  // 0.0 to 100.0
  double sustainability_score{0.0};
  double traceability_score{0.0};

  std::string model_name;
  std::string model_version;

  // Free-form model inputs and outputs; object keys are kept sorted
  nlohmann::json features;
  nlohmann::json predictions;
  double confidence{0.0};

  std::optional<std::string> model_artifacts_url;
  std::optional<std::string> training_data_hash;
};


// ---- ENUM NAMES ----
// snake_case names used on the wire
const char* to_string(MilestoneType type);
const char* to_string(ProcessingType type);
MilestoneType milestone_type_from_string(const std::string& name);
ProcessingType processing_type_from_string(const std::string& name);
// Capitalized variant name used in the transform hash ("Milling")
const char* debug_name(ProcessingType type);


// ---- VALIDATION ----
// Throw ValidationError naming the first offending field
void validate(const FarmerRegistration& payload);
void validate(const FpoPurchase& payload);
void validate(const WarehouseUpdate& payload);
void validate(const LogisticsMilestone& payload);
void validate(const ProcessBatch& payload);
void validate(const CreateSku& payload);
void validate(const AiScore& payload);

} // namespace farmtrace::record

#endif // FARMTRACE_RECORD_PAYLOADS_HPP
