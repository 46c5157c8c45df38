#include "record/payload_json.hpp"
#include "core/errors.hpp"
#include <limits>
#include <stdexcept>

namespace farmtrace::record {

namespace {

//==============================================
// ENCODING HELPERS
//==============================================

Json encode_timestamp(const Timestamp& ts) {
  return format_timestamp_rfc3339(ts);
}

template <typename T>
Json encode_optional(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  return Json(*value);
}

Json encode_optional_timestamp(const std::optional<Timestamp>& value) {
  if (!value) {
    return nullptr;
  }
  return encode_timestamp(*value);
}

Json encode_free_form(const nlohmann::json& value) {
  // Re-parse so object keys keep the sorted order of the source value
  return Json::parse(value.dump());
}


//==============================================
// DECODING HELPERS
//==============================================

const Json& require_field(const Json& j, const char* key) {
  if (!j.is_object()) {
    throw ValidationError("expected a JSON object");
  }
  auto it = j.find(key);
  if (it == j.end()) {
    throw ValidationError(std::string("missing field `") + key + "`");
  }
  return *it;
}

bool is_absent(const Json& j, const char* key) {
  auto it = j.find(key);
  return it == j.end() || it->is_null();
}

[[noreturn]] void type_mismatch(const char* key, const char* expected) {
  throw ValidationError(std::string(key) + ": invalid type, expected " + expected);
}

std::string decode_string(const Json& value, const char* key) {
  if (!value.is_string()) {
    type_mismatch(key, "a string");
  }
  return value.get<std::string>();
}

double decode_number(const Json& value, const char* key) {
  if (!value.is_number()) {
    type_mismatch(key, "a number");
  }
  return value.get<double>();
}

bool decode_bool(const Json& value, const char* key) {
  if (!value.is_boolean()) {
    type_mismatch(key, "a boolean");
  }
  return value.get<bool>();
}

uint32_t decode_u32(const Json& value, const char* key) {
  if (value.is_number_unsigned()) {
    auto raw = value.get<uint64_t>();
    if (raw <= std::numeric_limits<uint32_t>::max()) {
      return static_cast<uint32_t>(raw);
    }
  } else if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    auto raw = value.get<int64_t>();
    if (raw <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
      return static_cast<uint32_t>(raw);
    }
  }
  type_mismatch(key, "an unsigned 32-bit integer");
}

Timestamp decode_timestamp(const Json& value, const char* key) {
  std::string text = decode_string(value, key);
  try {
    return parse_timestamp_rfc3339(text);
  } catch (const std::invalid_argument& e) {
    throw ValidationError(std::string(key) + ": " + e.what());
  }
}

template <typename T>
T decode_nested(const Json& value, const char* key) {
  if (!value.is_object()) {
    type_mismatch(key, "an object");
  }
  T out{};
  from_json(value, out);
  return out;
}

std::vector<std::string> decode_string_list(const Json& value, const char* key) {
  if (!value.is_array()) {
    type_mismatch(key, "an array of strings");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& item : value) {
    out.push_back(decode_string(item, key));
  }
  return out;
}

std::string read_string(const Json& j, const char* key) {
  return decode_string(require_field(j, key), key);
}

double read_number(const Json& j, const char* key) {
  return decode_number(require_field(j, key), key);
}

bool read_bool(const Json& j, const char* key) {
  return decode_bool(require_field(j, key), key);
}

std::optional<std::string> read_optional_string(const Json& j, const char* key) {
  if (is_absent(j, key)) {
    return std::nullopt;
  }
  return decode_string(j.at(key), key);
}

std::optional<double> read_optional_number(const Json& j, const char* key) {
  if (is_absent(j, key)) {
    return std::nullopt;
  }
  return decode_number(j.at(key), key);
}

std::optional<Timestamp> read_optional_timestamp(const Json& j, const char* key) {
  if (is_absent(j, key)) {
    return std::nullopt;
  }
  return decode_timestamp(j.at(key), key);
}

template <typename T>
std::optional<T> read_optional_nested(const Json& j, const char* key) {
  if (is_absent(j, key)) {
    return std::nullopt;
  }
  return decode_nested<T>(j.at(key), key);
}

std::vector<std::string> read_string_list(const Json& j, const char* key) {
  if (is_absent(j, key)) {
    return {};
  }
  return decode_string_list(j.at(key), key);
}

nlohmann::json read_free_form(const Json& j, const char* key) {
  // Sorted keys, matching the record's canonical form
  return nlohmann::json::parse(require_field(j, key).dump());
}

void require_object(const Json& j) {
  if (!j.is_object()) {
    throw ValidationError("expected a JSON object");
  }
}

} // namespace

//==============================================
// NESTED TYPES
//==============================================

void to_json(Json& j, const GpsCoordinates& value) {
  j = Json::object();
  j["latitude"] = value.latitude;
  j["longitude"] = value.longitude;
  j["altitude"] = encode_optional(value.altitude);
}

void from_json(const Json& j, GpsCoordinates& value) {
  require_object(j);
  value.latitude = read_number(j, "latitude");
  value.longitude = read_number(j, "longitude");
  value.altitude = read_optional_number(j, "altitude");
}

void to_json(Json& j, const PestInspection& value) {
  j = Json::object();
  j["inspected_at"] = encode_timestamp(value.inspected_at);
  j["pest_found"] = value.pest_found;
  j["pest_type"] = encode_optional(value.pest_type);
  j["treatment_applied"] = encode_optional(value.treatment_applied);
}

void from_json(const Json& j, PestInspection& value) {
  require_object(j);
  value.inspected_at = decode_timestamp(require_field(j, "inspected_at"), "inspected_at");
  value.pest_found = read_bool(j, "pest_found");
  value.pest_type = read_optional_string(j, "pest_type");
  value.treatment_applied = read_optional_string(j, "treatment_applied");
}

void to_json(Json& j, const ShockEvent& value) {
  j = Json::object();
  j["timestamp"] = encode_timestamp(value.timestamp);
  j["g_force"] = value.g_force;
  j["location"] = encode_optional(value.location);
}

void from_json(const Json& j, ShockEvent& value) {
  require_object(j);
  value.timestamp = decode_timestamp(require_field(j, "timestamp"), "timestamp");
  value.g_force = read_number(j, "g_force");
  value.location = read_optional_nested<GpsCoordinates>(j, "location");
}

void to_json(Json& j, const ProcessingParameters& value) {
  j = Json::object();
  j["temperature_celsius"] = encode_optional(value.temperature_celsius);
  j["pressure_bar"] = encode_optional(value.pressure_bar);
  j["duration_minutes"] = encode_optional(value.duration_minutes);
  j["method"] = value.method;
}

void from_json(const Json& j, ProcessingParameters& value) {
  require_object(j);
  value.temperature_celsius = read_optional_number(j, "temperature_celsius");
  value.pressure_bar = read_optional_number(j, "pressure_bar");
  if (is_absent(j, "duration_minutes")) {
    value.duration_minutes = std::nullopt;
  } else {
    value.duration_minutes = decode_u32(j.at("duration_minutes"), "duration_minutes");
  }
  value.method = read_string(j, "method");
}


//==============================================
// STAGE PAYLOADS
//==============================================

void to_json(Json& j, const FarmerRegistration& value) {
  j = Json::object();
  j["farmer_name"] = value.farmer_name;
  j["crop_type"] = value.crop_type;
  j["land_area_hectares"] = value.land_area_hectares;
  j["location"] = value.location;
  j["gps_coordinates"] = encode_optional(value.gps_coordinates);
  j["kyc_document_url"] = encode_optional(value.kyc_document_url);
  j["land_ownership_docs"] = value.land_ownership_docs;
  j["satellite_imagery_url"] = encode_optional(value.satellite_imagery_url);
  j["soil_test_report"] = encode_optional(value.soil_test_report);
  j["phone_number"] = encode_optional(value.phone_number);
  j["email"] = encode_optional(value.email);
}

void from_json(const Json& j, FarmerRegistration& value) {
  require_object(j);
  value.farmer_name = read_string(j, "farmer_name");
  value.crop_type = read_string(j, "crop_type");
  value.land_area_hectares = read_number(j, "land_area_hectares");
  value.location = read_string(j, "location");
  value.gps_coordinates = read_optional_nested<GpsCoordinates>(j, "gps_coordinates");
  value.kyc_document_url = read_optional_string(j, "kyc_document_url");
  value.land_ownership_docs = read_string_list(j, "land_ownership_docs");
  value.satellite_imagery_url = read_optional_string(j, "satellite_imagery_url");
  value.soil_test_report = read_optional_string(j, "soil_test_report");
  value.phone_number = read_optional_string(j, "phone_number");
  value.email = read_optional_string(j, "email");
}

void to_json(Json& j, const FpoPurchase& value) {
  j = Json::object();
  j["farmer_did"] = value.farmer_did;
  j["fpo_name"] = value.fpo_name;
  j["batch_id"] = value.batch_id;
  j["quantity_kg"] = value.quantity_kg;
  j["price_per_kg"] = value.price_per_kg;
  j["quality_grade"] = value.quality_grade;
  j["quality_report_url"] = encode_optional(value.quality_report_url);
  j["weight_slip_url"] = encode_optional(value.weight_slip_url);
  j["photos"] = value.photos;
  j["moisture_content"] = encode_optional(value.moisture_content);
  j["impurity_percentage"] = encode_optional(value.impurity_percentage);
  j["payment_reference"] = encode_optional(value.payment_reference);
}

void from_json(const Json& j, FpoPurchase& value) {
  require_object(j);
  value.farmer_did = read_string(j, "farmer_did");
  value.fpo_name = read_string(j, "fpo_name");
  value.batch_id = read_string(j, "batch_id");
  value.quantity_kg = read_number(j, "quantity_kg");
  value.price_per_kg = read_number(j, "price_per_kg");
  value.quality_grade = read_string(j, "quality_grade");
  value.quality_report_url = read_optional_string(j, "quality_report_url");
  value.weight_slip_url = read_optional_string(j, "weight_slip_url");
  value.photos = read_string_list(j, "photos");
  value.moisture_content = read_optional_number(j, "moisture_content");
  value.impurity_percentage = read_optional_number(j, "impurity_percentage");
  value.payment_reference = read_optional_string(j, "payment_reference");
}

void to_json(Json& j, const WarehouseUpdate& value) {
  j = Json::object();
  j["warehouse_id"] = value.warehouse_id;
  j["batch_id"] = value.batch_id;
  j["storage_location"] = value.storage_location;
  j["temperature_celsius"] = encode_optional(value.temperature_celsius);
  j["humidity_percentage"] = encode_optional(value.humidity_percentage);
  j["co2_level_ppm"] = encode_optional(value.co2_level_ppm);
  j["iot_logs_url"] = encode_optional(value.iot_logs_url);
  j["inspection_reports"] = value.inspection_reports;
  j["pest_inspection"] = encode_optional(value.pest_inspection);
  j["quality_degradation"] = encode_optional(value.quality_degradation);
}

void from_json(const Json& j, WarehouseUpdate& value) {
  require_object(j);
  value.warehouse_id = read_string(j, "warehouse_id");
  value.batch_id = read_string(j, "batch_id");
  value.storage_location = read_string(j, "storage_location");
  value.temperature_celsius = read_optional_number(j, "temperature_celsius");
  value.humidity_percentage = read_optional_number(j, "humidity_percentage");
  value.co2_level_ppm = read_optional_number(j, "co2_level_ppm");
  value.iot_logs_url = read_optional_string(j, "iot_logs_url");
  value.inspection_reports = read_string_list(j, "inspection_reports");
  value.pest_inspection = read_optional_nested<PestInspection>(j, "pest_inspection");
  value.quality_degradation = read_optional_number(j, "quality_degradation");
}

void to_json(Json& j, const LogisticsMilestone& value) {
  j = Json::object();
  j["shipment_id"] = value.shipment_id;
  j["current_location"] = value.current_location;
  j["gps_coordinates"] = value.gps_coordinates;
  j["milestone_type"] = to_string(value.milestone_type);
  j["gps_history_url"] = encode_optional(value.gps_history_url);
  j["carrier_name"] = value.carrier_name;
  j["vehicle_id"] = value.vehicle_id;
  j["driver_name"] = encode_optional(value.driver_name);
  j["temperature_log"] = encode_optional(value.temperature_log);
  j["shock_events"] = value.shock_events;
  j["estimated_arrival"] = encode_optional_timestamp(value.estimated_arrival);
  j["is_delivered"] = value.is_delivered;
}

void from_json(const Json& j, LogisticsMilestone& value) {
  require_object(j);
  value.shipment_id = read_string(j, "shipment_id");
  value.current_location = read_string(j, "current_location");
  value.gps_coordinates = decode_nested<GpsCoordinates>(require_field(j, "gps_coordinates"), "gps_coordinates");
  value.milestone_type = milestone_type_from_string(read_string(j, "milestone_type"));
  value.gps_history_url = read_optional_string(j, "gps_history_url");
  value.carrier_name = read_string(j, "carrier_name");
  value.vehicle_id = read_string(j, "vehicle_id");
  value.driver_name = read_optional_string(j, "driver_name");
  value.temperature_log = read_optional_string(j, "temperature_log");

  value.shock_events.clear();
  if (!is_absent(j, "shock_events")) {
    const Json& events = j.at("shock_events");
    if (!events.is_array()) {
      type_mismatch("shock_events", "an array");
    }
    for (const auto& event : events) {
      value.shock_events.push_back(decode_nested<ShockEvent>(event, "shock_events"));
    }
  }

  value.estimated_arrival = read_optional_timestamp(j, "estimated_arrival");
  value.is_delivered = read_bool(j, "is_delivered");
}

void to_json(Json& j, const ProcessBatch& value) {
  j = Json::object();
  j["input_batch_id"] = value.input_batch_id;
  j["processor_name"] = value.processor_name;
  j["processing_type"] = to_string(value.processing_type);
  j["input_quantity_kg"] = value.input_quantity_kg;
  j["output_quantity_kg"] = value.output_quantity_kg;
  j["yield_percentage"] = value.yield_percentage;
  j["waste_percentage"] = value.waste_percentage;
  j["lab_results_url"] = value.lab_results_url;
  j["certifications"] = value.certifications;
  j["output_batch_ids"] = value.output_batch_ids;
  j["processing_parameters"] = encode_optional(value.processing_parameters);
}

void from_json(const Json& j, ProcessBatch& value) {
  require_object(j);
  value.input_batch_id = read_string(j, "input_batch_id");
  value.processor_name = read_string(j, "processor_name");
  value.processing_type = processing_type_from_string(read_string(j, "processing_type"));
  value.input_quantity_kg = read_number(j, "input_quantity_kg");
  value.output_quantity_kg = read_number(j, "output_quantity_kg");
  value.yield_percentage = read_number(j, "yield_percentage");
  value.waste_percentage = read_number(j, "waste_percentage");
  value.lab_results_url = read_string_list(j, "lab_results_url");
  value.certifications = read_string_list(j, "certifications");
  value.output_batch_ids = read_string_list(j, "output_batch_ids");
  value.processing_parameters = read_optional_nested<ProcessingParameters>(j, "processing_parameters");
}

void to_json(Json& j, const CreateSku& value) {
  j = Json::object();
  j["sku_id"] = value.sku_id;
  j["parent_batch_id"] = value.parent_batch_id;
  j["product_name"] = value.product_name;
  j["brand"] = value.brand;
  j["unit_weight_grams"] = value.unit_weight_grams;
  j["units_packaged"] = value.units_packaged;
  j["package_type"] = value.package_type;
  j["barcode"] = encode_optional(value.barcode);
  j["qr_code"] = encode_optional(value.qr_code);
  j["nutritional_info_url"] = encode_optional(value.nutritional_info_url);
  j["regulatory_certifications"] = value.regulatory_certifications;
  j["label_images"] = value.label_images;
  j["expiry_date"] = encode_optional_timestamp(value.expiry_date);
  j["best_before_date"] = encode_optional_timestamp(value.best_before_date);
  j["merkle_proof"] = encode_optional(value.merkle_proof);
}

void from_json(const Json& j, CreateSku& value) {
  require_object(j);
  value.sku_id = read_string(j, "sku_id");
  value.parent_batch_id = read_string(j, "parent_batch_id");
  value.product_name = read_string(j, "product_name");
  value.brand = read_string(j, "brand");
  value.unit_weight_grams = read_number(j, "unit_weight_grams");
  value.units_packaged = decode_u32(require_field(j, "units_packaged"), "units_packaged");
  value.package_type = read_string(j, "package_type");
  value.barcode = read_optional_string(j, "barcode");
  value.qr_code = read_optional_string(j, "qr_code");
  value.nutritional_info_url = read_optional_string(j, "nutritional_info_url");
  value.regulatory_certifications = read_string_list(j, "regulatory_certifications");
  value.label_images = read_string_list(j, "label_images");
  value.expiry_date = read_optional_timestamp(j, "expiry_date");
  value.best_before_date = read_optional_timestamp(j, "best_before_date");
  if (is_absent(j, "merkle_proof")) {
    value.merkle_proof = std::nullopt;
  } else {
    value.merkle_proof = decode_string_list(j.at("merkle_proof"), "merkle_proof");
  }
}

void to_json(Json& j, const AiScore& value) {
  j = Json::object();
  j["batch_id"] = value.batch_id;
  j["quality_score"] = value.quality_score;
  j["sustainability_score"] = value.sustainability_score;
  j["traceability_score"] = value.traceability_score;
  j["model_name"] = value.model_name;
  j["model_version"] = value.model_version;
  j["features"] = encode_free_form(value.features);
  j["predictions"] = encode_free_form(value.predictions);
  j["confidence"] = value.confidence;
  j["model_artifacts_url"] = encode_optional(value.model_artifacts_url);
  j["training_data_hash"] = encode_optional(value.training_data_hash);
}

void from_json(const Json& j, AiScore& value) {
  require_object(j);
  value.batch_id = read_string(j, "batch_id");
  value.quality_score = read_number(j, "quality_score");
  value.sustainability_score = read_number(j, "sustainability_score");
  value.traceability_score = read_number(j, "traceability_score");
  value.model_name = read_string(j, "model_name");
  value.model_version = read_string(j, "model_version");
  value.features = read_free_form(j, "features");
  value.predictions = read_free_form(j, "predictions");
  value.confidence = read_number(j, "confidence");
  value.model_artifacts_url = read_optional_string(j, "model_artifacts_url");
  value.training_data_hash = read_optional_string(j, "training_data_hash");
}

std::string canonical_json(const AiScore& value) {
  try {
    return Json(value).dump();
  } catch (const nlohmann::json::exception& e) {
    throw SerializationError(std::string("AI score payload could not be canonicalized: ") + e.what());
  }
}

} // namespace farmtrace::record
