#include "record/payloads.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <boost/log/trivial.hpp>

namespace farmtrace::record {

namespace {

void require_non_empty(const std::string& value, const char* field) {
  if (value.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Validation: Field '" << field << "' is empty";
    throw ValidationError(std::string(field) + ": length must be at least 1");
  }
}

void require_finite(double value, const char* field) {
  if (!std::isfinite(value)) {
    throw ValidationError(std::string(field) + ": must be a finite number");
  }
}

void require_finite(const std::optional<double>& value, const char* field) {
  if (value) {
    require_finite(*value, field);
  }
}

void require_finite(const GpsCoordinates& gps, const char* field) {
  require_finite(gps.latitude, field);
  require_finite(gps.longitude, field);
  require_finite(gps.altitude, field);
}

} // namespace

//==============================================
// ENUM NAMES
//==============================================

const char* to_string(MilestoneType type) {
  switch (type) {
    case MilestoneType::PickedUp:     return "picked_up";
    case MilestoneType::InTransit:    return "in_transit";
    case MilestoneType::AtCheckpoint: return "at_checkpoint";
    case MilestoneType::Delivered:    return "delivered";
    case MilestoneType::Delayed:      return "delayed";
    case MilestoneType::Incident:     return "incident";
    default:                          return "unknown";
  }
}

const char* to_string(ProcessingType type) {
  switch (type) {
    case ProcessingType::Cleaning:   return "cleaning";
    case ProcessingType::Drying:     return "drying";
    case ProcessingType::Milling:    return "milling";
    case ProcessingType::Extraction: return "extraction";
    case ProcessingType::Refining:   return "refining";
    case ProcessingType::Blending:   return "blending";
    default:                         return "unknown";
  }
}

const char* debug_name(ProcessingType type) {
  switch (type) {
    case ProcessingType::Cleaning:   return "Cleaning";
    case ProcessingType::Drying:     return "Drying";
    case ProcessingType::Milling:    return "Milling";
    case ProcessingType::Extraction: return "Extraction";
    case ProcessingType::Refining:   return "Refining";
    case ProcessingType::Blending:   return "Blending";
    default:                         return "Unknown";
  }
}

MilestoneType milestone_type_from_string(const std::string& name) {
  for (auto type : {MilestoneType::PickedUp, MilestoneType::InTransit, MilestoneType::AtCheckpoint,
                    MilestoneType::Delivered, MilestoneType::Delayed, MilestoneType::Incident}) {
    if (name == to_string(type)) {
      return type;
    }
  }
  throw ValidationError("milestone_type: unknown variant '" + name + "'");
}

ProcessingType processing_type_from_string(const std::string& name) {
  for (auto type : {ProcessingType::Cleaning, ProcessingType::Drying, ProcessingType::Milling,
                    ProcessingType::Extraction, ProcessingType::Refining, ProcessingType::Blending}) {
    if (name == to_string(type)) {
      return type;
    }
  }
  throw ValidationError("processing_type: unknown variant '" + name + "'");
}


//==============================================
// VALIDATION
//==============================================

void validate(const FarmerRegistration& payload) {
  require_non_empty(payload.farmer_name, "farmer_name");
  require_non_empty(payload.crop_type, "crop_type");
  require_non_empty(payload.location, "location");
  require_finite(payload.land_area_hectares, "land_area_hectares");
  if (payload.gps_coordinates) {
    require_finite(*payload.gps_coordinates, "gps_coordinates");
  }
}

void validate(const FpoPurchase& payload) {
  require_non_empty(payload.farmer_did, "farmer_did");
  require_non_empty(payload.fpo_name, "fpo_name");
  require_finite(payload.quantity_kg, "quantity_kg");
  require_finite(payload.price_per_kg, "price_per_kg");
  require_finite(payload.moisture_content, "moisture_content");
  require_finite(payload.impurity_percentage, "impurity_percentage");
}

void validate(const WarehouseUpdate& payload) {
  require_non_empty(payload.warehouse_id, "warehouse_id");
  require_non_empty(payload.batch_id, "batch_id");
  require_finite(payload.temperature_celsius, "temperature_celsius");
  require_finite(payload.humidity_percentage, "humidity_percentage");
  require_finite(payload.co2_level_ppm, "co2_level_ppm");
  require_finite(payload.quality_degradation, "quality_degradation");
}

void validate(const LogisticsMilestone& payload) {
  require_non_empty(payload.shipment_id, "shipment_id");
  require_finite(payload.gps_coordinates, "gps_coordinates");
  for (const auto& event : payload.shock_events) {
    require_finite(event.g_force, "shock_events.g_force");
    if (event.location) {
      require_finite(*event.location, "shock_events.location");
    }
  }
}

void validate(const ProcessBatch& payload) {
  require_non_empty(payload.input_batch_id, "input_batch_id");
  require_non_empty(payload.processor_name, "processor_name");
  require_finite(payload.input_quantity_kg, "input_quantity_kg");
  require_finite(payload.output_quantity_kg, "output_quantity_kg");
  require_finite(payload.yield_percentage, "yield_percentage");
  require_finite(payload.waste_percentage, "waste_percentage");
  if (payload.processing_parameters) {
    require_finite(payload.processing_parameters->temperature_celsius, "processing_parameters.temperature_celsius");
    require_finite(payload.processing_parameters->pressure_bar, "processing_parameters.pressure_bar");
  }
}

void validate(const CreateSku& payload) {
  require_non_empty(payload.sku_id, "sku_id");
  require_non_empty(payload.parent_batch_id, "parent_batch_id");
  require_non_empty(payload.product_name, "product_name");
  require_finite(payload.unit_weight_grams, "unit_weight_grams");
}

void validate(const AiScore& payload) {
  require_non_empty(payload.batch_id, "batch_id");
  require_finite(payload.quality_score, "quality_score");
  require_finite(payload.sustainability_score, "sustainability_score");
  require_finite(payload.traceability_score, "traceability_score");
  require_finite(payload.confidence, "confidence");
}

} // namespace farmtrace::record
