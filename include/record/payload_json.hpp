#ifndef FARMTRACE_RECORD_PAYLOAD_JSON_HPP
#define FARMTRACE_RECORD_PAYLOAD_JSON_HPP

#include <nlohmann/json.hpp>
#include "record/payloads.hpp"

namespace farmtrace::record {

// Insertion-ordered JSON so persisted records keep declaration order
using Json = nlohmann::ordered_json;

// ---- ENCODING ----
// Optional members are written as null, timestamps as RFC 3339 strings,
// enums in snake_case.
void to_json(Json& j, const GpsCoordinates& value);
void to_json(Json& j, const PestInspection& value);
void to_json(Json& j, const ShockEvent& value);
void to_json(Json& j, const ProcessingParameters& value);
void to_json(Json& j, const FarmerRegistration& value);
void to_json(Json& j, const FpoPurchase& value);
void to_json(Json& j, const WarehouseUpdate& value);
void to_json(Json& j, const LogisticsMilestone& value);
void to_json(Json& j, const ProcessBatch& value);
void to_json(Json& j, const CreateSku& value);
void to_json(Json& j, const AiScore& value);


// ---- DECODING ----
// Missing required members, wrong JSON types and unknown enum variants
// throw ValidationError. Absent or null optionals decode as empty; absent
// lists decode as empty lists.
void from_json(const Json& j, GpsCoordinates& value);
void from_json(const Json& j, PestInspection& value);
void from_json(const Json& j, ShockEvent& value);
void from_json(const Json& j, ProcessingParameters& value);
void from_json(const Json& j, FarmerRegistration& value);
void from_json(const Json& j, FpoPurchase& value);
void from_json(const Json& j, WarehouseUpdate& value);
void from_json(const Json& j, LogisticsMilestone& value);
void from_json(const Json& j, ProcessBatch& value);
void from_json(const Json& j, CreateSku& value);
void from_json(const Json& j, AiScore& value);

// Compact JSON of the payload; the reveal-hash input for AI scores
std::string canonical_json(const AiScore& value);

} // namespace farmtrace::record

#endif // FARMTRACE_RECORD_PAYLOAD_JSON_HPP
