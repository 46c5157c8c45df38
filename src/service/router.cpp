#include "service/router.hpp"
#include "core/errors.hpp"
#include <boost/log/trivial.hpp>

namespace farmtrace::service {

namespace {

using record::Json;

constexpr const char* GENERIC_INTERNAL_MESSAGE = "Internal server error";

// Request bytes echoed into a body may not be UTF-8; they are replaced, never thrown on
std::string dump_body(const Json& body) {
  return body.dump(-1, ' ', false, Json::error_handler_t::replace);
}

HttpResponse json_response(unsigned status, const Json& body) {
  return HttpResponse{status, dump_body(body)};
}

Json parse_body(const std::string& body) {
  try {
    return Json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError(std::string("Invalid JSON body: ") + e.what());
  }
}

std::string require_string(const Json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    throw ValidationError(std::string("missing field `") + key + "`");
  }
  return it->get<std::string>();
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Router::Router(pipeline::StagePipeline& pipeline) : pipeline_(pipeline) {}


//==============================================
// DISPATCH
//==============================================

HttpResponse Router::handle(const std::string& method, const std::string& target, const std::string& body) const {
  const std::string path = target.substr(0, target.find('?'));
  BOOST_LOG_TRIVIAL(debug) << "Router: " << method << " " << path;

  try {
    return route(method, path, body);
  } catch (const std::exception& e) {
    return error_response(e);
  }
}

HttpResponse Router::route(const std::string& method, const std::string& path, const std::string& body) const {
  if (method == "GET") {
    if (path == "/health") {
      return handle_health();
    }

    const std::string get_prefix = "/api/v1/ipfs/get/";
    const std::string pinned_prefix = "/api/v1/ipfs/pinned/";
    if (starts_with(path, get_prefix) && path.size() > get_prefix.size()) {
      return handle_get(path.substr(get_prefix.size()));
    }
    if (starts_with(path, pinned_prefix) && path.size() > pinned_prefix.size()) {
      return handle_pinned(path.substr(pinned_prefix.size()));
    }
  } else if (method == "POST") {
    if (path == "/api/v1/farmer/register") {
      return handle_stage<pipeline::RegistrationStage>(body);
    } else if (path == "/api/v1/fpo/purchase") {
      return handle_stage<pipeline::PurchaseStage>(body);
    } else if (path == "/api/v1/warehouse/update") {
      return handle_stage<pipeline::WarehouseStage>(body);
    } else if (path == "/api/v1/logistics/milestone") {
      return handle_stage<pipeline::LogisticsStage>(body);
    } else if (path == "/api/v1/processing/batch") {
      return handle_stage<pipeline::ProcessingStage>(body);
    } else if (path == "/api/v1/packaging/sku") {
      return handle_stage<pipeline::PackagingStage>(body);
    } else if (path == "/api/v1/ai/score") {
      return handle_stage<pipeline::AiScoreStage>(body);
    } else if (path == "/api/v1/ai/verify") {
      return handle_verify(body);
    } else if (path == "/api/v1/ipfs/upload") {
      return handle_upload(body);
    }

    const std::string pin_prefix = "/api/v1/ipfs/pin/";
    const std::string unpin_prefix = "/api/v1/ipfs/unpin/";
    if (starts_with(path, pin_prefix) && path.size() > pin_prefix.size()) {
      return handle_pin(path.substr(pin_prefix.size()));
    }
    if (starts_with(path, unpin_prefix) && path.size() > unpin_prefix.size()) {
      return handle_unpin(path.substr(unpin_prefix.size()));
    }
  }

  throw NotFoundError("No route for " + method + " " + path);
}


//==============================================
// HANDLERS
//==============================================

HttpResponse Router::handle_health() const {
  Json j = Json::object();
  j["status"] = "healthy";
  j["service"] = SERVICE_NAME;
  j["version"] = FARMTRACE_VERSION;
  return json_response(200, j);
}

template <typename Stage>
HttpResponse Router::handle_stage(const std::string& body) const {
  typename Stage::Payload payload = parse_body(body).template get<typename Stage::Payload>();
  record::Receipt receipt = pipeline_.submit(Stage(std::move(payload)));
  return json_response(201, receipt.to_json());
}

// {"payload": {...AI score...}, "nonce": "..", "reveal_hash": "0x..", "commit_hash": "0x.."}
HttpResponse Router::handle_verify(const std::string& body) const {
  Json request = parse_body(body);
  if (!request.is_object() || !request.contains("payload")) {
    throw ValidationError("missing field `payload`");
  }

  record::AiScore payload = request["payload"].get<record::AiScore>();
  crypto::CommitRevealPair pair{
    require_string(request, "nonce"),
    crypto::Digest{crypto::HashFamily::General, require_string(request, "reveal_hash")},
    crypto::Digest{crypto::HashFamily::General, require_string(request, "commit_hash")}
  };

  Json j = Json::object();
  j["batch_id"] = payload.batch_id;
  j["valid"] = pipeline_.verify_commitment(payload, pair);
  return json_response(200, j);
}

// {"data": <any JSON>, "pin": bool}
HttpResponse Router::handle_upload(const std::string& body) const {
  Json request = parse_body(body);
  if (!request.is_object() || !request.contains("data")) {
    throw ValidationError("missing field `data`");
  }
  auto pin = request.find("pin");
  if (pin == request.end() || !pin->is_boolean()) {
    throw ValidationError("missing field `pin`");
  }

  pipeline::UploadReceipt receipt = pipeline_.upload_document(request["data"], pin->get<bool>());
  Json j = Json::object();
  j["cid"] = receipt.cid;
  j["size"] = receipt.size;
  j["pinned"] = receipt.pinned;
  return json_response(201, j);
}

HttpResponse Router::handle_get(const std::string& cid) const {
  Json j = Json::object();
  j["cid"] = cid;
  j["data"] = pipeline_.fetch_document(cid);
  return json_response(200, j);
}

HttpResponse Router::handle_pin(const std::string& cid) const {
  pipeline::PinReceipt receipt = pipeline_.pin(cid);
  Json j = Json::object();
  j["cid"] = receipt.cid;
  j["pinned"] = receipt.pinned;
  return json_response(200, j);
}

HttpResponse Router::handle_unpin(const std::string& cid) const {
  pipeline::PinReceipt receipt = pipeline_.unpin(cid);
  Json j = Json::object();
  j["cid"] = receipt.cid;
  j["pinned"] = receipt.pinned;
  return json_response(200, j);
}

HttpResponse Router::handle_pinned(const std::string& cid) const {
  Json j = Json::object();
  j["cid"] = cid;
  j["pinned"] = pipeline_.is_pinned(cid);
  return json_response(200, j);
}


//==============================================
// ERROR MAPPING
//==============================================

unsigned Router::status_for(const std::exception& error) {
  const auto* app_error = dynamic_cast<const Error*>(&error);
  if (!app_error) {
    return 500;
  }
  switch (app_error->kind()) {
    case ErrorKind::Validation:         return 400;
    case ErrorKind::StorageUnavailable: return 503;
    case ErrorKind::PinFailed:          return 502;
    case ErrorKind::NotFound:           return 404;
    case ErrorKind::Serialization:      return 500;
    case ErrorKind::Internal:           return 500;
    default:                            return 500;
  }
}

HttpResponse Router::error_response(const std::exception& error) {
  const auto* app_error = dynamic_cast<const Error*>(&error);
  ErrorKind kind = app_error ? app_error->kind() : ErrorKind::Internal;
  unsigned status = status_for(error);

  Json j = Json::object();
  j["error"] = error_kind_to_string(kind);
  if (kind == ErrorKind::Internal || kind == ErrorKind::Serialization) {
    BOOST_LOG_TRIVIAL(error) << "Router: Internal error: " << error.what();
    j["message"] = GENERIC_INTERNAL_MESSAGE;
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Router: Request failed (" << status << "): " << error.what();
    j["message"] = error.what();
  }

  if (const auto* pin_error = dynamic_cast<const PinFailedError*>(&error)) {
    j["cid"] = pin_error->content_address();
  }

  return HttpResponse{status, dump_body(j)};
}

} // namespace farmtrace::service
