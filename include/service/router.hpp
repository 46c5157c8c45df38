#ifndef FARMTRACE_SERVICE_ROUTER_HPP
#define FARMTRACE_SERVICE_ROUTER_HPP

#include <exception>
#include <string>
#include "pipeline/stage_pipeline.hpp"
#include "record/payload_json.hpp"

#ifndef FARMTRACE_VERSION
#define FARMTRACE_VERSION "0.1.0"
#endif

namespace farmtrace::service {

struct HttpResponse {
  unsigned status{200};
  std::string body;  // JSON
};

// Maps JSON requests onto the pipeline and every failure onto a status code
// and {"error": <kind>, "message": <text>} body. Independent of the transport.
class Router {
public:
  static constexpr const char* SERVICE_NAME = "farmtrace-anchor";

  // ---- CONSTRUCTOR ----
  explicit Router(pipeline::StagePipeline& pipeline);


  // ---- DISPATCH ----
  // Never throws; target may carry a query string, which is ignored
  HttpResponse handle(const std::string& method, const std::string& target, const std::string& body) const;


  // ---- ERROR MAPPING ----
  // Internal and serialization failures get a generic message
  static HttpResponse error_response(const std::exception& error);
  static unsigned status_for(const std::exception& error);

private:
  pipeline::StagePipeline& pipeline_;


  // ---- HANDLERS ----
  HttpResponse route(const std::string& method, const std::string& path, const std::string& body) const;
  HttpResponse handle_health() const;
  template <typename Stage>
  HttpResponse handle_stage(const std::string& body) const;
  HttpResponse handle_verify(const std::string& body) const;
  HttpResponse handle_upload(const std::string& body) const;
  HttpResponse handle_get(const std::string& cid) const;
  HttpResponse handle_pin(const std::string& cid) const;
  HttpResponse handle_unpin(const std::string& cid) const;
  HttpResponse handle_pinned(const std::string& cid) const;
};

} // namespace farmtrace::service

#endif // FARMTRACE_SERVICE_ROUTER_HPP
