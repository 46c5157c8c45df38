#ifndef FARMTRACE_STORAGE_IPFS_GATEWAY_HPP
#define FARMTRACE_STORAGE_IPFS_GATEWAY_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "storage/storage_gateway.hpp"

namespace farmtrace {
namespace storage {

struct IpfsOptions {
  // Kubo RPC API root, e.g. "http://127.0.0.1:5001"
  std::string api_url{"http://127.0.0.1:5001"};
  // Basic auth for hosted gateways; sent only when both are set
  std::optional<std::string> project_id;
  std::optional<std::string> project_secret;

  std::chrono::milliseconds timeout{30000};
  unsigned max_retries{2};
  std::chrono::milliseconds retry_backoff{250};
};

struct ApiEndpoint {
  std::string host;
  std::string port;
  std::string base_path;  // no trailing slash
};

// Client for the IPFS (Kubo) HTTP RPC API. Each request opens its own
// connection on its own io_context, so one instance can be shared across
// threads.
class IpfsGateway : public StorageGateway {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws std::invalid_argument for an unusable api_url
  explicit IpfsGateway(IpfsOptions options);


  // ---- CONTENT OPERATIONS ----
  UploadResult upload(const std::string& bytes) override;
  std::string fetch(const std::string& cid) override;


  // ---- DURABILITY ----
  void pin(const std::string& cid) override;
  void unpin(const std::string& cid) override;
  bool is_pinned(const std::string& cid) override;


  // ---- WIRE FORMAT ----
  // Only plain http URLs are accepted
  static ApiEndpoint parse_api_url(const std::string& url);
  static std::string build_multipart_body(const std::string& boundary, const std::string& bytes);
  // {"Name":..,"Hash":..,"Size":".."}
  static UploadResult parse_add_response(const std::string& body);
  // {"Keys":{"<cid>":{"Type":"recursive"}}}
  static bool parse_pin_ls_response(const std::string& body, const std::string& cid);
  // "Message" of a Kubo error body, or the body itself
  static std::string parse_error_message(const std::string& body);
  static std::string url_encode(const std::string& value);

private:
  struct HttpResult {
    unsigned status{0};
    std::string body;
  };

  // ---- PARAMETERS ----
  const IpfsOptions options_;
  const ApiEndpoint endpoint_;
  const std::string authorization_;


  // ---- TRANSPORT ----
  // Retries transport failures and 502/503/504 with linear backoff
  HttpResult post(const std::string& command, const std::string& query,
                  const std::string& body, const std::string& content_type) const;
  HttpResult post_once(const std::string& target, const std::string& body,
                       const std::string& content_type) const;
  std::string build_authorization() const;
};

} // namespace storage
} // namespace farmtrace

#endif // FARMTRACE_STORAGE_IPFS_GATEWAY_HPP
