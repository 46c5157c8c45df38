#include "storage/ipfs_gateway.hpp"
#include "core/errors.hpp"
#include "crypto/entropy.hpp"
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace farmtrace {
namespace storage {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Failure worth another attempt: connection problems, timeouts, gateway errors
class TransientFailure : public std::runtime_error {
public:
  explicit TransientFailure(const std::string& message) : std::runtime_error(message) {}
};

bool is_transient_status(unsigned status) {
  return status == 502 || status == 503 || status == 504;
}

// Runs the queued operation to completion and reports its error code
void run_step(net::io_context& ioc, const beast::error_code& ec, const char* step) {
  ioc.run();
  ioc.restart();
  if (ec == beast::error::timeout) {
    throw TransientFailure(std::string("IPFS: Timed out during ") + step);
  }
  if (ec) {
    throw TransientFailure(std::string("IPFS: ") + step + " failed: " + ec.message());
  }
}

bool contains_not_found(const std::string& message) {
  return message.find("not found") != std::string::npos ||
         message.find("no link named") != std::string::npos;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IpfsGateway::IpfsGateway(IpfsOptions options)
  : options_(std::move(options))
  , endpoint_(parse_api_url(options_.api_url))
  , authorization_(build_authorization()) {
  BOOST_LOG_TRIVIAL(info) << "IPFS: Gateway configured for " << endpoint_.host << ":" << endpoint_.port
                          << " (timeout " << options_.timeout.count() << " ms, "
                          << options_.max_retries << " retries"
                          << (authorization_.empty() ? "" : ", basic auth") << ")";
}


//==============================================
// CONTENT OPERATIONS
//==============================================

UploadResult IpfsGateway::upload(const std::string& bytes) {
  const std::string boundary = "farmtrace-" + crypto::generate_nonce();
  HttpResult result = post("add", "pin=false",
                           build_multipart_body(boundary, bytes),
                           "multipart/form-data; boundary=" + boundary);
  if (result.status != 200) {
    throw StorageUnavailableError("IPFS add failed: " + parse_error_message(result.body));
  }

  UploadResult upload = parse_add_response(result.body);
  BOOST_LOG_TRIVIAL(info) << "IPFS: Added " << upload.size << " bytes as " << upload.cid;
  return upload;
}

std::string IpfsGateway::fetch(const std::string& cid) {
  HttpResult result = post("cat", "arg=" + url_encode(cid), "", "");
  if (result.status != 200) {
    std::string message = parse_error_message(result.body);
    if (contains_not_found(message) || result.status == 404) {
      throw NotFoundError("Content not found: " + cid);
    }
    throw StorageUnavailableError("IPFS cat failed: " + message);
  }

  BOOST_LOG_TRIVIAL(debug) << "IPFS: Fetched " << result.body.size() << " bytes for " << cid;
  return result.body;
}


//==============================================
// DURABILITY
//==============================================

void IpfsGateway::pin(const std::string& cid) {
  HttpResult result = post("pin/add", "arg=" + url_encode(cid), "", "");
  if (result.status != 200) {
    std::string message = parse_error_message(result.body);
    if (contains_not_found(message)) {
      throw NotFoundError("Content not found: " + cid);
    }
    throw StorageUnavailableError("IPFS pin failed: " + message);
  }
  BOOST_LOG_TRIVIAL(info) << "IPFS: Pinned " << cid;
}

void IpfsGateway::unpin(const std::string& cid) {
  HttpResult result = post("pin/rm", "arg=" + url_encode(cid), "", "");
  if (result.status != 200) {
    std::string message = parse_error_message(result.body);
    if (message.find("not pinned") != std::string::npos) {
      throw NotFoundError("Content " + cid + " is not pinned");
    }
    throw StorageUnavailableError("IPFS unpin failed: " + message);
  }
  BOOST_LOG_TRIVIAL(info) << "IPFS: Unpinned " << cid;
}

bool IpfsGateway::is_pinned(const std::string& cid) {
  HttpResult result = post("pin/ls", "arg=" + url_encode(cid) + "&type=recursive", "", "");
  if (result.status != 200) {
    std::string message = parse_error_message(result.body);
    // Kubo answers an error rather than an empty set for unpinned content
    if (message.find("not pinned") != std::string::npos) {
      return false;
    }
    throw StorageUnavailableError("IPFS pin/ls failed: " + message);
  }
  return parse_pin_ls_response(result.body, cid);
}


//==============================================
// WIRE FORMAT
//==============================================

ApiEndpoint IpfsGateway::parse_api_url(const std::string& url) {
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    throw std::invalid_argument("IPFS API URL must start with http://: " + url);
  }

  std::string rest = url.substr(scheme.size());
  ApiEndpoint endpoint;
  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    endpoint.base_path = rest.substr(slash);
    while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
      endpoint.base_path.pop_back();
    }
  }

  size_t colon = authority.rfind(':');
  if (colon == std::string::npos) {
    endpoint.host = authority;
    endpoint.port = "80";
  } else {
    endpoint.host = authority.substr(0, colon);
    endpoint.port = authority.substr(colon + 1);
  }

  if (endpoint.host.empty()) {
    throw std::invalid_argument("IPFS API URL has no host: " + url);
  }
  if (endpoint.port.empty() ||
      endpoint.port.find_first_not_of("0123456789") != std::string::npos ||
      endpoint.port.size() > 5 || std::stoul(endpoint.port) > 65535) {
    throw std::invalid_argument("IPFS API URL has an invalid port: " + url);
  }
  return endpoint;
}

std::string IpfsGateway::build_multipart_body(const std::string& boundary, const std::string& bytes) {
  std::string body;
  body.reserve(bytes.size() + 256);
  body += "--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"file\"; filename=\"data.json\"\r\n";
  body += "Content-Type: application/octet-stream\r\n\r\n";
  body += bytes;
  body += "\r\n--" + boundary + "--\r\n";
  return body;
}

UploadResult IpfsGateway::parse_add_response(const std::string& body) {
  try {
    // Kubo may stream one JSON object per line; the last names the root
    std::string last_line;
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
      if (line.find_first_not_of(" \t\r") != std::string::npos) {
        last_line = line;
      }
    }

    nlohmann::json j = nlohmann::json::parse(last_line);
    UploadResult result;
    result.cid = j.at("Hash").get<std::string>();
    const auto& size = j.at("Size");
    result.size = size.is_string() ? std::stoull(size.get<std::string>()) : size.get<uint64_t>();
    if (result.cid.empty()) {
      throw StorageUnavailableError("IPFS add response carries an empty hash");
    }
    return result;
  } catch (const nlohmann::json::exception& e) {
    throw StorageUnavailableError(std::string("Malformed IPFS add response: ") + e.what());
  } catch (const std::logic_error& e) {
    throw StorageUnavailableError(std::string("Malformed IPFS add response size: ") + e.what());
  }
}

bool IpfsGateway::parse_pin_ls_response(const std::string& body, const std::string& cid) {
  try {
    nlohmann::json j = nlohmann::json::parse(body);
    auto keys = j.find("Keys");
    if (keys == j.end() || !keys->is_object()) {
      return false;
    }
    return keys->contains(cid);
  } catch (const nlohmann::json::exception& e) {
    throw StorageUnavailableError(std::string("Malformed IPFS pin/ls response: ") + e.what());
  }
}

std::string IpfsGateway::parse_error_message(const std::string& body) {
  nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_object() && j.contains("Message") && j["Message"].is_string()) {
    return j["Message"].get<std::string>();
  }
  return body;
}

std::string IpfsGateway::url_encode(const std::string& value) {
  std::ostringstream encoded;
  encoded << std::hex << std::uppercase;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      encoded << c;
    } else {
      encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return encoded.str();
}


//==============================================
// TRANSPORT
//==============================================

IpfsGateway::HttpResult IpfsGateway::post(const std::string& command, const std::string& query,
                                          const std::string& body, const std::string& content_type) const {
  const std::string target = endpoint_.base_path + "/api/v0/" + command + (query.empty() ? "" : "?" + query);

  for (unsigned attempt = 0;; ++attempt) {
    try {
      HttpResult result = post_once(target, body, content_type);
      if (!is_transient_status(result.status)) {
        return result;
      }
      if (attempt >= options_.max_retries) {
        throw StorageUnavailableError("IPFS " + command + " failed with status " + std::to_string(result.status));
      }
      BOOST_LOG_TRIVIAL(warning) << "IPFS: " << command << " returned " << result.status << ", retrying";
    } catch (const TransientFailure& e) {
      if (attempt >= options_.max_retries) {
        BOOST_LOG_TRIVIAL(error) << "IPFS: " << command << " failed after " << attempt + 1 << " attempts: " << e.what();
        throw StorageUnavailableError(e.what());
      }
      BOOST_LOG_TRIVIAL(warning) << e.what() << ", retrying";
    }
    std::this_thread::sleep_for(options_.retry_backoff * (attempt + 1));
  }
}

IpfsGateway::HttpResult IpfsGateway::post_once(const std::string& target, const std::string& body,
                                               const std::string& content_type) const {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::error_code ec;

  tcp::resolver::results_type endpoints;
  bool resolved = false;
  resolver.async_resolve(endpoint_.host, endpoint_.port,
    [&](const beast::error_code& error, tcp::resolver::results_type results) {
      ec = error;
      endpoints = std::move(results);
      resolved = true;
    });
  ioc.run_for(options_.timeout);
  if (!resolved) {
    resolver.cancel();
    throw TransientFailure("IPFS: Timed out during resolve");
  }
  ioc.restart();
  if (ec) {
    throw TransientFailure("IPFS: resolve failed: " + ec.message());
  }

  stream.expires_after(options_.timeout);
  stream.async_connect(endpoints,
    [&](const beast::error_code& error, const tcp::endpoint&) { ec = error; });
  run_step(ioc, ec, "connect");

  http::request<http::string_body> req{http::verb::post, target, 11};
  req.set(http::field::host, endpoint_.host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  if (!authorization_.empty()) {
    req.set(http::field::authorization, authorization_);
  }
  if (!content_type.empty()) {
    req.set(http::field::content_type, content_type);
  }
  req.body() = body;
  req.prepare_payload();

  stream.expires_after(options_.timeout);
  http::async_write(stream, req,
    [&](const beast::error_code& error, std::size_t) { ec = error; });
  run_step(ioc, ec, "write");

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());
  stream.expires_after(options_.timeout);
  http::async_read(stream, buffer, parser,
    [&](const beast::error_code& error, std::size_t) { ec = error; });
  run_step(ioc, ec, "read");

  beast::error_code shutdown_ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

  auto response = parser.release();
  return HttpResult{response.result_int(), std::move(response.body())};
}

std::string IpfsGateway::build_authorization() const {
  if (!options_.project_id || !options_.project_secret) {
    return "";
  }

  const std::string credentials = *options_.project_id + ":" + *options_.project_secret;
  std::vector<unsigned char> encoded(4 * ((credentials.size() + 2) / 3) + 1);
  int length = EVP_EncodeBlock(encoded.data(),
                               reinterpret_cast<const unsigned char*>(credentials.data()),
                               static_cast<int>(credentials.size()));
  return "Basic " + std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(length));
}

} // namespace storage
} // namespace farmtrace
