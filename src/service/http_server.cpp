#include "service/http_server.hpp"
#include <csignal>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/log/trivial.hpp>

namespace farmtrace {
namespace service {

namespace beast = boost::beast;
namespace http = beast::http;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(Router& router, const std::string& address, uint16_t port, size_t worker_threads)
  : router_(router)
  , port_(port)
  , address_(address)
  , is_running_(false)
  , workers_(worker_threads) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << address_ << ":" << port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        boost::asio::post(workers_, [this, socket]() { handle_session(socket); });
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::shutdown() {
  // Releases wait_for_signal, also when it has not started yet
  signal_context_.stop();

  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  boost::asio::post(io_context_, [this]() {
    if (acceptor_ && acceptor_->is_open()) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
      }
    }
  });
  io_context_.stop();

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& socket : sessions_) {
      boost::system::error_code ec;
      socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
  }

  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  workers_.join();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

void HttpServer::wait_for_signal() {
  boost::asio::signal_set signals(signal_context_, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& error, int signal_number) {
    if (!error) {
      BOOST_LOG_TRIVIAL(info) << "HTTP server: Received signal " << signal_number;
    }
  });
  signal_context_.run();
  shutdown();
}

uint16_t HttpServer::port() const {
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    if (!ec) {
      return endpoint.port();
    }
  }
  return port_;
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::handle_session(std::shared_ptr<boost::asio::ip::tcp::socket> socket) {
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (!is_running_) {
      return;
    }
    sessions_.insert(socket);
  }

  beast::flat_buffer buffer;
  beast::error_code ec;

  for (;;) {
    http::request<http::string_body> req;
    http::read(*socket, buffer, req, ec);
    if (ec == http::error::end_of_stream) {
      break;
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read failed: " << ec.message();
      break;
    }

    http::response<http::string_body> res;
    try {
      HttpResponse routed = router_.handle(std::string(req.method_string()),
                                           std::string(req.target()),
                                           req.body());
      BOOST_LOG_TRIVIAL(info) << "HTTP server: " << req.method_string() << " " << req.target()
                              << " -> " << routed.status;

      res = http::response<http::string_body>{static_cast<http::status>(routed.status), req.version()};
      res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
      res.set(http::field::content_type, "application/json");
      res.keep_alive(req.keep_alive());
      res.body() = std::move(routed.body);
      res.prepare_payload();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Dropping connection after failed request: " << e.what();
      break;
    }

    http::write(*socket, res, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Write failed: " << ec.message();
      break;
    }
    if (!res.keep_alive()) {
      break;
    }
  }

  socket->shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(socket);
}

} // namespace service
} // namespace farmtrace
