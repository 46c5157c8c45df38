#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "service/router.hpp"

namespace farmtrace {
namespace service {

class HttpServer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(Router& router, const std::string& address, uint16_t port, size_t worker_threads = 4);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();
  // Blocks until shutdown() is called from another thread or a signal arrives
  void wait_for_signal();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Bound port, useful when constructed with port 0
  uint16_t port() const;

private:

  // ---- PARAMETERS ----
  Router& router_;

  // Network Parameters
  const uint16_t port_;
  const std::string address_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  // Sessions run here so a slow storage call never blocks accepting
  boost::asio::thread_pool workers_;
  // Open connections, closed on shutdown so idle keep-alive reads return
  std::set<std::shared_ptr<boost::asio::ip::tcp::socket>> sessions_;
  std::mutex sessions_mutex_;
  // Runs only inside wait_for_signal; stopped by shutdown()
  boost::asio::io_context signal_context_;


  // ---- CONNECTION HANDLING ----
  // Main listening loop that handles incoming connections
  void start_accept();
  // Serves requests on one connection until the client closes it
  void handle_session(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
};

} // namespace service
} // namespace farmtrace
