#include <iostream>
#include <memory>
#include <string>
#include <boost/log/trivial.hpp>
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "pipeline/stage_pipeline.hpp"
#include "service/http_server.hpp"
#include "service/router.hpp"
#include "storage/ipfs_gateway.hpp"
#include "storage/local_store.hpp"

using namespace farmtrace;

std::unique_ptr<storage::StorageGateway> make_storage(const config::Config& cfg) {
  if (cfg.backend == config::StorageBackend::Local) {
    BOOST_LOG_TRIVIAL(info) << "Main: Using local content store at " << cfg.store_path;
    return std::make_unique<storage::LocalStore>(cfg.store_path);
  }
  BOOST_LOG_TRIVIAL(info) << "Main: Using IPFS API at " << cfg.ipfs.api_url;
  return std::make_unique<storage::IpfsGateway>(cfg.ipfs);
}

bool run_service(const config::Config& cfg) {
  try {
    auto storage = make_storage(cfg);
    pipeline::StagePipeline pipeline(*storage);

    if (cfg.shell) {
      cli::CLI cli(pipeline, std::cin, std::cout);
      cli.run();
      return true;
    }

    service::Router router(pipeline);
    service::HttpServer server(router, cfg.host, cfg.port);
    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start HTTP server on " << cfg.address() << '\n';
      return false;
    }

    server.wait_for_signal();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: " << e.what();
    std::cerr << "Error: Failed to start service: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  config::Config cfg;
  try {
    cfg = config::load(argc, argv);
  } catch (const config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    config::print_usage(argv[0]);
    return 1;
  }

  logger::init_logging(cfg.log_file, cfg.log_level);
  BOOST_LOG_TRIVIAL(info) << "Main: Starting " << service::Router::SERVICE_NAME << " "
                          << FARMTRACE_VERSION << " (" << config::to_string(cfg.environment) << ")";

  return run_service(cfg) ? 0 : 1;
}
