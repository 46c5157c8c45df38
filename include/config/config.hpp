#ifndef FARMTRACE_CONFIG_CONFIG_HPP
#define FARMTRACE_CONFIG_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "logger/logger.hpp"
#include "storage/ipfs_gateway.hpp"

namespace farmtrace::config {

enum class Environment {
  Development,
  Production,
  Test
};

// "production"/"prod" and "test" (any case); everything else is development
Environment environment_from_string(const std::string& name);
const char* to_string(Environment environment);

enum class StorageBackend {
  Ipfs,
  Local
};

struct Config {
  // ---- SERVER ----
  std::string host{"0.0.0.0"};
  uint16_t port{3000};
  Environment environment{Environment::Development};

  // ---- STORAGE ----
  StorageBackend backend{StorageBackend::Ipfs};
  storage::IpfsOptions ipfs;
  std::string store_path{"farmtrace_store"};

  // ---- LOGGING ----
  std::string log_file;
  logger::severity_level log_level{logger::severity_level::debug};

  // ---- MODE ----
  bool shell{false};

  std::string address() const { return host + ":" + std::to_string(port); }
  bool is_production() const { return environment == Environment::Production; }
  bool is_development() const { return environment == Environment::Development; }
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

// Returns the value of an environment variable, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_environment();

// Defaults, then environment, then command-line flags. Throws ConfigError
// for unknown flags, missing flag values and malformed numbers.
Config load(const EnvLookup& env, const std::vector<std::string>& args);
Config load(int argc, char* argv[]);

void print_usage(const std::string& program_name);

} // namespace farmtrace::config

#endif // FARMTRACE_CONFIG_CONFIG_HPP
