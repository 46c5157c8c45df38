#include "config/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <unordered_map>

namespace farmtrace::config {

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

uint64_t parse_unsigned(const std::string& value, const std::string& name, uint64_t max) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError(name + " must be a non-negative integer, got '" + value + "'");
  }
  uint64_t parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::out_of_range&) {
    throw ConfigError(name + " is out of range: " + value);
  }
  if (parsed > max) {
    throw ConfigError(name + " is out of range: " + value);
  }
  return parsed;
}

uint16_t parse_port(const std::string& value, const std::string& name) {
  auto port = parse_unsigned(value, name, std::numeric_limits<uint16_t>::max());
  if (port == 0) {
    throw ConfigError(name + " must be between 1 and 65535");
  }
  return static_cast<uint16_t>(port);
}

StorageBackend parse_backend(const std::string& value) {
  std::string lower = to_lower(value);
  if (lower == "ipfs") {
    return StorageBackend::Ipfs;
  } else if (lower == "local") {
    return StorageBackend::Local;
  }
  throw ConfigError("storage backend must be 'ipfs' or 'local', got '" + value + "'");
}

logger::severity_level parse_level(const std::string& value) {
  auto level = logger::severity_from_string(value);
  if (!level) {
    throw ConfigError("unknown log level '" + value + "'");
  }
  return *level;
}

// Applies one setting by its environment variable name
void apply(Config& config, const std::string& key, const std::string& value, bool& level_set) {
  if (key == "HOST") {
    config.host = value;
  } else if (key == "PORT") {
    config.port = parse_port(value, "PORT");
  } else if (key == "ENVIRONMENT") {
    config.environment = environment_from_string(value);
  } else if (key == "STORAGE_BACKEND") {
    config.backend = parse_backend(value);
  } else if (key == "IPFS_URL") {
    config.ipfs.api_url = value;
  } else if (key == "IPFS_PROJECT_ID") {
    config.ipfs.project_id = value;
  } else if (key == "IPFS_PROJECT_SECRET") {
    config.ipfs.project_secret = value;
  } else if (key == "STORAGE_TIMEOUT_MS") {
    config.ipfs.timeout = std::chrono::milliseconds(
      parse_unsigned(value, "STORAGE_TIMEOUT_MS", std::numeric_limits<uint32_t>::max()));
  } else if (key == "STORAGE_MAX_RETRIES") {
    config.ipfs.max_retries = static_cast<unsigned>(parse_unsigned(value, "STORAGE_MAX_RETRIES", 100));
  } else if (key == "STORAGE_RETRY_BACKOFF_MS") {
    config.ipfs.retry_backoff = std::chrono::milliseconds(
      parse_unsigned(value, "STORAGE_RETRY_BACKOFF_MS", std::numeric_limits<uint32_t>::max()));
  } else if (key == "STORE_PATH") {
    config.store_path = value;
  } else if (key == "LOG_FILE") {
    config.log_file = value;
  } else if (key == "LOG_LEVEL") {
    config.log_level = parse_level(value);
    level_set = true;
  }
}

const std::vector<std::string> ENV_KEYS = {
  "HOST", "PORT", "ENVIRONMENT", "STORAGE_BACKEND", "IPFS_URL", "IPFS_PROJECT_ID",
  "IPFS_PROJECT_SECRET", "STORAGE_TIMEOUT_MS", "STORAGE_MAX_RETRIES",
  "STORAGE_RETRY_BACKOFF_MS", "STORE_PATH", "LOG_FILE", "LOG_LEVEL"
};

} // namespace

//==============================================
// ENVIRONMENT
//==============================================

Environment environment_from_string(const std::string& name) {
  std::string lower = to_lower(name);
  if (lower == "production" || lower == "prod") {
    return Environment::Production;
  } else if (lower == "test") {
    return Environment::Test;
  }
  return Environment::Development;
}

const char* to_string(Environment environment) {
  switch (environment) {
    case Environment::Development: return "development";
    case Environment::Production:  return "production";
    case Environment::Test:        return "test";
    default:                       return "unknown";
  }
}

EnvLookup process_environment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (!value) {
      return std::nullopt;
    }
    return std::string(value);
  };
}


//==============================================
// LOADING
//==============================================

Config load(const EnvLookup& env, const std::vector<std::string>& args) {
  Config config;
  bool level_set = false;

  for (const auto& key : ENV_KEYS) {
    if (auto value = env(key)) {
      apply(config, key, *value, level_set);
    }
  }

  // Flags map onto the same settings as their environment variables
  const std::unordered_map<std::string, std::string> flag_map = {
    {"-h", "HOST"},
    {"--host", "HOST"},
    {"-p", "PORT"},
    {"--port", "PORT"},
    {"-e", "ENVIRONMENT"},
    {"--env", "ENVIRONMENT"},
    {"-b", "STORAGE_BACKEND"},
    {"--backend", "STORAGE_BACKEND"},
    {"--ipfs-url", "IPFS_URL"},
    {"--timeout-ms", "STORAGE_TIMEOUT_MS"},
    {"--retries", "STORAGE_MAX_RETRIES"},
    {"-s", "STORE_PATH"},
    {"--store", "STORE_PATH"},
    {"--log-file", "LOG_FILE"},
    {"--log-level", "LOG_LEVEL"}
  };

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& flag = args[i];
    if (flag == "--shell") {
      config.shell = true;
      continue;
    }

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      throw ConfigError("unknown argument: " + flag);
    }
    if (i + 1 >= args.size()) {
      throw ConfigError("missing value for " + flag);
    }
    apply(config, it->second, args[++i], level_set);
  }

  if (!level_set) {
    config.log_level = config.is_development() ? logger::severity_level::debug
                                               : logger::severity_level::info;
  }

  // Reject an unusable IPFS URL here rather than at first request
  if (config.backend == StorageBackend::Ipfs) {
    try {
      storage::IpfsGateway::parse_api_url(config.ipfs.api_url);
    } catch (const std::invalid_argument& e) {
      throw ConfigError(e.what());
    }
  }

  return config;
}

Config load(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return load(process_environment(), args);
}

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
            << "Options (environment variable in brackets):\n"
            << "  -h, --host <addr>      Listen address [HOST] (default 0.0.0.0)\n"
            << "  -p, --port <port>      Listen port [PORT] (default 3000)\n"
            << "  -e, --env <name>       development, production or test [ENVIRONMENT]\n"
            << "  -b, --backend <name>   ipfs or local [STORAGE_BACKEND] (default ipfs)\n"
            << "      --ipfs-url <url>   IPFS API root [IPFS_URL] (default http://127.0.0.1:5001)\n"
            << "      --timeout-ms <ms>  Storage request timeout [STORAGE_TIMEOUT_MS]\n"
            << "      --retries <n>      Storage retries [STORAGE_MAX_RETRIES]\n"
            << "  -s, --store <path>     Local store directory [STORE_PATH]\n"
            << "      --log-file <path>  Also log to file [LOG_FILE]\n"
            << "      --log-level <lvl>  trace, debug, info, warning, error, fatal [LOG_LEVEL]\n"
            << "      --shell            Start the operator shell instead of the HTTP server\n"
            << "Basic auth for hosted IPFS: IPFS_PROJECT_ID and IPFS_PROJECT_SECRET\n"
            << "Example: " << program_name << " -p 3000 -b local -s ./store\n";
}

} // namespace farmtrace::config
