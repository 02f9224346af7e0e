#include "config/server_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace sftpgw {
namespace config {

namespace {

constexpr std::size_t MAX_WORKER_THREADS = 256;

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Parses a non-negative decimal integer no larger than max
uint64_t parse_unsigned(const std::string& name, const std::string& value, uint64_t max) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw ConfigError(name + " must be a non-negative integer, got '" + value + "'");
  }
  try {
    const unsigned long long parsed = std::stoull(value);
    if (parsed > max) {
      throw ConfigError(name + " must not exceed " + std::to_string(max) + ", got " + value);
    }
    return parsed;
  } catch (const std::out_of_range&) {
    throw ConfigError(name + " is out of range: " + value);
  }
}

} // namespace

const char* to_string(TransportKind kind) {
  switch (kind) {
    case TransportKind::STDIO: return "stdio";
    case TransportKind::TCP: return "tcp";
    default: return "unknown";
  }
}

const char* to_string(BackendKind kind) {
  switch (kind) {
    case BackendKind::MEMORY: return "memory";
    case BackendKind::OBJECT_STORE: return "object";
    case BackendKind::LOCAL: return "local";
    default: return "unknown";
  }
}

void ServerConfig::validate() const {
  if (transport == TransportKind::TCP) {
    if (address.empty()) {
      throw ConfigError("SFTPGW_ADDRESS must not be empty for the tcp transport");
    }
    if (port == 0) {
      throw ConfigError("SFTPGW_PORT must be between 1 and 65535");
    }
  }
  if (backend == BackendKind::OBJECT_STORE && store_root.empty()) {
    throw ConfigError("SFTPGW_STORE_ROOT is required for the object backend");
  }
  if (backend == BackendKind::LOCAL && store_root.empty()) {
    throw ConfigError("SFTPGW_STORE_ROOT is required for the local backend");
  }
  if (worker_threads == 0 || worker_threads > MAX_WORKER_THREADS) {
    throw ConfigError("SFTPGW_WORKERS must be between 1 and " + std::to_string(MAX_WORKER_THREADS));
  }
  if (read_dir_batch == 0) {
    throw ConfigError("SFTPGW_READDIR_BATCH must be at least 1");
  }
}

ServerConfig load_config(const EnvLookup& lookup) {
  ServerConfig config;

  if (auto value = lookup("SFTPGW_TRANSPORT")) {
    const std::string kind = lowercase(*value);
    if (kind == "stdio") {
      config.transport = TransportKind::STDIO;
    } else if (kind == "tcp") {
      config.transport = TransportKind::TCP;
    } else {
      throw ConfigError("SFTPGW_TRANSPORT must be 'stdio' or 'tcp', got '" + *value + "'");
    }
  }

  if (auto value = lookup("SFTPGW_ADDRESS")) {
    config.address = *value;
  }
  if (auto value = lookup("SFTPGW_PORT")) {
    config.port = static_cast<uint16_t>(
      parse_unsigned("SFTPGW_PORT", *value, std::numeric_limits<uint16_t>::max()));
  }

  if (auto value = lookup("SFTPGW_BACKEND")) {
    const std::string kind = lowercase(*value);
    if (kind == "memory") {
      config.backend = BackendKind::MEMORY;
    } else if (kind == "object") {
      config.backend = BackendKind::OBJECT_STORE;
    } else if (kind == "local") {
      config.backend = BackendKind::LOCAL;
    } else {
      throw ConfigError("SFTPGW_BACKEND must be 'memory', 'object' or 'local', got '" + *value + "'");
    }
  }
  if (auto value = lookup("SFTPGW_STORE_ROOT")) {
    config.store_root = *value;
  }
  if (auto value = lookup("SFTPGW_KEY_PREFIX")) {
    config.key_prefix = *value;
  }

  if (auto value = lookup("SFTPGW_WORKERS")) {
    config.worker_threads = parse_unsigned("SFTPGW_WORKERS", *value, MAX_WORKER_THREADS);
  }
  if (auto value = lookup("SFTPGW_READDIR_BATCH")) {
    config.read_dir_batch = parse_unsigned("SFTPGW_READDIR_BATCH", *value,
                                           std::numeric_limits<uint32_t>::max());
  }
  if (auto value = lookup("SFTPGW_MAX_UNAVAILABLE")) {
    config.max_consecutive_unavailable = parse_unsigned("SFTPGW_MAX_UNAVAILABLE", *value,
                                                        std::numeric_limits<uint32_t>::max());
  }

  if (auto value = lookup("SFTPGW_LOG_LEVEL")) {
    try {
      config.logging.min_level = logger::parse_severity(*value);
    } catch (const std::invalid_argument& e) {
      throw ConfigError(std::string("SFTPGW_LOG_LEVEL: ") + e.what());
    }
  }
  if (auto value = lookup("SFTPGW_LOG_FILE")) {
    config.logging.file = *value;
  }

  config.validate();
  return config;
}

ServerConfig load_from_environment() {
  return load_config([](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  });
}

} // namespace config
} // namespace sftpgw
