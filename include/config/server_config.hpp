#ifndef SFTPGW_SERVER_CONFIG_HPP
#define SFTPGW_SERVER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include "logger/logger.hpp"

namespace sftpgw {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Configuration error: " + message) {}
};

enum class TransportKind {
  STDIO,
  TCP
};

enum class BackendKind {
  MEMORY,
  OBJECT_STORE,
  LOCAL
};

const char* to_string(TransportKind kind);
const char* to_string(BackendKind kind);

struct ServerConfig {
  // ---- TRANSPORT ----
  TransportKind transport = TransportKind::TCP;
  std::string address = "127.0.0.1";
  uint16_t port = 2222;

  // ---- STORAGE ----
  BackendKind backend = BackendKind::MEMORY;
  // Object store directory or served local directory, required for OBJECT_STORE and LOCAL
  std::string store_root;
  std::string key_prefix;

  // ---- EXECUTION ----
  // Threads running backend calls
  std::size_t worker_threads = 4;
  // Directory entries per READDIR reply
  std::size_t read_dir_batch = 100;
  // Consecutive UNAVAILABLE replies before a session is closed, 0 disables
  std::size_t max_consecutive_unavailable = 16;

  // ---- LOGGING ----
  logger::LogOptions logging;

  // Throws ConfigError if a combination of values cannot be served
  void validate() const;
};

// Returns the value of a variable, or nullopt when it is unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Builds a validated config from SFTPGW_* variables, unset variables keep their defaults
ServerConfig load_config(const EnvLookup& lookup);

// load_config over the process environment
ServerConfig load_from_environment();

} // namespace config
} // namespace sftpgw

#endif // SFTPGW_SERVER_CONFIG_HPP
