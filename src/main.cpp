#include "backend/backend_factory.hpp"
#include "config/server_config.hpp"
#include "logger/logger.hpp"
#include "server/sftp_server.hpp"
#include <boost/log/trivial.hpp>
#include <iostream>

bool run_server(const sftpgw::config::ServerConfig& config) {
  try {
    sftpgw::server::SftpServer server(config, sftpgw::backend::make_backend(config));
    if (!server.install_signal_handlers()) {
      return false;
    }

    const bool started = config.transport == sftpgw::config::TransportKind::STDIO
                           ? server.serve_stdio()
                           : server.start_listener();
    if (!started) {
      BOOST_LOG_TRIVIAL(fatal) << "Main: Failed to start the server";
      return false;
    }

    server.wait();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: Server error: " << e.what();
    return false;
  }
}

int main() {
  sftpgw::config::ServerConfig config;
  try {
    config = sftpgw::config::load_from_environment();
  } catch (const sftpgw::config::ConfigError& e) {
    // Logging is not configured yet and stdout may belong to the SFTP stream
    std::cerr << "Error: " << e.what() << '\n';
    return 2;
  }

  sftpgw::logger::init_logging(config.logging);
  BOOST_LOG_TRIVIAL(info) << "Main: Starting sftpgw with the " << sftpgw::config::to_string(config.backend)
                          << " backend";

  if (!run_server(config)) {
    return 1;
  }
  return 0;
}
