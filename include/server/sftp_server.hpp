#ifndef SFTPGW_SFTP_SERVER_HPP
#define SFTPGW_SFTP_SERVER_HPP

#include <boost/asio.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "backend/backend.hpp"
#include "config/server_config.hpp"
#include "protocol/protocol_engine.hpp"
#include "server/session.hpp"
#include "server/transport.hpp"

namespace sftpgw {
namespace server {

/**
 * Owns the I/O thread, the backend worker pool and every live session.
 * Sessions share nothing but the backend.
 */
class SftpServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SftpServer(const config::ServerConfig& config, std::shared_ptr<backend::Backend> backend);
  ~SftpServer();

  SftpServer(const SftpServer&) = delete;
  SftpServer& operator=(const SftpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Accepts TCP connections on the configured address and port
  bool start_listener();
  // Serves a single session on the process's stdin and stdout, stops when it ends
  bool serve_stdio();
  // Serves a single session over the given descriptors, stops when it ends
  bool serve_descriptors(int input_fd, int output_fd);
  // Stops on SIGINT or SIGTERM
  bool install_signal_handlers();
  // Asks a running server to stop, safe from any thread including handlers
  void request_stop();
  // Blocks until a stop is requested, then shuts down
  void wait();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Port the listener is bound to, useful when configured with port 0
  uint16_t local_port() const { return bound_port_; }
  std::size_t session_count() const;

private:
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  // ---- PARAMETERS ----
  const config::ServerConfig config_;
  std::shared_ptr<backend::Backend> backend_;
  protocol::EngineOptions engine_options_;

  // Declared before everything that posts into it
  boost::asio::io_context io_context_;
  std::optional<WorkGuard> work_guard_;
  boost::asio::thread_pool workers_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;
  std::atomic<uint16_t> bound_port_;

  // Session registry
  std::map<uint64_t, std::shared_ptr<Session>> sessions_;
  mutable std::mutex sessions_mutex_;
  uint64_t next_session_id_;

  // Stop requests
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Runs one session and requests a stop when it ends
  bool serve_single(const std::function<std::unique_ptr<Transport>()>& make_transport);
  void start_io_thread();
  // Main listening loop that handles incoming connections
  void start_accept();
  void close_all();


  // ---- SESSION REGISTRY ----
  void add_session(std::unique_ptr<Transport> transport, bool stop_when_closed);
  void remove_session(uint64_t session_id);
};

} // namespace server
} // namespace sftpgw

#endif // SFTPGW_SFTP_SERVER_HPP
