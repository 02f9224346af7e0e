#ifndef SFTPGW_SESSION_HPP
#define SFTPGW_SESSION_HPP

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "backend/backend.hpp"
#include "protocol/protocol_engine.hpp"
#include "protocol/sftp_constants.hpp"
#include "server/transport.hpp"

namespace sftpgw {
namespace server {

/**
 * One authenticated connection: frames packets off the transport, feeds them to
 * its protocol engine and writes the replies back in order. Everything except
 * start() and stop() runs on the session strand.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
  using ClosedHandler = std::function<void(uint64_t session_id)>;

  // Reading pauses while either limit is reached and resumes once replies drain
  static constexpr std::size_t MAX_PENDING_REQUESTS = 64;
  static constexpr std::size_t MAX_QUEUED_REPLIES = 64;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Session(uint64_t id,
          std::unique_ptr<Transport> transport,
          const boost::asio::any_io_executor& io_executor,
          boost::asio::any_io_executor workers,
          std::shared_ptr<backend::Backend> backend,
          protocol::EngineOptions options);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;


  // ---- GETTERS AND SETTERS ----
  // Called once on the strand after the transport is released
  void set_closed_handler(ClosedHandler handler);
  uint64_t id() const { return id_; }
  bool is_closed() const { return closed_; }


  // ---- LIFECYCLE ----
  // Starts the read loop
  void start();
  // Closes the session from any thread
  void stop();

private:
  // ---- PARAMETERS ----
  const uint64_t id_;
  protocol::ProtocolEngine::Strand strand_;
  std::unique_ptr<Transport> transport_;
  std::shared_ptr<protocol::ProtocolEngine> engine_;
  std::string peer_;

  // Read state
  std::array<uint8_t, protocol::LENGTH_PREFIX_SIZE> header_;
  std::vector<uint8_t> body_;
  bool read_paused_;

  // Write state, replies leave in the order they were produced
  std::deque<std::vector<uint8_t>> write_queue_;
  bool writing_;
  bool closing_;
  std::atomic<bool> closed_;

  ClosedHandler closed_handler_;


  // ---- INCOMING PACKETS ----
  void read_header();
  void handle_header(const boost::system::error_code& ec);
  void handle_body(const boost::system::error_code& ec);
  // Reads the next packet unless too much work is outstanding
  void continue_reading();


  // ---- OUTGOING PACKETS ----
  void send(std::vector<uint8_t> packet);
  void write_next();
  void handle_write(const boost::system::error_code& ec);


  // ---- TEARDOWN ----
  // Stops reading, lets queued replies drain, then releases the transport
  void close(const std::string& reason);
  void finish_close();
};

} // namespace server
} // namespace sftpgw

#endif // SFTPGW_SESSION_HPP
