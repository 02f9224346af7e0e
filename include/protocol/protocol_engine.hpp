#ifndef SFTPGW_PROTOCOL_ENGINE_HPP
#define SFTPGW_PROTOCOL_ENGINE_HPP

#include <boost/asio.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "backend/backend.hpp"
#include "handle/handle_manager.hpp"
#include "protocol/codec.hpp"
#include "protocol/protocol_state.hpp"

namespace sftpgw {
namespace protocol {

struct EngineOptions {
  // Directory entries per NAME reply
  std::size_t read_dir_batch = 100;
  // Consecutive NO_CONNECTION replies before the connection is closed, 0 disables
  std::size_t max_consecutive_unavailable = 16;
};

/**
 * Request state machine of one SFTP connection.
 *
 * Packets are parsed, validated and answered on the connection strand. Backend
 * and handle work runs on the worker executor and its reply is posted back to
 * the strand, so replies may complete out of order. Work on the same handle is
 * queued and runs in arrival order.
 */
class ProtocolEngine : public std::enable_shared_from_this<ProtocolEngine> {
public:
  using Strand = boost::asio::strand<boost::asio::any_io_executor>;
  using Packet = std::vector<uint8_t>;
  // Receives complete reply packets including their length prefix
  using ReplyHandler = std::function<void(Packet)>;
  // Invoked once when the engine decides the connection must end
  using CloseHandler = std::function<void(const std::string& reason)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ProtocolEngine(Strand strand,
                 boost::asio::any_io_executor workers,
                 std::shared_ptr<backend::Backend> backend,
                 EngineOptions options = EngineOptions());
  ~ProtocolEngine() = default;

  ProtocolEngine(const ProtocolEngine&) = delete;
  ProtocolEngine& operator=(const ProtocolEngine&) = delete;


  // ---- GETTERS AND SETTERS ----
  void set_reply_handler(ReplyHandler handler);
  void set_close_handler(CloseHandler handler);
  const Strand& strand() const { return strand_; }
  // The remaining getters must be called on the strand
  ProtocolState::State state() const { return state_.get_state(); }
  std::optional<uint32_t> negotiated_version() const { return version_; }
  // Requests handed to the workers and not yet completed
  std::size_t in_flight() const { return in_flight_; }
  // Accepted requests still waiting for their reply, including those queued behind a handle
  std::size_t pending() const { return pending_; }
  handle::HandleManager& handles() { return *handles_; }


  // ---- PACKET INTAKE ----
  // Processes one packet body (type byte and payload). Must run on the strand.
  void handle_packet(const Packet& body);
  // Thread safe variant of handle_packet
  void post_packet(Packet body);


  // ---- LIFECYCLE ----
  // The transport is gone: stop serving and drop every handle without flushing.
  // Must run on the strand.
  void shutdown();

private:
  using Work = std::function<Packet()>;

  struct Outcome {
    Packet reply;
    bool unavailable = false;
  };

  struct QueuedWork {
    uint32_t request_id;
    Work work;
  };

  // ---- PARAMETERS ----
  Strand strand_;
  boost::asio::any_io_executor workers_;
  std::shared_ptr<backend::Backend> backend_;
  std::shared_ptr<handle::HandleManager> handles_;
  EngineOptions options_;

  // Connection state, only touched on the strand
  Codec codec_;
  ProtocolState state_;
  std::optional<uint32_t> version_;
  std::map<uint64_t, std::deque<QueuedWork>> handle_queues_;
  std::size_t in_flight_;
  std::size_t pending_;
  std::size_t consecutive_unavailable_;

  ReplyHandler reply_handler_;
  CloseHandler close_handler_;


  // ---- REQUEST HANDLING ----
  void negotiate(const Request& request);
  void dispatch(Request& request);
  void dispatch_path_request(Request& request);
  void dispatch_handle_request(Request& request);


  // ---- WORK SCHEDULING ----
  // Runs work on the workers, its reply is sent on completion
  void submit(uint32_t request_id, Work work);
  // Same as submit, after every earlier request on the handle completed
  void submit_for_handle(uint64_t handle_id, uint32_t request_id, Work work);
  void start_next_for_handle(uint64_t handle_id);
  void finish_for_handle(uint64_t handle_id);
  void run_on_worker(uint32_t request_id, Work work, std::optional<uint64_t> handle_id);
  // Runs work and turns any failure into a STATUS reply
  static Outcome execute(const Codec& codec, uint32_t request_id, const Work& work);
  void complete(Outcome outcome);


  // ---- REPLIES AND TEARDOWN ----
  void send(Packet reply);
  void close_connection(const std::string& reason);
  // Enters CLOSED and drops handles, false if already closed
  bool enter_closed();
};

} // namespace protocol
} // namespace sftpgw

#endif // SFTPGW_PROTOCOL_ENGINE_HPP
