#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <chrono>
#include <cstring>
#include <functional>
#include <utility>
#include "backend/memory_backend.hpp"
#include "protocol/packet_io.hpp"
#include "server/session.hpp"
#include "test_utils.hpp"

using namespace sftpgw;

namespace {

std::vector<uint8_t> init_request(uint32_t version) {
  return protocol::PacketWriter(protocol::PacketType::INIT).write_uint32(version).finish();
}

std::vector<uint8_t> stat_request(uint32_t id, const std::string& path) {
  return protocol::PacketWriter(protocol::PacketType::STAT).write_uint32(id).write_string(path).finish();
}

// Input and output of a ScriptedTransport, shared with the test driving it
struct Script {
  boost::asio::io_context* io = nullptr;
  std::vector<uint8_t> input;
  std::size_t consumed = 0;
  // Read issued after the input ran out, completed only by close()
  server::Transport::IoHandler parked_read;
  bool hold_writes = false;
  std::vector<std::pair<server::Transport::IoHandler, std::size_t>> held_writes;
  std::vector<std::vector<uint8_t>> written;
  bool open = true;

  void append(const std::vector<uint8_t>& packet) {
    input.insert(input.end(), packet.begin(), packet.end());
  }

  void complete(server::Transport::IoHandler handler, boost::system::error_code ec, std::size_t size) {
    boost::asio::post(*io, [handler = std::move(handler), ec, size]() {
      handler(ec, size);
    });
  }

  void release_writes() {
    hold_writes = false;
    for (auto& held : held_writes) {
      complete(std::move(held.first), boost::system::error_code(), held.second);
    }
    held_writes.clear();
  }
};

// In-memory transport whose writes can be held back like a client that stops reading
class ScriptedTransport : public server::Transport {
public:
  explicit ScriptedTransport(std::shared_ptr<Script> script) : script_(std::move(script)) {}

  void async_read_exact(boost::asio::mutable_buffer buffer, IoHandler handler) override {
    if (script_->consumed + buffer.size() > script_->input.size()) {
      script_->parked_read = std::move(handler);
      return;
    }
    std::memcpy(buffer.data(), script_->input.data() + script_->consumed, buffer.size());
    script_->consumed += buffer.size();
    script_->complete(std::move(handler), boost::system::error_code(), buffer.size());
  }

  void async_write_all(boost::asio::const_buffer buffer, IoHandler handler) override {
    const auto* data = static_cast<const uint8_t*>(buffer.data());
    script_->written.emplace_back(data, data + buffer.size());
    if (script_->hold_writes) {
      script_->held_writes.emplace_back(std::move(handler), buffer.size());
      return;
    }
    script_->complete(std::move(handler), boost::system::error_code(), buffer.size());
  }

  void close() override {
    script_->open = false;
    if (script_->parked_read) {
      script_->complete(std::move(script_->parked_read), boost::asio::error::operation_aborted, 0);
      script_->parked_read = nullptr;
    }
    for (auto& held : script_->held_writes) {
      script_->complete(std::move(held.first), boost::asio::error::operation_aborted, 0);
    }
    script_->held_writes.clear();
  }

  bool is_open() const override { return script_->open; }
  std::string describe() const override { return "scripted stream"; }

private:
  std::shared_ptr<Script> script_;
};

} // namespace

class SessionTest : public ::testing::Test {
protected:
  boost::asio::io_context io;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard{io.get_executor()};
  boost::asio::thread_pool workers{2};
  std::shared_ptr<backend::MemoryBackend> backend;
  std::shared_ptr<Script> script;
  std::shared_ptr<server::Session> session;

  void SetUp() override {
    init_test_logging();
    backend = std::make_shared<backend::MemoryBackend>();
    script = std::make_shared<Script>();
    script->io = &io;
  }

  void TearDown() override {
    if (session) {
      session->stop();
      run_until([this] { return session->is_closed(); });
    }
    workers.join();
    guard.reset();
    io.run();
  }

  void start_session() {
    session = std::make_shared<server::Session>(
      1, std::make_unique<ScriptedTransport>(script), boost::asio::any_io_executor(io.get_executor()),
      workers.get_executor(), backend, protocol::EngineOptions());
    session->start();
  }

  bool run_until(const std::function<bool()>& done) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!done()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      io.run_for(std::chrono::milliseconds(5));
    }
    return true;
  }
};

TEST_F(SessionTest, ServesPipelinedRequestsInOneStream) {
  script->append(init_request(3));
  for (uint32_t id = 1; id <= 10; ++id) {
    script->append(stat_request(id, "/"));
  }
  start_session();

  ASSERT_TRUE(run_until([this] { return script->written.size() == 11; }));
  EXPECT_EQ(script->written[0][protocol::LENGTH_PREFIX_SIZE], static_cast<uint8_t>(protocol::PacketType::VERSION));
  EXPECT_EQ(script->consumed, script->input.size());
  EXPECT_FALSE(session->is_closed());
}

TEST_F(SessionTest, StopsReadingWhileRepliesCannotBeWritten) {
  constexpr uint32_t requests = 300;
  const std::size_t init_size = init_request(3).size();
  const std::size_t request_size = stat_request(1, "/").size();
  script->append(init_request(3));
  for (uint32_t id = 1; id <= requests; ++id) {
    script->append(stat_request(id, "/"));
  }
  script->hold_writes = true;
  start_session();

  // The client never drains replies, so reading must stall part way
  io.run_for(std::chrono::milliseconds(200));
  const std::size_t stalled_at = script->consumed;
  EXPECT_LT(stalled_at, script->input.size());
  EXPECT_LE((stalled_at - init_size) / request_size,
            server::Session::MAX_PENDING_REQUESTS + server::Session::MAX_QUEUED_REPLIES);
  EXPECT_FALSE(static_cast<bool>(script->parked_read));
  EXPECT_EQ(script->written.size(), 1u);

  io.run_for(std::chrono::milliseconds(50));
  EXPECT_EQ(script->consumed, stalled_at);

  // Once the client reads again every request is answered
  script->release_writes();
  ASSERT_TRUE(run_until([this] { return script->written.size() == requests + 1; }));
  EXPECT_EQ(script->consumed, script->input.size());
  EXPECT_FALSE(session->is_closed());
}
