#include "server/sftp_server.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <csignal>
#include <stdexcept>
#include <vector>

namespace sftpgw {
namespace server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SftpServer::SftpServer(const config::ServerConfig& config, std::shared_ptr<backend::Backend> backend)
  : config_(config)
  , backend_(std::move(backend))
  , workers_(std::max<std::size_t>(1, config.worker_threads))
  , is_running_(false)
  , bound_port_(0)
  , next_session_id_(1)
  , stop_requested_(false) {
  if (!backend_) {
    throw std::invalid_argument("SFTP server: backend must not be null");
  }
  engine_options_.read_dir_batch = config_.read_dir_batch;
  engine_options_.max_consecutive_unavailable = config_.max_consecutive_unavailable;

  BOOST_LOG_TRIVIAL(info) << "SFTP server: Initializing with " << config::to_string(config_.transport)
                          << " transport, " << std::max<std::size_t>(1, config_.worker_threads)
                          << " workers and " << backend_->describe();
}

SftpServer::~SftpServer() {
  shutdown();
  workers_.join();
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.clear();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool SftpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "SFTP server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(config_.address),
      config_.port
    );

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_, endpoint);
    bound_port_ = acceptor_->local_endpoint().port();
    is_running_ = true;

    // Start accepting connections
    start_accept();
    start_io_thread();

    BOOST_LOG_TRIVIAL(info) << "SFTP server: Listening on " << config_.address << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "SFTP server: Failed to start listener: " << e.what();
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

bool SftpServer::serve_stdio() {
  return serve_single([this]() -> std::unique_ptr<Transport> {
    return StdioTransport::from_standard_streams(io_context_.get_executor());
  });
}

bool SftpServer::serve_descriptors(int input_fd, int output_fd) {
  return serve_single([this, input_fd, output_fd]() -> std::unique_ptr<Transport> {
    return std::make_unique<StdioTransport>(io_context_.get_executor(), input_fd, output_fd);
  });
}

bool SftpServer::serve_single(const std::function<std::unique_ptr<Transport>()>& make_transport) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "SFTP server: Server already running";
    return false;
  }

  try {
    std::unique_ptr<Transport> transport = make_transport();
    is_running_ = true;
    add_session(std::move(transport), true);
    start_io_thread();
    BOOST_LOG_TRIVIAL(info) << "SFTP server: Serving a single session over stdio";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "SFTP server: Failed to serve stdio session: " << e.what();
    is_running_ = false;
    return false;
  }
}

bool SftpServer::install_signal_handlers() {
  try {
    signals_ = std::make_unique<boost::asio::signal_set>(io_context_, SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      BOOST_LOG_TRIVIAL(info) << "SFTP server: Received signal " << signal_number << ", stopping";
      request_stop();
    });
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "SFTP server: Failed to install signal handlers: " << e.what();
    return false;
  }
}

void SftpServer::request_stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

void SftpServer::wait() {
  {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait(lock, [this]() { return stop_requested_; });
  }
  shutdown();
}

void SftpServer::shutdown() {
  const bool was_running = is_running_.exchange(false);
  if (was_running) {
    BOOST_LOG_TRIVIAL(info) << "SFTP server: Initiating server shutdown";
    boost::asio::post(io_context_, [this]() {
      close_all();
    });
    work_guard_.reset();
  }

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable() && io_thread_->get_id() != std::this_thread::get_id()) {
    io_thread_->join();
  }
  request_stop();

  if (was_running) {
    BOOST_LOG_TRIVIAL(info) << "SFTP server: Server shutdown complete";
  }
}

void SftpServer::start_io_thread() {
  work_guard_.emplace(io_context_.get_executor());
  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "SFTP server: IO context error: " << e.what();
      request_stop();
    }
  });
}

void SftpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket) {
      if (!is_running_ || ec == boost::asio::error::operation_aborted) {
        return;
      }
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "SFTP server: Accept error: " << ec.message();
      } else {
        add_session(std::make_unique<TcpTransport>(std::move(socket)), false);
      }
      start_accept();  // Continue accepting new connections
    });
}

void SftpServer::close_all() {
  boost::system::error_code ec;
  if (acceptor_ && acceptor_->is_open()) {
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "SFTP server: Error closing acceptor: " << ec.message();
    }
  }
  if (signals_) {
    signals_->cancel(ec);
  }

  std::vector<std::shared_ptr<Session>> live;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& [id, session] : sessions_) {
      live.push_back(session);
    }
  }
  for (const auto& session : live) {
    session->stop();
  }

  // Runs after the session closes posted above
  boost::asio::post(io_context_, [this]() {
    io_context_.stop();
  });
}


//==============================================
// SESSION REGISTRY
//==============================================

void SftpServer::add_session(std::unique_ptr<Transport> transport, bool stop_when_closed) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const uint64_t session_id = next_session_id_++;
    session = std::make_shared<Session>(session_id, std::move(transport), io_context_.get_executor(),
                                        workers_.get_executor(), backend_, engine_options_);
    sessions_.emplace(session_id, session);
  }

  session->set_closed_handler([this, stop_when_closed](uint64_t session_id) {
    remove_session(session_id);
    if (stop_when_closed) {
      request_stop();
    }
  });
  session->start();
}

void SftpServer::remove_session(uint64_t session_id) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(session_id);
  BOOST_LOG_TRIVIAL(debug) << "SFTP server: Removed session " << session_id << ", " << sessions_.size() << " remaining";
}

std::size_t SftpServer::session_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

} // namespace server
} // namespace sftpgw
