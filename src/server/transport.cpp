#include "server/transport.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace sftpgw {
namespace server {

//==============================================
// TCP TRANSPORT
//==============================================

TcpTransport::TcpTransport(boost::asio::ip::tcp::socket socket)
  : socket_(std::move(socket)) {
  boost::system::error_code ec;
  const auto endpoint = socket_.remote_endpoint(ec);
  remote_ = ec ? std::string("unknown peer")
               : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

TcpTransport::~TcpTransport() {
  close();
}

void TcpTransport::async_read_exact(boost::asio::mutable_buffer buffer, IoHandler handler) {
  boost::asio::async_read(socket_, buffer, std::move(handler));
}

void TcpTransport::async_write_all(boost::asio::const_buffer buffer, IoHandler handler) {
  boost::asio::async_write(socket_, buffer, std::move(handler));
}

void TcpTransport::close() {
  if (!socket_.is_open()) {
    return;
  }
  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP transport: Error closing socket of " << remote_ << ": " << ec.message();
  }
}

bool TcpTransport::is_open() const {
  return socket_.is_open();
}

std::string TcpTransport::describe() const {
  return "tcp " + remote_;
}


//==============================================
// STDIO TRANSPORT
//==============================================

StdioTransport::StdioTransport(const boost::asio::any_io_executor& executor, int input_fd, int output_fd)
  : input_(executor, input_fd)
  , output_(executor, output_fd) {}

StdioTransport::~StdioTransport() {
  close();
}

std::unique_ptr<StdioTransport> StdioTransport::from_standard_streams(const boost::asio::any_io_executor& executor) {
  const int input_fd = ::dup(STDIN_FILENO);
  if (input_fd < 0) {
    throw std::runtime_error(std::string("Stdio transport: Failed to duplicate stdin: ") + std::strerror(errno));
  }
  const int output_fd = ::dup(STDOUT_FILENO);
  if (output_fd < 0) {
    const int error = errno;
    ::close(input_fd);
    throw std::runtime_error(std::string("Stdio transport: Failed to duplicate stdout: ") + std::strerror(error));
  }
  return std::make_unique<StdioTransport>(executor, input_fd, output_fd);
}

void StdioTransport::async_read_exact(boost::asio::mutable_buffer buffer, IoHandler handler) {
  boost::asio::async_read(input_, buffer, std::move(handler));
}

void StdioTransport::async_write_all(boost::asio::const_buffer buffer, IoHandler handler) {
  boost::asio::async_write(output_, buffer, std::move(handler));
}

void StdioTransport::close() {
  boost::system::error_code ec;
  if (input_.is_open()) {
    input_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Stdio transport: Error closing input: " << ec.message();
    }
  }
  if (output_.is_open()) {
    output_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Stdio transport: Error closing output: " << ec.message();
    }
  }
}

bool StdioTransport::is_open() const {
  return input_.is_open() && output_.is_open();
}

std::string StdioTransport::describe() const {
  return "stdio";
}

} // namespace server
} // namespace sftpgw
