#ifndef SFTPGW_TRANSPORT_HPP
#define SFTPGW_TRANSPORT_HPP

#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>

namespace sftpgw {
namespace server {

/**
 * Ordered, reliable byte stream carrying one already authenticated SFTP session.
 * Completion handlers run on the I/O context, not on the caller's strand.
 */
class Transport {
public:
  using IoHandler = std::function<void(const boost::system::error_code&, std::size_t)>;

  virtual ~Transport() = default;

  // Completes once the whole buffer has been filled
  virtual void async_read_exact(boost::asio::mutable_buffer buffer, IoHandler handler) = 0;
  // Completes once the whole buffer has been written
  virtual void async_write_all(boost::asio::const_buffer buffer, IoHandler handler) = 0;
  // Cancels pending operations and releases the stream
  virtual void close() = 0;
  virtual bool is_open() const = 0;
  // Peer description for logging
  virtual std::string describe() const = 0;
};

class TcpTransport : public Transport {
public:
  explicit TcpTransport(boost::asio::ip::tcp::socket socket);
  ~TcpTransport() override;

  void async_read_exact(boost::asio::mutable_buffer buffer, IoHandler handler) override;
  void async_write_all(boost::asio::const_buffer buffer, IoHandler handler) override;
  void close() override;
  bool is_open() const override;
  std::string describe() const override;

private:
  boost::asio::ip::tcp::socket socket_;
  std::string remote_;
};

// Reads from one descriptor and writes to another, as an SSH subsystem does with stdin and stdout
class StdioTransport : public Transport {
public:
  // Takes ownership of both descriptors
  StdioTransport(const boost::asio::any_io_executor& executor, int input_fd, int output_fd);
  ~StdioTransport() override;

  // Transport over duplicates of the process's stdin and stdout
  static std::unique_ptr<StdioTransport> from_standard_streams(const boost::asio::any_io_executor& executor);

  void async_read_exact(boost::asio::mutable_buffer buffer, IoHandler handler) override;
  void async_write_all(boost::asio::const_buffer buffer, IoHandler handler) override;
  void close() override;
  bool is_open() const override;
  std::string describe() const override;

private:
  boost::asio::posix::stream_descriptor input_;
  boost::asio::posix::stream_descriptor output_;
};

} // namespace server
} // namespace sftpgw

#endif // SFTPGW_TRANSPORT_HPP
