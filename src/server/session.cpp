#include "server/session.hpp"
#include "protocol/packet_io.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace sftpgw {
namespace server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Session::Session(uint64_t id,
                 std::unique_ptr<Transport> transport,
                 const boost::asio::any_io_executor& io_executor,
                 boost::asio::any_io_executor workers,
                 std::shared_ptr<backend::Backend> backend,
                 protocol::EngineOptions options)
  : id_(id)
  , strand_(io_executor)
  , transport_(std::move(transport))
  , read_paused_(false)
  , writing_(false)
  , closing_(false)
  , closed_(false) {
  if (!transport_) {
    throw std::invalid_argument("Session: transport must not be null");
  }
  peer_ = transport_->describe();
  engine_ = std::make_shared<protocol::ProtocolEngine>(strand_, std::move(workers), std::move(backend), options);
  BOOST_LOG_TRIVIAL(info) << "Session: Created session " << id_ << " for " << peer_;
}

Session::~Session() {
  BOOST_LOG_TRIVIAL(debug) << "Session: Session " << id_ << " destroyed";
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void Session::set_closed_handler(ClosedHandler handler) {
  closed_handler_ = std::move(handler);
}


//==============================================
// LIFECYCLE
//==============================================

void Session::start() {
  std::weak_ptr<Session> weak_self = shared_from_this();

  engine_->set_reply_handler([weak_self](std::vector<uint8_t> packet) {
    if (auto self = weak_self.lock()) {
      self->send(std::move(packet));
    }
  });
  engine_->set_close_handler([weak_self](const std::string& reason) {
    if (auto self = weak_self.lock()) {
      self->close(reason);
    }
  });

  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    self->read_header();
  });
}

void Session::stop() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    self->close("server shutdown");
  });
}


//==============================================
// INCOMING PACKETS
//==============================================

void Session::read_header() {
  if (closing_) {
    return;
  }

  auto self = shared_from_this();
  transport_->async_read_exact(boost::asio::buffer(header_),
    [self](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
      boost::asio::post(self->strand_, [self, ec]() {
        self->handle_header(ec);
      });
    });
}

void Session::handle_header(const boost::system::error_code& ec) {
  if (closing_) {
    return;
  }
  if (ec) {
    close(ec == boost::asio::error::eof ? std::string("peer closed the stream") : ec.message());
    return;
  }

  uint32_t length;
  try {
    length = protocol::decode_length_prefix(header_.data());
  } catch (const protocol::ProtocolError& e) {
    close(e.what());
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "Session: Expecting " << length << " bytes from " << peer_;
  body_.resize(length);

  auto self = shared_from_this();
  transport_->async_read_exact(boost::asio::buffer(body_),
    [self](const boost::system::error_code& read_ec, std::size_t /*bytes_transferred*/) {
      boost::asio::post(self->strand_, [self, read_ec]() {
        self->handle_body(read_ec);
      });
    });
}

void Session::handle_body(const boost::system::error_code& ec) {
  if (closing_) {
    return;
  }
  if (ec) {
    close(ec == boost::asio::error::eof ? std::string("peer closed the stream mid-packet") : ec.message());
    return;
  }

  engine_->handle_packet(body_);
  continue_reading();
}

void Session::continue_reading() {
  if (closing_) {
    return;
  }
  if (engine_->pending() >= MAX_PENDING_REQUESTS || write_queue_.size() >= MAX_QUEUED_REPLIES) {
    if (!read_paused_) {
      BOOST_LOG_TRIVIAL(debug) << "Session: Pausing reads from " << peer_ << " with " << engine_->pending()
                               << " requests pending and " << write_queue_.size() << " replies queued";
    }
    read_paused_ = true;
    return;
  }
  read_paused_ = false;
  read_header();
}


//==============================================
// OUTGOING PACKETS
//==============================================

void Session::send(std::vector<uint8_t> packet) {
  if (closed_) {
    return;
  }
  write_queue_.push_back(std::move(packet));
  if (!writing_) {
    write_next();
  }
  if (read_paused_) {
    continue_reading();
  }
}

void Session::write_next() {
  writing_ = true;
  auto self = shared_from_this();
  transport_->async_write_all(boost::asio::buffer(write_queue_.front()),
    [self](const boost::system::error_code& ec, std::size_t /*bytes_transferred*/) {
      boost::asio::post(self->strand_, [self, ec]() {
        self->handle_write(ec);
      });
    });
}

void Session::handle_write(const boost::system::error_code& ec) {
  writing_ = false;
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      BOOST_LOG_TRIVIAL(error) << "Session: Write to " << peer_ << " failed: " << ec.message();
    }
    write_queue_.clear();
    closing_ = true;
    engine_->shutdown();
    finish_close();
    return;
  }

  write_queue_.pop_front();
  if (!write_queue_.empty()) {
    write_next();
  } else if (closing_) {
    finish_close();
    return;
  }
  if (read_paused_) {
    continue_reading();
  }
}


//==============================================
// TEARDOWN
//==============================================

void Session::close(const std::string& reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  BOOST_LOG_TRIVIAL(info) << "Session: Closing session " << id_ << " (" << peer_ << "): " << reason;

  engine_->shutdown();
  if (!writing_) {
    finish_close();
  }
}

void Session::finish_close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  transport_->close();
  BOOST_LOG_TRIVIAL(debug) << "Session: Session " << id_ << " closed";

  if (closed_handler_) {
    closed_handler_(id_);
  }
}

} // namespace server
} // namespace sftpgw
