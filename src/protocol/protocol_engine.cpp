#include "protocol/protocol_engine.hpp"
#include "path/path_normalizer.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/status.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace sftpgw {
namespace protocol {

namespace {

// Owned so it outlives the request it was parsed from
path::NormalizedPath owned_path(const std::string& raw) {
  return path::normalize(raw).to_owned();
}

// Validates an OPEN against the backend and registers the handle
uint64_t open_file_handle(backend::Backend& storage, handle::HandleManager& handles,
                          const path::NormalizedPath& target, uint32_t pflags) {
  const bool want_write = (pflags & (open_flags::WRITE | open_flags::APPEND |
                                     open_flags::CREAT | open_flags::TRUNC)) != 0;
  const bool want_read = (pflags & open_flags::READ) != 0 || !want_write;

  if (!want_write) {
    return handles.open_file(target, handle::OpenMode::READ, storage.read_file(target));
  }

  std::optional<backend::FileAttributes> existing;
  try {
    existing = storage.file_info(target);
  } catch (const backend::BackendError& e) {
    if (e.code() != backend::BackendErrc::NOT_FOUND) {
      throw;
    }
  }

  if (existing) {
    if (existing->is_directory()) {
      throw backend::BackendError(backend::BackendErrc::IS_A_DIRECTORY, target.str());
    }
    if ((pflags & open_flags::CREAT) && (pflags & open_flags::EXCL)) {
      throw backend::BackendError(backend::BackendErrc::ALREADY_EXISTS, target.str());
    }
  } else {
    if (!(pflags & open_flags::CREAT)) {
      throw backend::BackendError(backend::BackendErrc::NOT_FOUND, target.str());
    }
    const backend::FileAttributes parent = storage.file_info(target.parent());
    if (!parent.is_directory()) {
      throw backend::BackendError(backend::BackendErrc::NOT_A_DIRECTORY, target.parent().str());
    }
  }

  backend::Bytes initial;
  if (existing && !(pflags & open_flags::TRUNC)) {
    initial = storage.read_file(target);
  }

  const handle::OpenMode mode = want_read ? handle::OpenMode::READ_WRITE : handle::OpenMode::WRITE;
  return handles.open_file(target, mode, std::move(initial), (pflags & open_flags::APPEND) != 0);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ProtocolEngine::ProtocolEngine(Strand strand,
                               boost::asio::any_io_executor workers,
                               std::shared_ptr<backend::Backend> storage,
                               EngineOptions options)
  : strand_(std::move(strand))
  , workers_(std::move(workers))
  , backend_(std::move(storage))
  , options_(options)
  , in_flight_(0)
  , pending_(0)
  , consecutive_unavailable_(0) {
  if (!backend_) {
    throw std::invalid_argument("Protocol engine: backend must not be null");
  }
  if (options_.read_dir_batch == 0) {
    throw std::invalid_argument("Protocol engine: read_dir_batch must be at least 1");
  }
  handles_ = std::make_shared<handle::HandleManager>(backend_);
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void ProtocolEngine::set_reply_handler(ReplyHandler handler) {
  reply_handler_ = std::move(handler);
}

void ProtocolEngine::set_close_handler(CloseHandler handler) {
  close_handler_ = std::move(handler);
}


//==============================================
// PACKET INTAKE
//==============================================

void ProtocolEngine::handle_packet(const Packet& body) {
  if (state_.is_closed()) {
    BOOST_LOG_TRIVIAL(debug) << "Protocol engine: Ignoring packet on closed connection";
    return;
  }

  Request request;
  try {
    request = codec_.decode(body);
  } catch (const ProtocolError& e) {
    close_connection(e.what());
    return;
  }

  if (state_.get_state() == ProtocolState::State::AWAITING_VERSION) {
    if (request.type != PacketType::INIT) {
      close_connection(std::string("received ") + packet_type_to_string(request.type) + " before INIT");
      return;
    }
    negotiate(request);
    return;
  }

  if (request.type == PacketType::INIT) {
    close_connection("duplicate INIT after version negotiation");
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Protocol engine: " << packet_type_to_string(request.type) << " id=" << request.id;
  dispatch(request);
}

void ProtocolEngine::post_packet(Packet body) {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self, body = std::move(body)]() {
    self->handle_packet(body);
  });
}


//==============================================
// LIFECYCLE
//==============================================

void ProtocolEngine::shutdown() {
  if (enter_closed()) {
    BOOST_LOG_TRIVIAL(debug) << "Protocol engine: Shut down with " << in_flight_ << " requests in flight";
  }
}


//==============================================
// REQUEST HANDLING
//==============================================

void ProtocolEngine::negotiate(const Request& request) {
  if (request.version < MIN_PROTOCOL_VERSION) {
    close_connection("client protocol version " + std::to_string(request.version) + " is not supported");
    return;
  }

  const uint32_t version = std::min(request.version, MAX_PROTOCOL_VERSION);
  codec_.set_version(version);
  version_ = version;
  state_.transition_to(ProtocolState::State::NEGOTIATED);

  BOOST_LOG_TRIVIAL(info) << "Protocol engine: Negotiated protocol version " << version
                          << " (client offered " << request.version << ")";
  send(codec_.encode_version(version));
}

void ProtocolEngine::dispatch(Request& request) {
  try {
    switch (request.type) {
      case PacketType::CLOSE:
      case PacketType::READ:
      case PacketType::WRITE:
      case PacketType::FSTAT:
      case PacketType::FSETSTAT:
      case PacketType::READDIR:
        dispatch_handle_request(request);
        break;

      case PacketType::OPEN:
      case PacketType::OPENDIR:
      case PacketType::REMOVE:
      case PacketType::MKDIR:
      case PacketType::RMDIR:
      case PacketType::RENAME:
      case PacketType::STAT:
      case PacketType::LSTAT:
      case PacketType::SETSTAT:
      case PacketType::REALPATH:
        dispatch_path_request(request);
        break;

      default:
        BOOST_LOG_TRIVIAL(debug) << "Protocol engine: Unsupported request " << packet_type_to_string(request.type)
                                 << " (" << static_cast<int>(request.type) << ")";
        send(codec_.encode_status(request.id, StatusCode::OP_UNSUPPORTED));
        break;
    }
  } catch (const path::PathError& e) {
    send(codec_.encode_status(request.id, invalid_path_status(), e.what()));
  } catch (const handle::HandleError& e) {
    send(codec_.encode_status(request.id, to_status(e.code()), e.what()));
  }
}

void ProtocolEngine::dispatch_path_request(Request& request) {
  const uint32_t id = request.id;
  const Codec codec = codec_;
  auto storage = backend_;
  auto handles = handles_;
  const path::NormalizedPath target = owned_path(request.path);

  switch (request.type) {
    case PacketType::OPEN: {
      const uint32_t pflags = request.pflags;
      submit(id, [storage, handles, codec, id, target, pflags]() {
        const uint64_t handle_id = open_file_handle(*storage, *handles, target, pflags);
        return codec.encode_handle(id, handle::HandleManager::format_handle(handle_id));
      });
      break;
    }

    case PacketType::OPENDIR:
      submit(id, [storage, handles, codec, id, target]() {
        if (!storage->file_info(target).is_directory()) {
          throw backend::BackendError(backend::BackendErrc::NOT_A_DIRECTORY, target.str());
        }
        return codec.encode_handle(id, handle::HandleManager::format_handle(handles->open_dir(target)));
      });
      break;

    case PacketType::REMOVE:
      submit(id, [storage, codec, id, target]() {
        storage->remove_file(target);
        return codec.encode_status(id, StatusCode::OK);
      });
      break;

    case PacketType::MKDIR:
      submit(id, [storage, codec, id, target]() {
        storage->make_dir(target);
        return codec.encode_status(id, StatusCode::OK);
      });
      break;

    case PacketType::RMDIR:
      submit(id, [storage, codec, id, target]() {
        storage->del_dir(target);
        return codec.encode_status(id, StatusCode::OK);
      });
      break;

    case PacketType::RENAME: {
      const path::NormalizedPath destination = owned_path(request.target_path);
      submit(id, [storage, codec, id, target, destination]() {
        storage->rename(target, destination);
        return codec.encode_status(id, StatusCode::OK);
      });
      break;
    }

    case PacketType::STAT:
    case PacketType::LSTAT:
      // No symlinks, LSTAT is STAT
      submit(id, [storage, codec, id, target]() {
        return codec.encode_attrs(id, storage->file_info(target));
      });
      break;

    case PacketType::SETSTAT:
      // Attributes are not settable, the target only has to exist
      submit(id, [storage, codec, id, target]() {
        storage->file_info(target);
        return codec.encode_status(id, StatusCode::OK);
      });
      break;

    case PacketType::REALPATH:
      send(codec_.encode_name(id, {backend::DirEntry{target.str(), backend::FileAttributes()}}));
      break;

    default:
      send(codec_.encode_status(id, StatusCode::OP_UNSUPPORTED));
      break;
  }
}

void ProtocolEngine::dispatch_handle_request(Request& request) {
  const uint32_t id = request.id;
  const Codec codec = codec_;
  auto storage = backend_;
  auto handles = handles_;
  const uint64_t handle_id = handle::HandleManager::parse_handle(request.handle);

  switch (request.type) {
    case PacketType::CLOSE:
      submit_for_handle(handle_id, id, [handles, codec, id, handle_id]() {
        handles->close(handle_id);
        return codec.encode_status(id, StatusCode::OK);
      });
      break;

    case PacketType::READ: {
      const uint32_t length = std::min(request.length, MAX_READ_LENGTH);
      const uint64_t offset = request.offset;
      submit_for_handle(handle_id, id, [handles, codec, id, handle_id, length, offset]() {
        backend::Bytes data = handles->read(handle_id, length, offset);
        if (data.empty() && length > 0) {
          return codec.encode_status(id, StatusCode::END_OF_FILE);
        }
        return codec.encode_data(id, data);
      });
      break;
    }

    case PacketType::WRITE: {
      const uint64_t offset = request.offset;
      submit_for_handle(handle_id, id, [handles, codec, id, handle_id, offset, data = std::move(request.data)]() {
        handles->write(handle_id, data, offset);
        return codec.encode_status(id, StatusCode::OK);
      });
      break;
    }

    case PacketType::FSTAT:
      submit_for_handle(handle_id, id, [storage, handles, codec, id, handle_id]() {
        const handle::HandleInfo info = handles->stat(handle_id);
        const bool is_file = info.kind == handle::HandleKind::FILE;

        backend::FileAttributes attrs;
        try {
          attrs = storage->file_info(info.path);
        } catch (const backend::BackendError& e) {
          // A file created by this handle only reaches the backend on close
          if (e.code() != backend::BackendErrc::NOT_FOUND) {
            throw;
          }
          attrs = is_file ? backend::FileAttributes::file(info.size, std::nullopt)
                          : backend::FileAttributes::directory(std::nullopt);
        }
        if (is_file) {
          attrs.size = info.size;
        }
        return codec.encode_attrs(id, attrs);
      });
      break;

    case PacketType::FSETSTAT:
      submit_for_handle(handle_id, id, [handles, codec, id, handle_id]() {
        handles->stat(handle_id);
        return codec.encode_status(id, StatusCode::OK);
      });
      break;

    case PacketType::READDIR: {
      const std::size_t batch = options_.read_dir_batch;
      submit_for_handle(handle_id, id, [handles, codec, id, handle_id, batch]() {
        const std::vector<backend::DirEntry> entries = handles->read_dir(handle_id, batch);
        if (entries.empty()) {
          return codec.encode_status(id, StatusCode::END_OF_FILE);
        }
        return codec.encode_name(id, entries);
      });
      break;
    }

    default:
      send(codec_.encode_status(id, StatusCode::OP_UNSUPPORTED));
      break;
  }
}


//==============================================
// WORK SCHEDULING
//==============================================

void ProtocolEngine::submit(uint32_t request_id, Work work) {
  ++pending_;
  run_on_worker(request_id, std::move(work), std::nullopt);
}

void ProtocolEngine::submit_for_handle(uint64_t handle_id, uint32_t request_id, Work work) {
  ++pending_;
  auto& queue = handle_queues_[handle_id];
  queue.push_back(QueuedWork{request_id, std::move(work)});
  if (queue.size() == 1) {
    start_next_for_handle(handle_id);
  }
}

void ProtocolEngine::start_next_for_handle(uint64_t handle_id) {
  auto it = handle_queues_.find(handle_id);
  if (it == handle_queues_.end() || it->second.empty()) {
    return;
  }
  // The front entry stays queued until its reply arrives
  QueuedWork& next = it->second.front();
  run_on_worker(next.request_id, std::move(next.work), handle_id);
}

void ProtocolEngine::finish_for_handle(uint64_t handle_id) {
  auto it = handle_queues_.find(handle_id);
  if (it == handle_queues_.end()) {
    return;
  }
  it->second.pop_front();
  if (it->second.empty()) {
    handle_queues_.erase(it);
    return;
  }
  start_next_for_handle(handle_id);
}

void ProtocolEngine::run_on_worker(uint32_t request_id, Work work, std::optional<uint64_t> handle_id) {
  ++in_flight_;
  auto self = shared_from_this();
  const Codec codec = codec_;

  boost::asio::post(workers_, [self, codec, request_id, handle_id, work = std::move(work)]() {
    Outcome outcome = execute(codec, request_id, work);
    boost::asio::post(self->strand_, [self, handle_id, outcome = std::move(outcome)]() mutable {
      self->complete(std::move(outcome));
      if (handle_id) {
        self->finish_for_handle(*handle_id);
      }
    });
  });
}

ProtocolEngine::Outcome ProtocolEngine::execute(const Codec& codec, uint32_t request_id, const Work& work) {
  try {
    return Outcome{work(), false};
  } catch (const backend::BackendError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Protocol engine: Request " << request_id << " failed: " << e.what();
    return Outcome{codec.encode_status(request_id, to_status(e.code()), e.what()),
                   e.code() == backend::BackendErrc::UNAVAILABLE};
  } catch (const handle::HandleError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Protocol engine: Request " << request_id << " failed: " << e.what();
    return Outcome{codec.encode_status(request_id, to_status(e.code()), e.what()), false};
  } catch (const path::PathError& e) {
    return Outcome{codec.encode_status(request_id, invalid_path_status(), e.what()), false};
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Protocol engine: Unexpected failure of request " << request_id << ": " << e.what();
    return Outcome{codec.encode_status(request_id, StatusCode::FAILURE, e.what()), false};
  }
}

void ProtocolEngine::complete(Outcome outcome) {
  --in_flight_;
  --pending_;
  if (state_.is_closed()) {
    BOOST_LOG_TRIVIAL(debug) << "Protocol engine: Dropping reply for closed connection";
    return;
  }

  send(std::move(outcome.reply));

  if (!outcome.unavailable) {
    consecutive_unavailable_ = 0;
    return;
  }
  ++consecutive_unavailable_;
  if (options_.max_consecutive_unavailable > 0 &&
      consecutive_unavailable_ >= options_.max_consecutive_unavailable) {
    close_connection("backend unavailable for " + std::to_string(consecutive_unavailable_) +
                     " consecutive requests");
  }
}


//==============================================
// REPLIES AND TEARDOWN
//==============================================

void ProtocolEngine::send(Packet reply) {
  if (reply_handler_) {
    reply_handler_(std::move(reply));
  }
}

void ProtocolEngine::close_connection(const std::string& reason) {
  if (!enter_closed()) {
    return;
  }
  BOOST_LOG_TRIVIAL(warning) << "Protocol engine: Closing connection: " << reason;
  if (close_handler_) {
    close_handler_(reason);
  }
}

bool ProtocolEngine::enter_closed() {
  if (!state_.transition_to(ProtocolState::State::CLOSED)) {
    return false;
  }
  handle_queues_.clear();
  // Only work already on the workers can still complete
  pending_ = in_flight_;
  handles_->discard_all();
  return true;
}

} // namespace protocol
} // namespace sftpgw
