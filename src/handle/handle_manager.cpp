#include "handle/handle_manager.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>

namespace sftpgw {
namespace handle {

namespace {

// Longest decimal representation of a uint64_t
constexpr std::size_t MAX_HANDLE_DIGITS = 20;
// Upper bound for a buffered write
constexpr uint64_t MAX_BUFFER_SIZE = uint64_t{1} << 30;

bool can_read(OpenMode mode) {
  return mode == OpenMode::READ || mode == OpenMode::READ_WRITE;
}

bool can_write(OpenMode mode) {
  return mode == OpenMode::WRITE || mode == OpenMode::READ_WRITE;
}

} // namespace

const char* handle_errc_to_string(HandleErrc code) {
  switch (code) {
    case HandleErrc::INVALID_HANDLE: return "Invalid handle";
    case HandleErrc::WRONG_HANDLE_TYPE: return "Wrong handle type";
    case HandleErrc::ACCESS_DENIED: return "Handle not opened for this access";
    default: return "Undefined error";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HandleManager::HandleManager(std::shared_ptr<backend::Backend> backend)
  : backend_(std::move(backend))
  , next_id_(1) {
  if (!backend_) {
    throw std::invalid_argument("Handle manager: backend must not be null");
  }
}


//==============================================
// OPENING
//==============================================

uint64_t HandleManager::open_file(const path::NormalizedPath& path, OpenMode mode, backend::Bytes data, bool append) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_id_++;

  OpenFile file;
  file.path = path.to_owned();
  file.mode = mode;
  file.data = std::move(data);
  file.append = append;
  handles_.emplace(id, std::move(file));

  BOOST_LOG_TRIVIAL(debug) << "Handle manager: Opened file handle " << id << " for " << path;
  return id;
}

uint64_t HandleManager::open_dir(const path::NormalizedPath& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_id_++;

  OpenDirectory dir;
  dir.path = path.to_owned();
  handles_.emplace(id, std::move(dir));

  BOOST_LOG_TRIVIAL(debug) << "Handle manager: Opened directory handle " << id << " for " << path;
  return id;
}


//==============================================
// FILE OPERATIONS
//==============================================

backend::Bytes HandleManager::read(uint64_t id, uint32_t length, std::optional<uint64_t> offset) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile& file = require_file(id);
  if (!can_read(file.mode)) {
    throw HandleError(HandleErrc::ACCESS_DENIED, HandleManager::format_handle(id));
  }

  if (offset) {
    file.cursor = *offset;
  }
  if (file.cursor >= file.data.size()) {
    return {};
  }

  const uint64_t available = file.data.size() - file.cursor;
  const auto count = static_cast<std::size_t>(std::min<uint64_t>(available, length));
  const auto begin = file.data.begin() + static_cast<std::ptrdiff_t>(file.cursor);
  backend::Bytes chunk(begin, begin + static_cast<std::ptrdiff_t>(count));
  file.cursor += count;
  return chunk;
}

void HandleManager::write(uint64_t id, const backend::Bytes& data, std::optional<uint64_t> offset) {
  std::lock_guard<std::mutex> lock(mutex_);
  OpenFile& file = require_file(id);
  if (!can_write(file.mode)) {
    throw HandleError(HandleErrc::ACCESS_DENIED, HandleManager::format_handle(id));
  }

  uint64_t start = file.cursor;
  if (file.append) {
    start = file.data.size();
  } else if (offset) {
    start = *offset;
  }

  if (start > MAX_BUFFER_SIZE || data.size() > MAX_BUFFER_SIZE - start) {
    throw std::length_error("Handle manager: write past the buffer limit on handle " + format_handle(id));
  }

  // Gaps between the end of the buffer and start read back as zeros
  const uint64_t end = start + data.size();
  if (end > file.data.size()) {
    file.data.resize(static_cast<std::size_t>(end), 0);
  }
  std::copy(data.begin(), data.end(), file.data.begin() + static_cast<std::ptrdiff_t>(start));
  file.cursor = end;
}


//==============================================
// DIRECTORY OPERATIONS
//==============================================

std::vector<backend::DirEntry> HandleManager::read_dir(uint64_t id, std::size_t max_entries) {
  std::unique_lock<std::mutex> lock(mutex_);
  Entry* entry = &require_entry(id);
  auto* dir = std::get_if<OpenDirectory>(entry);
  if (!dir) {
    throw HandleError(HandleErrc::WRONG_HANDLE_TYPE, HandleManager::format_handle(id));
  }

  if (!dir->loaded) {
    // List without holding the table lock, the handle may be discarded meanwhile
    const path::NormalizedPath dir_path = dir->path;
    lock.unlock();
    std::vector<backend::DirEntry> listing = backend_->list_dir(dir_path);
    lock.lock();

    entry = &require_entry(id);
    dir = std::get_if<OpenDirectory>(entry);
    if (!dir) {
      throw HandleError(HandleErrc::WRONG_HANDLE_TYPE, HandleManager::format_handle(id));
    }
    if (!dir->loaded) {
      dir->pending_entries.assign(std::make_move_iterator(listing.begin()),
                                  std::make_move_iterator(listing.end()));
      dir->loaded = true;
      BOOST_LOG_TRIVIAL(debug) << "Handle manager: Loaded " << dir->pending_entries.size()
                               << " entries for directory handle " << id;
    }
  }

  std::vector<backend::DirEntry> batch;
  if (dir->exhausted) {
    return batch;
  }
  while (!dir->pending_entries.empty() && batch.size() < max_entries) {
    batch.push_back(std::move(dir->pending_entries.front()));
    dir->pending_entries.pop_front();
  }
  if (batch.empty()) {
    dir->exhausted = true;
  }
  return batch;
}


//==============================================
// LIFECYCLE
//==============================================

void HandleManager::close(uint64_t id) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto node = handles_.extract(id);
  if (node.empty()) {
    throw HandleError(HandleErrc::INVALID_HANDLE, HandleManager::format_handle(id));
  }

  const auto* file = std::get_if<OpenFile>(&node.mapped());
  if (!file || !can_write(file->mode)) {
    BOOST_LOG_TRIVIAL(debug) << "Handle manager: Closed handle " << id;
    return;
  }

  lock.unlock();
  try {
    backend_->write_file(file->path, file->data);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Handle manager: Flush of handle " << id << " to " << file->path
                               << " failed: " << e.what();
    lock.lock();
    handles_.insert(std::move(node));
    throw;
  }
  BOOST_LOG_TRIVIAL(debug) << "Handle manager: Flushed " << file->data.size() << " bytes and closed handle " << id;
}

std::size_t HandleManager::discard_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t count = handles_.size();
  handles_.clear();
  if (count > 0) {
    BOOST_LOG_TRIVIAL(debug) << "Handle manager: Discarded " << count << " open handles";
  }
  return count;
}


//==============================================
// QUERY OPERATIONS
//==============================================

HandleInfo HandleManager::stat(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handles_.find(id);
  if (it == handles_.end()) {
    throw HandleError(HandleErrc::INVALID_HANDLE, HandleManager::format_handle(id));
  }

  if (const auto* file = std::get_if<OpenFile>(&it->second)) {
    return HandleInfo{file->path, HandleKind::FILE, file->mode, file->data.size()};
  }
  const auto& dir = std::get<OpenDirectory>(it->second);
  return HandleInfo{dir.path, HandleKind::DIRECTORY, OpenMode::READ, 0};
}

bool HandleManager::contains(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handles_.count(id) > 0;
}

std::size_t HandleManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handles_.size();
}


//==============================================
// WIRE REPRESENTATION
//==============================================

std::string HandleManager::format_handle(uint64_t id) {
  return std::to_string(id);
}

uint64_t HandleManager::parse_handle(const std::string& handle) {
  if (handle.empty() || handle.size() > MAX_HANDLE_DIGITS ||
      !std::all_of(handle.begin(), handle.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw HandleError(HandleErrc::INVALID_HANDLE, "'" + handle + "'");
  }
  try {
    return std::stoull(handle);
  } catch (const std::out_of_range&) {
    throw HandleError(HandleErrc::INVALID_HANDLE, "'" + handle + "'");
  }
}


//==============================================
// UTILITY METHODS
//==============================================

HandleManager::Entry& HandleManager::require_entry(uint64_t id) {
  auto it = handles_.find(id);
  if (it == handles_.end()) {
    throw HandleError(HandleErrc::INVALID_HANDLE, HandleManager::format_handle(id));
  }
  return it->second;
}

OpenFile& HandleManager::require_file(uint64_t id) {
  auto* file = std::get_if<OpenFile>(&require_entry(id));
  if (!file) {
    throw HandleError(HandleErrc::WRONG_HANDLE_TYPE, HandleManager::format_handle(id));
  }
  return *file;
}

} // namespace handle
} // namespace sftpgw
