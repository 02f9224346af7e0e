#ifndef SFTPGW_HANDLE_MANAGER_HPP
#define SFTPGW_HANDLE_MANAGER_HPP

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "backend/backend.hpp"
#include "path/path_normalizer.hpp"

namespace sftpgw {
namespace handle {

enum class OpenMode {
  READ,
  WRITE,
  READ_WRITE
};

enum class HandleKind {
  FILE,
  DIRECTORY
};

enum class HandleErrc {
  // Unknown, closed or unparseable handle
  INVALID_HANDLE,
  // File operation on a directory handle or the reverse
  WRONG_HANDLE_TYPE,
  // Read on a write-only handle or write on a read-only one
  ACCESS_DENIED
};

const char* handle_errc_to_string(HandleErrc code);

class HandleError : public std::runtime_error {
public:
  HandleError(HandleErrc code, const std::string& detail)
    : std::runtime_error(std::string(handle_errc_to_string(code)) + ": " + detail)
    , code_(code) {}

  HandleErrc code() const { return code_; }

private:
  HandleErrc code_;
};

struct OpenFile {
  path::NormalizedPath path;
  uint64_t cursor = 0;
  OpenMode mode = OpenMode::READ;
  // Content snapshot for reading, buffered content for writing
  backend::Bytes data;
  // Writes always land at the end of data
  bool append = false;
};

struct OpenDirectory {
  path::NormalizedPath path;
  std::deque<backend::DirEntry> pending_entries;
  bool loaded = false;
  bool exhausted = false;
};

struct HandleInfo {
  path::NormalizedPath path;
  HandleKind kind;
  OpenMode mode;
  // Current length of the file data, 0 for directories
  uint64_t size;
};

/**
 * Per-connection table of open files and directory listings.
 *
 * Ids start at 1 and are never reused by the same manager. Writes are buffered
 * and handed to the backend as a whole file when the handle is closed.
 * All methods are thread safe; backend calls happen without holding the table lock.
 */
class HandleManager {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit HandleManager(std::shared_ptr<backend::Backend> backend);
  ~HandleManager() = default;

  HandleManager(const HandleManager&) = delete;
  HandleManager& operator=(const HandleManager&) = delete;


  // ---- OPENING ----
  // Stores data as the read snapshot or initial write buffer
  uint64_t open_file(const path::NormalizedPath& path, OpenMode mode, backend::Bytes data, bool append = false);
  uint64_t open_dir(const path::NormalizedPath& path);


  // ---- FILE OPERATIONS ----
  // Up to length bytes from offset (or the cursor), empty at end of file
  backend::Bytes read(uint64_t id, uint32_t length, std::optional<uint64_t> offset = std::nullopt);
  // Writes into the buffer at offset (or the cursor), zero filling any gap
  void write(uint64_t id, const backend::Bytes& data, std::optional<uint64_t> offset = std::nullopt);


  // ---- DIRECTORY OPERATIONS ----
  // Next batch of at most max_entries, empty once the listing is exhausted
  std::vector<backend::DirEntry> read_dir(uint64_t id, std::size_t max_entries);


  // ---- LIFECYCLE ----
  // Flushes write buffers to the backend and forgets the handle.
  // The handle survives a failed flush so the close can be retried.
  void close(uint64_t id);
  // Drops every handle without flushing, returns how many were open
  std::size_t discard_all();


  // ---- QUERY OPERATIONS ----
  HandleInfo stat(uint64_t id) const;
  bool contains(uint64_t id) const;
  std::size_t size() const;


  // ---- WIRE REPRESENTATION ----
  static std::string format_handle(uint64_t id);
  // Throws HandleError(INVALID_HANDLE) for anything but a decimal id
  static uint64_t parse_handle(const std::string& handle);

private:
  using Entry = std::variant<OpenFile, OpenDirectory>;

  // ---- PARAMETERS ----
  std::shared_ptr<backend::Backend> backend_;
  std::map<uint64_t, Entry> handles_;
  uint64_t next_id_;
  mutable std::mutex mutex_;


  // ---- UTILITY METHODS ----
  // Both require the caller to hold mutex_
  Entry& require_entry(uint64_t id);
  OpenFile& require_file(uint64_t id);
};

} // namespace handle
} // namespace sftpgw

#endif // SFTPGW_HANDLE_MANAGER_HPP
