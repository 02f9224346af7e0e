#include "backend/backend.hpp"
#include <chrono>

namespace sftpgw {
namespace backend {

namespace {

constexpr uint32_t DIRECTORY_PERMISSIONS = 0755;
constexpr uint32_t FILE_PERMISSIONS = 0644;
constexpr uint32_t DEFAULT_OWNER = 1000;

} // namespace

FileAttributes FileAttributes::directory(std::optional<uint32_t> mtime) {
  FileAttributes attrs;
  attrs.type = FileType::DIRECTORY;
  attrs.permissions = DIRECTORY_PERMISSIONS;
  attrs.mtime = mtime;
  attrs.atime = mtime;
  attrs.uid = DEFAULT_OWNER;
  attrs.gid = DEFAULT_OWNER;
  return attrs;
}

FileAttributes FileAttributes::file(uint64_t size, std::optional<uint32_t> mtime) {
  FileAttributes attrs;
  attrs.type = FileType::REGULAR;
  attrs.size = size;
  attrs.permissions = FILE_PERMISSIONS;
  attrs.mtime = mtime;
  attrs.atime = mtime;
  attrs.uid = DEFAULT_OWNER;
  attrs.gid = DEFAULT_OWNER;
  return attrs;
}

const char* backend_errc_to_string(BackendErrc code) {
  switch (code) {
    case BackendErrc::NOT_FOUND: return "No such file or directory";
    case BackendErrc::ALREADY_EXISTS: return "File already exists";
    case BackendErrc::NOT_A_DIRECTORY: return "Not a directory";
    case BackendErrc::IS_A_DIRECTORY: return "Is a directory";
    case BackendErrc::NOT_EMPTY: return "Directory not empty";
    case BackendErrc::PERMISSION_DENIED: return "Permission denied";
    case BackendErrc::UNAVAILABLE: return "Storage unavailable";
    case BackendErrc::IO_ERROR: return "I/O error";
    default: return "Undefined error";
  }
}

BackendError::BackendError(BackendErrc code, const std::string& detail)
  : std::runtime_error(std::string(backend_errc_to_string(code)) + ": " + detail)
  , code_(code) {}

BackendError::BackendError(BackendErrc code)
  : std::runtime_error(backend_errc_to_string(code))
  , code_(code) {}

uint32_t current_timestamp() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

} // namespace backend
} // namespace sftpgw
