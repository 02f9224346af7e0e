#include "protocol/status.hpp"

namespace sftpgw {
namespace protocol {

StatusCode to_status(backend::BackendErrc code) {
  switch (code) {
    case backend::BackendErrc::NOT_FOUND: return StatusCode::NO_SUCH_FILE;
    case backend::BackendErrc::ALREADY_EXISTS: return StatusCode::FILE_ALREADY_EXISTS;
    case backend::BackendErrc::NOT_A_DIRECTORY: return StatusCode::NOT_A_DIRECTORY;
    case backend::BackendErrc::IS_A_DIRECTORY: return StatusCode::FILE_IS_A_DIRECTORY;
    case backend::BackendErrc::NOT_EMPTY: return StatusCode::DIR_NOT_EMPTY;
    case backend::BackendErrc::PERMISSION_DENIED: return StatusCode::PERMISSION_DENIED;
    case backend::BackendErrc::UNAVAILABLE: return StatusCode::NO_CONNECTION;
    case backend::BackendErrc::IO_ERROR: return StatusCode::FAILURE;
    default: return StatusCode::FAILURE;
  }
}

StatusCode to_status(handle::HandleErrc code) {
  switch (code) {
    case handle::HandleErrc::INVALID_HANDLE: return StatusCode::INVALID_HANDLE;
    case handle::HandleErrc::WRONG_HANDLE_TYPE: return StatusCode::INVALID_HANDLE;
    case handle::HandleErrc::ACCESS_DENIED: return StatusCode::PERMISSION_DENIED;
    default: return StatusCode::FAILURE;
  }
}

StatusCode invalid_path_status() {
  return StatusCode::INVALID_FILENAME;
}

uint32_t max_status_code(uint32_t version) {
  if (version <= 3) {
    return static_cast<uint32_t>(StatusCode::OP_UNSUPPORTED);
  }
  return static_cast<uint32_t>(StatusCode::NO_MEDIA);
}

StatusCode clamp_to_version(StatusCode code, uint32_t version) {
  if (static_cast<uint32_t>(code) <= max_status_code(version)) {
    return code;
  }

  switch (code) {
    case StatusCode::NOT_A_DIRECTORY:
    case StatusCode::INVALID_FILENAME:
    case StatusCode::NO_SUCH_PATH:
      return StatusCode::NO_SUCH_FILE;
    case StatusCode::WRITE_PROTECT:
      return StatusCode::PERMISSION_DENIED;
    default:
      return StatusCode::FAILURE;
  }
}

const char* status_message(StatusCode code) {
  switch (code) {
    case StatusCode::OK: return "Success";
    case StatusCode::END_OF_FILE: return "End of file";
    case StatusCode::NO_SUCH_FILE: return "No such file";
    case StatusCode::PERMISSION_DENIED: return "Permission denied";
    case StatusCode::FAILURE: return "Failure";
    case StatusCode::BAD_MESSAGE: return "Bad message";
    case StatusCode::NO_CONNECTION: return "No connection";
    case StatusCode::CONNECTION_LOST: return "Connection lost";
    case StatusCode::OP_UNSUPPORTED: return "Operation unsupported";
    case StatusCode::INVALID_HANDLE: return "Invalid handle";
    case StatusCode::NO_SUCH_PATH: return "No such path";
    case StatusCode::FILE_ALREADY_EXISTS: return "File already exists";
    case StatusCode::WRITE_PROTECT: return "Write protected";
    case StatusCode::NO_MEDIA: return "No media";
    case StatusCode::DIR_NOT_EMPTY: return "Directory not empty";
    case StatusCode::NOT_A_DIRECTORY: return "Not a directory";
    case StatusCode::INVALID_FILENAME: return "Invalid filename";
    case StatusCode::FILE_IS_A_DIRECTORY: return "File is a directory";
    default: return "Unknown status";
  }
}

} // namespace protocol
} // namespace sftpgw
