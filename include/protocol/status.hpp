#ifndef SFTPGW_STATUS_HPP
#define SFTPGW_STATUS_HPP

#include <cstdint>
#include "backend/backend.hpp"
#include "handle/handle_manager.hpp"
#include "protocol/sftp_constants.hpp"

namespace sftpgw {
namespace protocol {

// ---- ERROR TO STATUS MAPPING ----
StatusCode to_status(backend::BackendErrc code);
StatusCode to_status(handle::HandleErrc code);
// Status for path::PathError
StatusCode invalid_path_status();

// ---- VERSION CLAMPING ----
// Highest status code a protocol version defines
uint32_t max_status_code(uint32_t version);
// Replaces codes the version does not define with their closest older equivalent
StatusCode clamp_to_version(StatusCode code, uint32_t version);

// Default English message for a status
const char* status_message(StatusCode code);

} // namespace protocol
} // namespace sftpgw

#endif // SFTPGW_STATUS_HPP
