#ifndef SFTPGW_PROTOCOL_ERROR_HPP
#define SFTPGW_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sftpgw {
namespace protocol {

// Malformed or out-of-sequence traffic. Always fatal for the connection.
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string& message)
    : std::runtime_error("Protocol error: " + message) {}
};

} // namespace protocol
} // namespace sftpgw

#endif // SFTPGW_PROTOCOL_ERROR_HPP
