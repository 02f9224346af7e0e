#ifndef SFTPGW_SFTP_CONSTANTS_HPP
#define SFTPGW_SFTP_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace sftpgw {
namespace protocol {

// ---- VERSIONS ----
constexpr uint32_t MIN_PROTOCOL_VERSION = 3;
constexpr uint32_t MAX_PROTOCOL_VERSION = 4;

// ---- LIMITS ----
// Largest packet body OpenSSH clients accept before dropping the connection
constexpr uint32_t MAX_MESSAGE_LENGTH = 256 * 1024;
// Room is left for the DATA reply header
constexpr uint32_t MAX_READ_LENGTH = MAX_MESSAGE_LENGTH - 1024;
// Largest accepted packet body: a full WRITE plus headers
constexpr uint32_t MAX_PACKET_SIZE = MAX_MESSAGE_LENGTH + 1024;
constexpr std::size_t LENGTH_PREFIX_SIZE = 4;

enum class PacketType : uint8_t {
  INIT = 1,
  VERSION = 2,
  OPEN = 3,
  CLOSE = 4,
  READ = 5,
  WRITE = 6,
  LSTAT = 7,
  FSTAT = 8,
  SETSTAT = 9,
  FSETSTAT = 10,
  OPENDIR = 11,
  READDIR = 12,
  REMOVE = 13,
  MKDIR = 14,
  RMDIR = 15,
  REALPATH = 16,
  STAT = 17,
  RENAME = 18,
  READLINK = 19,
  SYMLINK = 20,
  STATUS = 101,
  HANDLE = 102,
  DATA = 103,
  NAME = 104,
  ATTRS = 105,
  EXTENDED = 200,
  EXTENDED_REPLY = 201
};

const char* packet_type_to_string(PacketType type);

enum class StatusCode : uint32_t {
  OK = 0,
  END_OF_FILE = 1,
  NO_SUCH_FILE = 2,
  PERMISSION_DENIED = 3,
  FAILURE = 4,
  BAD_MESSAGE = 5,
  NO_CONNECTION = 6,
  CONNECTION_LOST = 7,
  OP_UNSUPPORTED = 8,
  INVALID_HANDLE = 9,
  NO_SUCH_PATH = 10,
  FILE_ALREADY_EXISTS = 11,
  WRITE_PROTECT = 12,
  NO_MEDIA = 13,
  DIR_NOT_EMPTY = 18,
  NOT_A_DIRECTORY = 19,
  INVALID_FILENAME = 20,
  FILE_IS_A_DIRECTORY = 24
};

// ---- OPEN FLAGS ----
namespace open_flags {
constexpr uint32_t READ = 0x00000001;
constexpr uint32_t WRITE = 0x00000002;
constexpr uint32_t APPEND = 0x00000004;
constexpr uint32_t CREAT = 0x00000008;
constexpr uint32_t TRUNC = 0x00000010;
constexpr uint32_t EXCL = 0x00000020;
} // namespace open_flags

// ---- ATTRIBUTE FLAGS ----
namespace attr_flags {
constexpr uint32_t SIZE = 0x00000001;
// Version 3 only
constexpr uint32_t UIDGID = 0x00000002;
constexpr uint32_t PERMISSIONS = 0x00000004;
// ACMODTIME in version 3, ACCESSTIME in version 4
constexpr uint32_t ACMODTIME = 0x00000008;
constexpr uint32_t ACCESSTIME = 0x00000008;
constexpr uint32_t CREATETIME = 0x00000010;
constexpr uint32_t MODIFYTIME = 0x00000020;
constexpr uint32_t ACL = 0x00000040;
constexpr uint32_t OWNERGROUP = 0x00000080;
constexpr uint32_t SUBSECOND_TIMES = 0x00000100;
constexpr uint32_t EXTENDED = 0x80000000;
} // namespace attr_flags

// ---- PERMISSION TYPE BITS ----
constexpr uint32_t MODE_TYPE_MASK = 0170000;
constexpr uint32_t MODE_DIRECTORY = 0040000;
constexpr uint32_t MODE_REGULAR = 0100000;
constexpr uint32_t MODE_SYMLINK = 0120000;

} // namespace protocol
} // namespace sftpgw

#endif // SFTPGW_SFTP_CONSTANTS_HPP
