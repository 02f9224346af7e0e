#ifndef SFTPGW_PROTOCOL_CODEC_HPP
#define SFTPGW_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "backend/backend.hpp"
#include "protocol/packet_io.hpp"
#include "protocol/sftp_constants.hpp"

namespace sftpgw {
namespace protocol {

// One decoded client packet. Only the fields of its type are filled in.
struct Request {
  PacketType type = PacketType::INIT;
  // Echoed in the reply, absent from INIT
  uint32_t id = 0;
  // INIT
  uint32_t version = 0;
  // Path argument, the old path of RENAME and the link path of SYMLINK
  std::string path;
  // New path of RENAME and the target of SYMLINK
  std::string target_path;
  std::string handle;
  uint32_t pflags = 0;
  uint64_t offset = 0;
  uint32_t length = 0;
  std::vector<uint8_t> data;
  // Request name of EXTENDED
  std::string extended_name;
  // Client supplied attributes of OPEN, MKDIR, SETSTAT and FSETSTAT
  backend::FileAttributes attrs;
};

/**
 * Translates between packet bodies and requests or replies.
 *
 * Attribute blocks and NAME entries depend on the negotiated version, set once
 * with set_version() before any request other than INIT is decoded.
 */
class Codec {
public:
  // ---- CONSTRUCTOR ----
  Codec();


  // ---- VERSION ----
  void set_version(uint32_t version);
  uint32_t version() const { return version_; }


  // ---- DECODING ----
  // body is the type byte and payload, without the length prefix
  Request decode(const std::vector<uint8_t>& body) const;
  backend::FileAttributes read_attributes(PacketReader& reader) const;


  // ---- ENCODING ----
  std::vector<uint8_t> encode_version(uint32_t version) const;
  // Codes the negotiated version does not define are clamped
  std::vector<uint8_t> encode_status(uint32_t id, StatusCode code, const std::string& message) const;
  std::vector<uint8_t> encode_status(uint32_t id, StatusCode code) const;
  std::vector<uint8_t> encode_handle(uint32_t id, const std::string& handle) const;
  std::vector<uint8_t> encode_data(uint32_t id, const std::vector<uint8_t>& data) const;
  std::vector<uint8_t> encode_name(uint32_t id, const std::vector<backend::DirEntry>& entries) const;
  std::vector<uint8_t> encode_attrs(uint32_t id, const backend::FileAttributes& attrs) const;
  void write_attributes(PacketWriter& writer, const backend::FileAttributes& attrs) const;


  // ---- FORMATTING ----
  // "ls -l" style line for version 3 NAME replies
  static std::string format_longname(const backend::DirEntry& entry);
  // Permission bits with the file type bits of attrs
  static uint32_t mode_bits(const backend::FileAttributes& attrs);

private:
  uint32_t version_;

  void write_attributes_v3(PacketWriter& writer, const backend::FileAttributes& attrs) const;
  void write_attributes_v4(PacketWriter& writer, const backend::FileAttributes& attrs) const;
  backend::FileAttributes read_attributes_v3(PacketReader& reader) const;
  backend::FileAttributes read_attributes_v4(PacketReader& reader) const;
};

} // namespace protocol
} // namespace sftpgw

#endif // SFTPGW_PROTOCOL_CODEC_HPP
