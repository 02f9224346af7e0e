#ifndef SFTPGW_PACKET_IO_HPP
#define SFTPGW_PACKET_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "protocol/sftp_constants.hpp"

namespace sftpgw {
namespace protocol {

/**
 * Sequential reader over one packet body in SSH binary encoding.
 * Every read past the end throws ProtocolError.
 */
class PacketReader {
public:
  PacketReader(const uint8_t* data, std::size_t size);
  explicit PacketReader(const std::vector<uint8_t>& data);

  uint8_t read_byte();
  uint32_t read_uint32();
  uint64_t read_uint64();
  // uint32 length followed by that many bytes
  std::string read_string();
  std::vector<uint8_t> read_binary();

  std::size_t remaining() const { return size_ - position_; }
  bool empty() const { return remaining() == 0; }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t position_;

  // Throws unless count more bytes are available
  void require(std::size_t count, const char* what) const;
};

/**
 * Builds one length-prefixed packet. The length is patched in by finish().
 */
class PacketWriter {
public:
  explicit PacketWriter(PacketType type);

  PacketWriter& write_byte(uint8_t value);
  PacketWriter& write_uint32(uint32_t value);
  PacketWriter& write_uint64(uint64_t value);
  PacketWriter& write_string(std::string_view value);
  PacketWriter& write_binary(const std::vector<uint8_t>& value);

  // Complete packet including its length prefix
  std::vector<uint8_t> finish();

private:
  std::vector<uint8_t> buffer_;

  void append(const void* data, std::size_t size);
};

// Reads the u32 length prefix of a packet, throws ProtocolError outside 1..MAX_PACKET_SIZE
uint32_t decode_length_prefix(const uint8_t* header);

} // namespace protocol
} // namespace sftpgw

#endif // SFTPGW_PACKET_IO_HPP
