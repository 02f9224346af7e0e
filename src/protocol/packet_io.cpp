#include "protocol/packet_io.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/endian/conversion.hpp>
#include <cstring>

namespace sftpgw {
namespace protocol {

//==============================================
// PACKET READER
//==============================================

PacketReader::PacketReader(const uint8_t* data, std::size_t size)
  : data_(data)
  , size_(size)
  , position_(0) {}

PacketReader::PacketReader(const std::vector<uint8_t>& data)
  : PacketReader(data.data(), data.size()) {}

uint8_t PacketReader::read_byte() {
  require(1, "byte");
  return data_[position_++];
}

uint32_t PacketReader::read_uint32() {
  require(sizeof(uint32_t), "uint32");
  uint32_t network_value;
  std::memcpy(&network_value, data_ + position_, sizeof(network_value));
  position_ += sizeof(network_value);
  return boost::endian::big_to_native(network_value);
}

uint64_t PacketReader::read_uint64() {
  require(sizeof(uint64_t), "uint64");
  uint64_t network_value;
  std::memcpy(&network_value, data_ + position_, sizeof(network_value));
  position_ += sizeof(network_value);
  return boost::endian::big_to_native(network_value);
}

std::string PacketReader::read_string() {
  const uint32_t length = read_uint32();
  require(length, "string body");
  std::string value(reinterpret_cast<const char*>(data_ + position_), length);
  position_ += length;
  return value;
}

std::vector<uint8_t> PacketReader::read_binary() {
  const uint32_t length = read_uint32();
  require(length, "string body");
  std::vector<uint8_t> value(data_ + position_, data_ + position_ + length);
  position_ += length;
  return value;
}

void PacketReader::require(std::size_t count, const char* what) const {
  if (count > remaining()) {
    throw ProtocolError(std::string("truncated packet while reading ") + what);
  }
}


//==============================================
// PACKET WRITER
//==============================================

PacketWriter::PacketWriter(PacketType type) {
  // Placeholder for the length prefix
  buffer_.resize(LENGTH_PREFIX_SIZE, 0);
  buffer_.push_back(static_cast<uint8_t>(type));
}

PacketWriter& PacketWriter::write_byte(uint8_t value) {
  buffer_.push_back(value);
  return *this;
}

PacketWriter& PacketWriter::write_uint32(uint32_t value) {
  const uint32_t network_value = boost::endian::native_to_big(value);
  append(&network_value, sizeof(network_value));
  return *this;
}

PacketWriter& PacketWriter::write_uint64(uint64_t value) {
  const uint64_t network_value = boost::endian::native_to_big(value);
  append(&network_value, sizeof(network_value));
  return *this;
}

PacketWriter& PacketWriter::write_string(std::string_view value) {
  write_uint32(static_cast<uint32_t>(value.size()));
  append(value.data(), value.size());
  return *this;
}

PacketWriter& PacketWriter::write_binary(const std::vector<uint8_t>& value) {
  write_uint32(static_cast<uint32_t>(value.size()));
  append(value.data(), value.size());
  return *this;
}

std::vector<uint8_t> PacketWriter::finish() {
  const auto body_length = static_cast<uint32_t>(buffer_.size() - LENGTH_PREFIX_SIZE);
  const uint32_t network_length = boost::endian::native_to_big(body_length);
  std::memcpy(buffer_.data(), &network_length, sizeof(network_length));
  return std::move(buffer_);
}

void PacketWriter::append(const void* data, std::size_t size) {
  const auto* bytes = static_cast<const uint8_t*>(data);
  buffer_.insert(buffer_.end(), bytes, bytes + size);
}


//==============================================
// FRAMING
//==============================================

uint32_t decode_length_prefix(const uint8_t* header) {
  uint32_t network_length;
  std::memcpy(&network_length, header, sizeof(network_length));
  const uint32_t length = boost::endian::big_to_native(network_length);
  if (length == 0) {
    throw ProtocolError("empty packet");
  }
  if (length > MAX_PACKET_SIZE) {
    throw ProtocolError("packet of " + std::to_string(length) + " bytes exceeds the limit of " +
                        std::to_string(MAX_PACKET_SIZE));
  }
  return length;
}

} // namespace protocol
} // namespace sftpgw
