#include <gtest/gtest.h>
#include "protocol/codec.hpp"
#include "protocol/packet_io.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/status.hpp"

using namespace sftpgw::protocol;
using sftpgw::backend::DirEntry;
using sftpgw::backend::FileAttributes;
using sftpgw::backend::FileType;

class CodecTest : public ::testing::Test {
protected:
  Codec codec;

  // Packet body as the session hands it to the codec, without the length prefix
  static std::vector<uint8_t> body_of(const std::vector<uint8_t>& packet) {
    return std::vector<uint8_t>(packet.begin() + LENGTH_PREFIX_SIZE, packet.end());
  }

  // Reader positioned after the type byte of an encoded reply
  static PacketReader reply_reader(const std::vector<uint8_t>& packet, PacketType expected) {
    EXPECT_GT(packet.size(), LENGTH_PREFIX_SIZE);
    EXPECT_EQ(packet[LENGTH_PREFIX_SIZE], static_cast<uint8_t>(expected));
    return PacketReader(packet.data() + LENGTH_PREFIX_SIZE + 1, packet.size() - LENGTH_PREFIX_SIZE - 1);
  }

  static uint32_t status_of(const std::vector<uint8_t>& packet) {
    PacketReader reader = reply_reader(packet, PacketType::STATUS);
    reader.read_uint32();
    return reader.read_uint32();
  }
};

TEST_F(CodecTest, VersionLimits) {
  EXPECT_EQ(codec.version(), 3u);
  codec.set_version(4);
  EXPECT_EQ(codec.version(), 4u);
  EXPECT_THROW(codec.set_version(2), ProtocolError);
  EXPECT_THROW(codec.set_version(5), ProtocolError);
}

TEST_F(CodecTest, DecodeInit) {
  const auto packet = PacketWriter(PacketType::INIT).write_uint32(6).finish();
  const Request request = codec.decode(body_of(packet));
  EXPECT_EQ(request.type, PacketType::INIT);
  EXPECT_EQ(request.version, 6u);
}

TEST_F(CodecTest, DecodeOpenWithAttributes) {
  const auto packet = PacketWriter(PacketType::OPEN)
    .write_uint32(11)
    .write_string("/data/file.bin")
    .write_uint32(open_flags::WRITE | open_flags::CREAT)
    .write_uint32(attr_flags::PERMISSIONS)
    .write_uint32(0100640)
    .finish();

  const Request request = codec.decode(body_of(packet));
  EXPECT_EQ(request.type, PacketType::OPEN);
  EXPECT_EQ(request.id, 11u);
  EXPECT_EQ(request.path, "/data/file.bin");
  EXPECT_EQ(request.pflags, open_flags::WRITE | open_flags::CREAT);
  EXPECT_EQ(request.attrs.permissions.value_or(0), 0640u);
  EXPECT_EQ(request.attrs.type, FileType::REGULAR);
}

TEST_F(CodecTest, DecodeReadWriteAndRename) {
  const auto read = codec.decode(body_of(PacketWriter(PacketType::READ)
    .write_uint32(1).write_string("7").write_uint64(4096).write_uint32(512).finish()));
  EXPECT_EQ(read.handle, "7");
  EXPECT_EQ(read.offset, 4096u);
  EXPECT_EQ(read.length, 512u);

  const auto write = codec.decode(body_of(PacketWriter(PacketType::WRITE)
    .write_uint32(2).write_string("7").write_uint64(10).write_binary({1, 2, 3}).finish()));
  EXPECT_EQ(write.offset, 10u);
  EXPECT_EQ(write.data, (std::vector<uint8_t>{1, 2, 3}));

  const auto rename = codec.decode(body_of(PacketWriter(PacketType::RENAME)
    .write_uint32(3).write_string("/old").write_string("/new").finish()));
  EXPECT_EQ(rename.path, "/old");
  EXPECT_EQ(rename.target_path, "/new");
}

TEST_F(CodecTest, DecodeVersion4Attributes) {
  codec.set_version(4);
  const auto packet = PacketWriter(PacketType::MKDIR)
    .write_uint32(5)
    .write_string("/dir")
    .write_uint32(attr_flags::PERMISSIONS | attr_flags::OWNERGROUP | attr_flags::MODIFYTIME |
                  attr_flags::SUBSECOND_TIMES)
    .write_byte(static_cast<uint8_t>(FileType::DIRECTORY))
    .write_string("alice")
    .write_string("staff")
    .write_uint32(0750)
    .write_uint64(1700000000)
    .write_uint32(123)
    .finish();

  const Request request = codec.decode(body_of(packet));
  EXPECT_EQ(request.path, "/dir");
  EXPECT_EQ(request.attrs.type, FileType::DIRECTORY);
  EXPECT_EQ(request.attrs.permissions.value_or(0), 0750u);
  EXPECT_EQ(request.attrs.mtime.value_or(0), 1700000000u);
}

TEST_F(CodecTest, UnknownTypeKeepsId) {
  const std::vector<uint8_t> body = {99, 0x00, 0x00, 0x01, 0x02};
  const Request request = codec.decode(body);
  EXPECT_EQ(static_cast<uint8_t>(request.type), 99);
  EXPECT_EQ(request.id, 0x0102u);
}

TEST_F(CodecTest, TruncatedRequestThrows) {
  const auto packet = PacketWriter(PacketType::READ).write_uint32(1).write_string("1").finish();
  EXPECT_THROW(codec.decode(body_of(packet)), ProtocolError);

  const std::vector<uint8_t> missing_id = {static_cast<uint8_t>(PacketType::STAT), 0x00};
  EXPECT_THROW(codec.decode(missing_id), ProtocolError);
}

TEST_F(CodecTest, EncodeStatusCarriesMessageAndLanguage) {
  const auto packet = codec.encode_status(42, StatusCode::NO_SUCH_FILE);
  PacketReader reader = reply_reader(packet, PacketType::STATUS);
  EXPECT_EQ(reader.read_uint32(), 42u);
  EXPECT_EQ(reader.read_uint32(), static_cast<uint32_t>(StatusCode::NO_SUCH_FILE));
  EXPECT_EQ(reader.read_string(), "No such file");
  EXPECT_EQ(reader.read_string(), "en");
  EXPECT_TRUE(reader.empty());
}

TEST_F(CodecTest, StatusCodesAreClampedToVersion) {
  EXPECT_EQ(status_of(codec.encode_status(1, StatusCode::FILE_ALREADY_EXISTS)),
            static_cast<uint32_t>(StatusCode::FAILURE));
  EXPECT_EQ(status_of(codec.encode_status(1, StatusCode::NOT_A_DIRECTORY)),
            static_cast<uint32_t>(StatusCode::NO_SUCH_FILE));

  codec.set_version(4);
  EXPECT_EQ(status_of(codec.encode_status(1, StatusCode::FILE_ALREADY_EXISTS)),
            static_cast<uint32_t>(StatusCode::FILE_ALREADY_EXISTS));
  EXPECT_EQ(status_of(codec.encode_status(1, StatusCode::DIR_NOT_EMPTY)),
            static_cast<uint32_t>(StatusCode::FAILURE));
}

TEST_F(CodecTest, Version3NameIncludesLongname) {
  const DirEntry entry{"report.txt", FileAttributes::file(1234, 0)};
  const auto packet = codec.encode_name(9, {entry});

  PacketReader reader = reply_reader(packet, PacketType::NAME);
  EXPECT_EQ(reader.read_uint32(), 9u);
  EXPECT_EQ(reader.read_uint32(), 1u);
  EXPECT_EQ(reader.read_string(), "report.txt");
  const std::string longname = reader.read_string();
  EXPECT_EQ(longname.substr(0, 10), "-rw-r--r--");
  EXPECT_NE(longname.find("1234"), std::string::npos);
  EXPECT_EQ(longname.substr(longname.size() - 10), "report.txt");

  const FileAttributes attrs = codec.read_attributes(reader);
  EXPECT_EQ(attrs.size.value_or(0), 1234u);
  EXPECT_EQ(attrs.type, FileType::REGULAR);
  EXPECT_TRUE(reader.empty());
}

TEST_F(CodecTest, Version4NameOmitsLongname) {
  codec.set_version(4);
  const DirEntry entry{"sub", FileAttributes::directory(1000)};
  const auto packet = codec.encode_name(3, {entry});

  PacketReader reader = reply_reader(packet, PacketType::NAME);
  reader.read_uint32();
  EXPECT_EQ(reader.read_uint32(), 1u);
  EXPECT_EQ(reader.read_string(), "sub");
  // Attribute flags come next, then the type byte
  reader.read_uint32();
  EXPECT_EQ(reader.read_byte(), static_cast<uint8_t>(FileType::DIRECTORY));
}

TEST_F(CodecTest, Version3AttributesAlwaysCarryFileType) {
  FileAttributes attrs;
  attrs.type = FileType::DIRECTORY;
  const auto packet = codec.encode_attrs(1, attrs);

  PacketReader reader = reply_reader(packet, PacketType::ATTRS);
  reader.read_uint32();
  EXPECT_EQ(reader.read_uint32(), attr_flags::PERMISSIONS);
  EXPECT_EQ(reader.read_uint32() & MODE_TYPE_MASK, MODE_DIRECTORY);
}

TEST_F(CodecTest, Version3TimesFillEachOther) {
  FileAttributes attrs;
  attrs.type = FileType::REGULAR;
  attrs.mtime = 500;
  const auto packet = codec.encode_attrs(1, attrs);

  PacketReader reader = reply_reader(packet, PacketType::ATTRS);
  reader.read_uint32();
  const FileAttributes decoded = codec.read_attributes(reader);
  EXPECT_EQ(decoded.atime.value_or(0), 500u);
  EXPECT_EQ(decoded.mtime.value_or(0), 500u);
}

TEST_F(CodecTest, LongnameOfUnknownEntryIsItsName) {
  const DirEntry entry{"mystery", FileAttributes{}};
  EXPECT_EQ(Codec::format_longname(entry), "mystery");
}

TEST_F(CodecTest, ModeBits) {
  EXPECT_EQ(Codec::mode_bits(FileAttributes::directory(std::nullopt)), MODE_DIRECTORY | 0755u);
  EXPECT_EQ(Codec::mode_bits(FileAttributes::file(0, std::nullopt)), MODE_REGULAR | 0644u);
  EXPECT_EQ(Codec::mode_bits(FileAttributes{}), 0u);
}

TEST_F(CodecTest, HandleAndDataReplies) {
  const auto handle_packet = codec.encode_handle(4, "12");
  PacketReader handle = reply_reader(handle_packet, PacketType::HANDLE);
  EXPECT_EQ(handle.read_uint32(), 4u);
  EXPECT_EQ(handle.read_string(), "12");

  const auto data_packet = codec.encode_data(5, {9, 8, 7});
  PacketReader data = reply_reader(data_packet, PacketType::DATA);
  EXPECT_EQ(data.read_uint32(), 5u);
  EXPECT_EQ(data.read_binary(), (std::vector<uint8_t>{9, 8, 7}));

  const auto version_packet = codec.encode_version(3);
  PacketReader version = reply_reader(version_packet, PacketType::VERSION);
  EXPECT_EQ(version.read_uint32(), 3u);
}

TEST_F(CodecTest, LargestDataReplyFitsClientMessageLimit) {
  const auto packet = codec.encode_data(7, std::vector<uint8_t>(MAX_READ_LENGTH, 'x'));
  const uint32_t body_length = decode_length_prefix(packet.data());

  EXPECT_EQ(body_length, packet.size() - LENGTH_PREFIX_SIZE);
  EXPECT_LE(body_length, MAX_MESSAGE_LENGTH);
}

TEST(StatusMappingTest, BackendErrors) {
  using sftpgw::backend::BackendErrc;
  EXPECT_EQ(to_status(BackendErrc::NOT_FOUND), StatusCode::NO_SUCH_FILE);
  EXPECT_EQ(to_status(BackendErrc::ALREADY_EXISTS), StatusCode::FILE_ALREADY_EXISTS);
  EXPECT_EQ(to_status(BackendErrc::PERMISSION_DENIED), StatusCode::PERMISSION_DENIED);
  EXPECT_EQ(to_status(BackendErrc::UNAVAILABLE), StatusCode::NO_CONNECTION);
  EXPECT_EQ(to_status(BackendErrc::IO_ERROR), StatusCode::FAILURE);
}

TEST(StatusMappingTest, HandleErrors) {
  using sftpgw::handle::HandleErrc;
  EXPECT_EQ(to_status(HandleErrc::INVALID_HANDLE), StatusCode::INVALID_HANDLE);
  EXPECT_EQ(to_status(HandleErrc::WRONG_HANDLE_TYPE), StatusCode::INVALID_HANDLE);
  EXPECT_EQ(to_status(HandleErrc::ACCESS_DENIED), StatusCode::PERMISSION_DENIED);
}

TEST(StatusMappingTest, VersionClamping) {
  EXPECT_EQ(max_status_code(3), 8u);
  EXPECT_EQ(max_status_code(4), 13u);
  EXPECT_EQ(clamp_to_version(StatusCode::OP_UNSUPPORTED, 3), StatusCode::OP_UNSUPPORTED);
  EXPECT_EQ(clamp_to_version(StatusCode::INVALID_HANDLE, 3), StatusCode::FAILURE);
  EXPECT_EQ(clamp_to_version(StatusCode::INVALID_FILENAME, 4), StatusCode::NO_SUCH_FILE);
  EXPECT_EQ(clamp_to_version(StatusCode::WRITE_PROTECT, 3), StatusCode::PERMISSION_DENIED);
  EXPECT_EQ(clamp_to_version(StatusCode::NO_MEDIA, 4), StatusCode::NO_MEDIA);
}
