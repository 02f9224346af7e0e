#include "protocol/codec.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/status.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sftpgw {
namespace protocol {

namespace {

constexpr uint32_t PERMISSION_MASK = 07777;

char type_char(backend::FileType type) {
  switch (type) {
    case backend::FileType::DIRECTORY: return 'd';
    case backend::FileType::SYMLINK: return 'l';
    case backend::FileType::REGULAR: return '-';
    default: return '?';
  }
}

// Skips the extended name/data pairs at the end of an attribute block
void skip_extended_pairs(PacketReader& reader) {
  const uint32_t count = reader.read_uint32();
  for (uint32_t i = 0; i < count; ++i) {
    reader.read_string();
    reader.read_string();
  }
}

} // namespace

const char* packet_type_to_string(PacketType type) {
  switch (type) {
    case PacketType::INIT: return "INIT";
    case PacketType::VERSION: return "VERSION";
    case PacketType::OPEN: return "OPEN";
    case PacketType::CLOSE: return "CLOSE";
    case PacketType::READ: return "READ";
    case PacketType::WRITE: return "WRITE";
    case PacketType::LSTAT: return "LSTAT";
    case PacketType::FSTAT: return "FSTAT";
    case PacketType::SETSTAT: return "SETSTAT";
    case PacketType::FSETSTAT: return "FSETSTAT";
    case PacketType::OPENDIR: return "OPENDIR";
    case PacketType::READDIR: return "READDIR";
    case PacketType::REMOVE: return "REMOVE";
    case PacketType::MKDIR: return "MKDIR";
    case PacketType::RMDIR: return "RMDIR";
    case PacketType::REALPATH: return "REALPATH";
    case PacketType::STAT: return "STAT";
    case PacketType::RENAME: return "RENAME";
    case PacketType::READLINK: return "READLINK";
    case PacketType::SYMLINK: return "SYMLINK";
    case PacketType::STATUS: return "STATUS";
    case PacketType::HANDLE: return "HANDLE";
    case PacketType::DATA: return "DATA";
    case PacketType::NAME: return "NAME";
    case PacketType::ATTRS: return "ATTRS";
    case PacketType::EXTENDED: return "EXTENDED";
    case PacketType::EXTENDED_REPLY: return "EXTENDED_REPLY";
    default: return "UNKNOWN";
  }
}

//==============================================
// CONSTRUCTOR
//==============================================

Codec::Codec() : version_(MIN_PROTOCOL_VERSION) {}


//==============================================
// VERSION
//==============================================

void Codec::set_version(uint32_t version) {
  if (version < MIN_PROTOCOL_VERSION || version > MAX_PROTOCOL_VERSION) {
    throw ProtocolError("unsupported protocol version " + std::to_string(version));
  }
  version_ = version;
}


//==============================================
// DECODING
//==============================================

Request Codec::decode(const std::vector<uint8_t>& body) const {
  PacketReader reader(body);
  Request request;
  request.type = static_cast<PacketType>(reader.read_byte());

  if (request.type == PacketType::INIT) {
    // Extension pairs of the client are ignored
    request.version = reader.read_uint32();
    return request;
  }

  request.id = reader.read_uint32();
  switch (request.type) {
    case PacketType::OPEN:
      request.path = reader.read_string();
      request.pflags = reader.read_uint32();
      request.attrs = read_attributes(reader);
      break;

    case PacketType::CLOSE:
    case PacketType::READDIR:
      request.handle = reader.read_string();
      break;

    case PacketType::READ:
      request.handle = reader.read_string();
      request.offset = reader.read_uint64();
      request.length = reader.read_uint32();
      break;

    case PacketType::WRITE:
      request.handle = reader.read_string();
      request.offset = reader.read_uint64();
      request.data = reader.read_binary();
      break;

    case PacketType::STAT:
    case PacketType::LSTAT:
      // Version 4 appends the attribute flags the client is interested in
      request.path = reader.read_string();
      break;

    case PacketType::FSTAT:
      request.handle = reader.read_string();
      break;

    case PacketType::SETSTAT:
    case PacketType::MKDIR:
      request.path = reader.read_string();
      request.attrs = read_attributes(reader);
      break;

    case PacketType::FSETSTAT:
      request.handle = reader.read_string();
      request.attrs = read_attributes(reader);
      break;

    case PacketType::OPENDIR:
    case PacketType::REMOVE:
    case PacketType::RMDIR:
    case PacketType::REALPATH:
    case PacketType::READLINK:
      request.path = reader.read_string();
      break;

    case PacketType::RENAME:
    case PacketType::SYMLINK:
      request.path = reader.read_string();
      request.target_path = reader.read_string();
      break;

    case PacketType::EXTENDED:
      request.extended_name = reader.read_string();
      break;

    default:
      // Unknown kinds only need their id for the reply
      break;
  }
  return request;
}

backend::FileAttributes Codec::read_attributes(PacketReader& reader) const {
  if (version_ >= 4) {
    return read_attributes_v4(reader);
  }
  return read_attributes_v3(reader);
}

backend::FileAttributes Codec::read_attributes_v3(PacketReader& reader) const {
  backend::FileAttributes attrs;
  const uint32_t flags = reader.read_uint32();

  if (flags & attr_flags::SIZE) {
    attrs.size = reader.read_uint64();
  }
  if (flags & attr_flags::UIDGID) {
    attrs.uid = reader.read_uint32();
    attrs.gid = reader.read_uint32();
  }
  if (flags & attr_flags::PERMISSIONS) {
    const uint32_t mode = reader.read_uint32();
    attrs.permissions = mode & PERMISSION_MASK;
    switch (mode & MODE_TYPE_MASK) {
      case MODE_DIRECTORY: attrs.type = backend::FileType::DIRECTORY; break;
      case MODE_REGULAR: attrs.type = backend::FileType::REGULAR; break;
      case MODE_SYMLINK: attrs.type = backend::FileType::SYMLINK; break;
      default: break;
    }
  }
  if (flags & attr_flags::ACMODTIME) {
    attrs.atime = reader.read_uint32();
    attrs.mtime = reader.read_uint32();
  }
  if (flags & attr_flags::EXTENDED) {
    skip_extended_pairs(reader);
  }
  return attrs;
}

backend::FileAttributes Codec::read_attributes_v4(PacketReader& reader) const {
  backend::FileAttributes attrs;
  const uint32_t flags = reader.read_uint32();
  const uint8_t type = reader.read_byte();
  if (type >= static_cast<uint8_t>(backend::FileType::REGULAR) &&
      type <= static_cast<uint8_t>(backend::FileType::UNKNOWN)) {
    attrs.type = static_cast<backend::FileType>(type);
  }

  const bool subseconds = (flags & attr_flags::SUBSECOND_TIMES) != 0;
  auto read_time = [&reader, subseconds]() {
    const uint64_t seconds = reader.read_uint64();
    if (subseconds) {
      reader.read_uint32();
    }
    return static_cast<uint32_t>(seconds);
  };

  if (flags & attr_flags::SIZE) {
    attrs.size = reader.read_uint64();
  }
  if (flags & attr_flags::OWNERGROUP) {
    reader.read_string();
    reader.read_string();
  }
  if (flags & attr_flags::PERMISSIONS) {
    attrs.permissions = reader.read_uint32() & PERMISSION_MASK;
  }
  if (flags & attr_flags::ACCESSTIME) {
    attrs.atime = read_time();
  }
  if (flags & attr_flags::CREATETIME) {
    read_time();
  }
  if (flags & attr_flags::MODIFYTIME) {
    attrs.mtime = read_time();
  }
  if (flags & attr_flags::ACL) {
    reader.read_string();
  }
  if (flags & attr_flags::EXTENDED) {
    skip_extended_pairs(reader);
  }
  return attrs;
}


//==============================================
// ENCODING
//==============================================

std::vector<uint8_t> Codec::encode_version(uint32_t version) const {
  return PacketWriter(PacketType::VERSION).write_uint32(version).finish();
}

std::vector<uint8_t> Codec::encode_status(uint32_t id, StatusCode code, const std::string& message) const {
  const StatusCode wire_code = clamp_to_version(code, version_);
  return PacketWriter(PacketType::STATUS)
    .write_uint32(id)
    .write_uint32(static_cast<uint32_t>(wire_code))
    .write_string(message)
    .write_string("en")
    .finish();
}

std::vector<uint8_t> Codec::encode_status(uint32_t id, StatusCode code) const {
  return encode_status(id, code, status_message(code));
}

std::vector<uint8_t> Codec::encode_handle(uint32_t id, const std::string& handle) const {
  return PacketWriter(PacketType::HANDLE).write_uint32(id).write_string(handle).finish();
}

std::vector<uint8_t> Codec::encode_data(uint32_t id, const std::vector<uint8_t>& data) const {
  return PacketWriter(PacketType::DATA).write_uint32(id).write_binary(data).finish();
}

std::vector<uint8_t> Codec::encode_name(uint32_t id, const std::vector<backend::DirEntry>& entries) const {
  PacketWriter writer(PacketType::NAME);
  writer.write_uint32(id).write_uint32(static_cast<uint32_t>(entries.size()));
  for (const auto& entry : entries) {
    writer.write_string(entry.name);
    if (version_ < 4) {
      writer.write_string(format_longname(entry));
    }
    write_attributes(writer, entry.attrs);
  }
  return writer.finish();
}

std::vector<uint8_t> Codec::encode_attrs(uint32_t id, const backend::FileAttributes& attrs) const {
  PacketWriter writer(PacketType::ATTRS);
  writer.write_uint32(id);
  write_attributes(writer, attrs);
  return writer.finish();
}

void Codec::write_attributes(PacketWriter& writer, const backend::FileAttributes& attrs) const {
  if (version_ >= 4) {
    write_attributes_v4(writer, attrs);
  } else {
    write_attributes_v3(writer, attrs);
  }
}

void Codec::write_attributes_v3(PacketWriter& writer, const backend::FileAttributes& attrs) const {
  // The file type only travels in the permission bits, so they are sent whenever it is known
  const bool known_type = attrs.is_directory() || attrs.is_regular() || attrs.type == backend::FileType::SYMLINK;
  const bool has_times = attrs.mtime.has_value() || attrs.atime.has_value();

  uint32_t flags = 0;
  if (attrs.size) {
    flags |= attr_flags::SIZE;
  }
  if (attrs.uid && attrs.gid) {
    flags |= attr_flags::UIDGID;
  }
  if (attrs.permissions || known_type) {
    flags |= attr_flags::PERMISSIONS;
  }
  if (has_times) {
    flags |= attr_flags::ACMODTIME;
  }

  writer.write_uint32(flags);
  if (flags & attr_flags::SIZE) {
    writer.write_uint64(*attrs.size);
  }
  if (flags & attr_flags::UIDGID) {
    writer.write_uint32(*attrs.uid);
    writer.write_uint32(*attrs.gid);
  }
  if (flags & attr_flags::PERMISSIONS) {
    writer.write_uint32(mode_bits(attrs));
  }
  if (flags & attr_flags::ACMODTIME) {
    const uint32_t mtime = attrs.mtime ? *attrs.mtime : *attrs.atime;
    writer.write_uint32(attrs.atime ? *attrs.atime : mtime);
    writer.write_uint32(mtime);
  }
}

void Codec::write_attributes_v4(PacketWriter& writer, const backend::FileAttributes& attrs) const {
  uint32_t flags = 0;
  if (attrs.size) {
    flags |= attr_flags::SIZE;
  }
  if (attrs.uid && attrs.gid) {
    flags |= attr_flags::OWNERGROUP;
  }
  if (attrs.permissions) {
    flags |= attr_flags::PERMISSIONS;
  }
  if (attrs.atime) {
    flags |= attr_flags::ACCESSTIME;
  }
  if (attrs.mtime) {
    flags |= attr_flags::MODIFYTIME;
  }

  writer.write_uint32(flags);
  writer.write_byte(static_cast<uint8_t>(attrs.type));
  if (flags & attr_flags::SIZE) {
    writer.write_uint64(*attrs.size);
  }
  if (flags & attr_flags::OWNERGROUP) {
    writer.write_string(std::to_string(*attrs.uid));
    writer.write_string(std::to_string(*attrs.gid));
  }
  if (flags & attr_flags::PERMISSIONS) {
    writer.write_uint32(*attrs.permissions & PERMISSION_MASK);
  }
  if (flags & attr_flags::ACCESSTIME) {
    writer.write_uint64(*attrs.atime);
  }
  if (flags & attr_flags::MODIFYTIME) {
    writer.write_uint64(*attrs.mtime);
  }
}


//==============================================
// FORMATTING
//==============================================

uint32_t Codec::mode_bits(const backend::FileAttributes& attrs) {
  uint32_t mode = attrs.permissions.value_or(0) & PERMISSION_MASK;
  switch (attrs.type) {
    case backend::FileType::DIRECTORY: mode |= MODE_DIRECTORY; break;
    case backend::FileType::REGULAR: mode |= MODE_REGULAR; break;
    case backend::FileType::SYMLINK: mode |= MODE_SYMLINK; break;
    default: break;
  }
  return mode;
}

std::string Codec::format_longname(const backend::DirEntry& entry) {
  const backend::FileAttributes& attrs = entry.attrs;
  if (attrs.type == backend::FileType::UNKNOWN && !attrs.permissions) {
    return entry.name;
  }

  // drwxr-xr-x style mode column
  std::string mode(10, '-');
  mode[0] = type_char(attrs.type);
  const uint32_t bits = attrs.permissions.value_or(0);
  const char symbols[] = {'r', 'w', 'x'};
  for (int i = 0; i < 9; ++i) {
    if (bits & (0400u >> i)) {
      mode[static_cast<std::size_t>(i) + 1] = symbols[i % 3];
    }
  }

  std::ostringstream line;
  line << mode << ' ' << std::setw(3) << 1 << ' '
       << std::left << std::setw(8) << (attrs.uid ? std::to_string(*attrs.uid) : "0") << ' '
       << std::setw(8) << (attrs.gid ? std::to_string(*attrs.gid) : "0") << ' '
       << std::right << std::setw(8) << attrs.size.value_or(0) << ' ';

  const std::time_t mtime = attrs.mtime.value_or(0);
  std::tm calendar{};
  gmtime_r(&mtime, &calendar);
  char date[32];
  std::strftime(date, sizeof(date), "%b %e %H:%M", &calendar);

  line << date << ' ' << entry.name;
  return line.str();
}

} // namespace protocol
} // namespace sftpgw
