#ifndef SFTPGW_BACKEND_HPP
#define SFTPGW_BACKEND_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "path/path_normalizer.hpp"

namespace sftpgw {
namespace backend {

using Bytes = std::vector<uint8_t>;

// Values match the SFTP v4 file type byte
enum class FileType : uint8_t {
  REGULAR = 1,
  DIRECTORY = 2,
  SYMLINK = 3,
  SPECIAL = 4,
  UNKNOWN = 5
};

// Metadata of a file or directory. Fields a backend cannot provide stay empty.
struct FileAttributes {
  FileType type = FileType::UNKNOWN;
  std::optional<uint64_t> size;
  std::optional<uint32_t> permissions;
  std::optional<uint32_t> mtime;
  std::optional<uint32_t> atime;
  std::optional<uint32_t> uid;
  std::optional<uint32_t> gid;

  bool is_directory() const { return type == FileType::DIRECTORY; }
  bool is_regular() const { return type == FileType::REGULAR; }

  static FileAttributes directory(std::optional<uint32_t> mtime);
  static FileAttributes file(uint64_t size, std::optional<uint32_t> mtime);
};

struct DirEntry {
  // Single path segment
  std::string name;
  FileAttributes attrs;
};

enum class BackendErrc {
  NOT_FOUND,
  ALREADY_EXISTS,
  NOT_A_DIRECTORY,
  IS_A_DIRECTORY,
  NOT_EMPTY,
  PERMISSION_DENIED,
  UNAVAILABLE,
  IO_ERROR
};

const char* backend_errc_to_string(BackendErrc code);

class BackendError : public std::runtime_error {
public:
  BackendError(BackendErrc code, const std::string& detail);
  explicit BackendError(BackendErrc code);

  BackendErrc code() const { return code_; }

private:
  BackendErrc code_;
};

/**
 * Storage contract shared by every backend.
 *
 * Paths are always normalized. Failures are reported by throwing BackendError.
 * Implementations must be safe to call from several threads at once and keep
 * operations on the same path linearizable. The root always exists as a directory.
 */
class Backend {
public:
  virtual ~Backend() = default;

  // Entries of a directory, without "." and "..".
  // NOT_FOUND if absent, NOT_A_DIRECTORY if path is a file.
  virtual std::vector<DirEntry> list_dir(const path::NormalizedPath& path) = 0;

  // NOT_FOUND if absent
  virtual FileAttributes file_info(const path::NormalizedPath& path) = 0;

  // ALREADY_EXISTS if occupied. Parent handling is documented per backend.
  virtual void make_dir(const path::NormalizedPath& path) = 0;

  // NOT_FOUND, NOT_A_DIRECTORY, NOT_EMPTY if the directory has children
  virtual void del_dir(const path::NormalizedPath& path) = 0;

  // NOT_FOUND, IS_A_DIRECTORY
  virtual void remove_file(const path::NormalizedPath& path) = 0;

  // Atomic from the client's view. NOT_FOUND if src is absent, ALREADY_EXISTS if dst is occupied.
  virtual void rename(const path::NormalizedPath& src, const path::NormalizedPath& dst) = 0;

  // Whole-file read. NOT_FOUND, IS_A_DIRECTORY
  virtual Bytes read_file(const path::NormalizedPath& path) = 0;

  // Whole-file replace or create. IS_A_DIRECTORY
  virtual void write_file(const path::NormalizedPath& path, const Bytes& content) = 0;

  // Short backend description for logging
  virtual std::string describe() const = 0;

protected:
  Backend() = default;
};

// Current Unix time in seconds
uint32_t current_timestamp();

} // namespace backend
} // namespace sftpgw

#endif // SFTPGW_BACKEND_HPP
