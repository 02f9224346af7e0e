#ifndef SFTPGW_LOCAL_BACKEND_HPP
#define SFTPGW_LOCAL_BACKEND_HPP

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <system_error>
#include "backend/backend.hpp"

namespace sftpgw {
namespace backend {

/**
 * Serves a directory of the local filesystem.
 *
 * Directory policy: make_dir and write_file require an existing parent directory
 * (NOT_FOUND otherwise, NOT_A_DIRECTORY if the parent is a file).
 * Rename never overwrites: an occupied destination fails ALREADY_EXISTS. Files are
 * replaced atomically through a temporary sibling.
 *
 * Symbolic links are never followed. A link is reported as such by file_info and
 * list_dir, can be removed or renamed, and any other access through it fails
 * PERMISSION_DENIED, so the root cannot be escaped.
 */
class LocalBackend : public Backend {
public:
  // Suffix of temporary files written by write_file, hidden from listings
  static constexpr const char* TEMP_SUFFIX = ".sftpgw-tmp";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates root if it does not exist
  explicit LocalBackend(const std::string& root);
  ~LocalBackend() override = default;

  LocalBackend(const LocalBackend&) = delete;
  LocalBackend& operator=(const LocalBackend&) = delete;


  // ---- BACKEND OPERATIONS ----
  std::vector<DirEntry> list_dir(const path::NormalizedPath& path) override;
  FileAttributes file_info(const path::NormalizedPath& path) override;
  void make_dir(const path::NormalizedPath& path) override;
  void del_dir(const path::NormalizedPath& path) override;
  void remove_file(const path::NormalizedPath& path) override;
  void rename(const path::NormalizedPath& src, const path::NormalizedPath& dst) override;
  Bytes read_file(const path::NormalizedPath& path) override;
  void write_file(const path::NormalizedPath& path, const Bytes& content) override;
  std::string describe() const override;


  // ---- GETTERS ----
  const std::filesystem::path& root() const { return root_; }
  // Location of a virtual path below the root
  std::filesystem::path full_path(const path::NormalizedPath& path) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;
  // Keeps check-then-act sequences (rename, write_file) atomic against each other
  mutable std::shared_mutex mutex_;


  // ---- UTILITY METHODS ----
  // Type of the entry at path without following a final link, not_found if absent.
  // Fails PERMISSION_DENIED if an ancestor is a link.
  std::filesystem::file_type entry_type(const path::NormalizedPath& path) const;
  void require_parent_directory(const path::NormalizedPath& path) const;
  // Attributes from lstat of an existing entry
  FileAttributes attributes_of(const std::filesystem::path& location, const std::string& context) const;
  // Translates a filesystem error code into the matching BackendError
  static BackendError error_for(const std::error_code& ec, const std::string& context);
};

} // namespace backend
} // namespace sftpgw

#endif // SFTPGW_LOCAL_BACKEND_HPP
