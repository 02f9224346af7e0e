#ifndef SFTPGW_OBJECT_STORE_BACKEND_HPP
#define SFTPGW_OBJECT_STORE_BACKEND_HPP

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "backend/backend.hpp"
#include "store/store.hpp"

namespace sftpgw {
namespace backend {

/**
 * Object-storage semantics over a flat key space.
 *
 * A path maps to the key prefix + path without its leading '/'. Directories are
 * implicit: a directory exists if it is the root, carries a ".keep" marker object
 * or has any key beneath it. make_dir writes the marker and does not require the
 * parents to exist. Directory renames copy every key before deleting the sources.
 * ".keep" is reserved and never listed.
 */
class ObjectStoreBackend : public Backend {
public:
  static constexpr const char* DIRECTORY_MARKER = ".keep";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ObjectStoreBackend(std::shared_ptr<store::ObjectStore> store, const std::string& key_prefix = "");
  ~ObjectStoreBackend() override = default;

  ObjectStoreBackend(const ObjectStoreBackend&) = delete;
  ObjectStoreBackend& operator=(const ObjectStoreBackend&) = delete;


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


  // ---- KEY MAPPING ----
  const std::string& key_prefix() const { return key_prefix_; }
  // Object key of a file path
  std::string object_key(const path::NormalizedPath& path) const;
  // Key prefix shared by everything beneath a directory
  std::string directory_prefix(const path::NormalizedPath& path) const;
  std::string marker_key(const path::NormalizedPath& path) const;

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::ObjectStore> store_;
  // Empty or ending with '/'
  std::string key_prefix_;
  // Keeps compound operations (rename, del_dir) atomic against each other
  mutable std::shared_mutex mutex_;


  // ---- UTILITY METHODS ----
  // All require the caller to hold mutex_
  bool is_file(const path::NormalizedPath& path) const;
  bool is_directory(const path::NormalizedPath& path) const;
  std::optional<uint32_t> directory_mtime(const path::NormalizedPath& path) const;
  // NOT_A_DIRECTORY if any ancestor of path is a file
  void require_no_file_ancestor(const path::NormalizedPath& path) const;
  // PERMISSION_DENIED for the reserved marker name
  static void require_unreserved_name(const path::NormalizedPath& path);
  Bytes load_object(const std::string& key) const;
  void store_object(const std::string& key, const Bytes& content);
  // Best-effort removal used to undo a partially applied rename
  void remove_objects(const std::vector<std::string>& keys);
};

} // namespace backend
} // namespace sftpgw

#endif // SFTPGW_OBJECT_STORE_BACKEND_HPP
