#ifndef SFTPGW_MEMORY_BACKEND_HPP
#define SFTPGW_MEMORY_BACKEND_HPP

#include <map>
#include <shared_mutex>
#include <string>
#include "backend/backend.hpp"

namespace sftpgw {
namespace backend {

/**
 * Hierarchical in-memory store.
 *
 * Directory policy: make_dir and write_file require an existing parent directory
 * (NOT_FOUND otherwise, NOT_A_DIRECTORY if the parent is a file).
 * Rename never overwrites: an occupied destination fails ALREADY_EXISTS.
 * Directories are moved with their whole subtree.
 */
class MemoryBackend : public Backend {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemoryBackend();
  // Seeds the store with files, creating missing parent directories
  explicit MemoryBackend(const std::map<std::string, Bytes>& files);
  ~MemoryBackend() override = default;

  MemoryBackend(const MemoryBackend&) = delete;
  MemoryBackend& operator=(const MemoryBackend&) = delete;


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


  // ---- QUERY OPERATIONS ----
  // Number of files and directories, the root excluded
  std::size_t node_count() const;

private:
  struct Node {
    FileType type;
    Bytes content;
    uint32_t mtime;
  };

  // ---- PARAMETERS ----
  // Keyed by normalized path, always contains "/"
  std::map<std::string, Node> nodes_;
  mutable std::shared_mutex mutex_;


  // ---- UTILITY METHODS ----
  // Both require the caller to hold mutex_
  const Node& require_node(const std::string& key) const;
  void require_parent_directory(const path::NormalizedPath& path) const;
  // Prefix shared by every descendant key of a directory
  static std::string child_prefix(const std::string& key);
};

} // namespace backend
} // namespace sftpgw

#endif // SFTPGW_MEMORY_BACKEND_HPP
