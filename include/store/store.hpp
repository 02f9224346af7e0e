#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <ostream>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sftpgw {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class ObjectNotFoundError : public StoreError {
public:
  explicit ObjectNotFoundError(const std::string& key)
    : StoreError("Store: Object not found: " + key) {}
};

/**
 * Flat key/object store on the local disk.
 *
 * Objects are content addressed by the SHA-256 of their key. Every object has a
 * metadata sidecar holding its key and modification time, so the key index can be
 * rebuilt when the store is reopened. Writes are atomic per object.
 */
class ObjectStore {
public:
  struct ObjectInfo {
    uint64_t size;
    uint32_t mtime;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ObjectStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores data stream under given key, replacing any previous object
  void store(const std::string& key, std::istream& data);
  // Retrieves data stream using given key
  void get(const std::string& key, std::ostream& output) const;
  // Removes object associated with given key
  void remove(const std::string& key);
  // Removes all stored objects and resets the store
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const;
  ObjectInfo stat(const std::string& key) const;
  // Returns the sorted keys starting with prefix
  std::vector<std::string> list(const std::string& prefix) const;
  // True if any key starts with prefix
  bool has_prefix(const std::string& prefix) const;
  std::size_t object_count() const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored objects
  std::filesystem::path base_path_;
  // Key index rebuilt from metadata sidecars on startup
  std::map<std::string, ObjectInfo> index_;
  mutable std::shared_mutex mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  // Creates a directory structure using parts of the hash:
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  // Sidecar holding the object's key and mtime
  static std::filesystem::path metadata_path(const std::filesystem::path& object_path);


  // ---- INDEX SUPPORT ----
  // Scans metadata sidecars and rebuilds the key index
  void load_index();


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Resolves a key to its corresponding filesystem path by generating hash and converting to path
  std::filesystem::path resolve_key_path(const std::string& key) const;
  // Removes empty hash directories between path and base_path_
  void prune_empty_directories(std::filesystem::path current) const;
};

} // namespace store
} // namespace sftpgw
