#include "store/store.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>

namespace sftpgw {
namespace store {

namespace {

constexpr const char* METADATA_SUFFIX = ".meta";
constexpr const char* TEMP_SUFFIX = ".tmp";

uint32_t now_seconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

// Writes to a temporary sibling then renames it over the target
void write_atomically(const std::filesystem::path& target, const std::string& data) {
  std::filesystem::path temp = target;
  temp += TEMP_SUFFIX;
  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp.string());
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
      throw StoreError("Store: Failed to write file: " + temp.string());
    }
  }
  std::filesystem::rename(temp, target);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
ObjectStore::ObjectStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing ObjectStore with base path: " << base_path;
  check_directory_exists(base_path_); // Create base directory if it doesn't exist
  load_index();
  BOOST_LOG_TRIVIAL(info) << "Store: Loaded " << index_.size() << " objects from " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void ObjectStore::store(const std::string& key, std::istream& data) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing object with key: " << key;

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid input stream provided for key: " << key;
    throw StoreError("Store: Invalid input stream");
  }

  // Read the whole stream first so a failing source leaves the old object intact
  std::string content{std::istreambuf_iterator<char>(data), std::istreambuf_iterator<char>()};
  if (data.bad()) {
    throw StoreError("Store: Failed to read input stream for key: " + key);
  }

  const uint32_t mtime = now_seconds();
  std::ostringstream metadata;
  metadata << mtime << '\n' << key;

  std::unique_lock<std::shared_mutex> lock(mutex_);

  // Generate path from key and ensure directory structure exists
  std::filesystem::path file_path = resolve_key_path(key);
  check_directory_exists(file_path.parent_path());
  BOOST_LOG_TRIVIAL(trace) << "Store: Calculated file path: " << file_path.string();

  write_atomically(file_path, content);
  write_atomically(metadata_path(file_path), metadata.str());

  index_[key] = ObjectInfo{content.size(), mtime};
  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully stored " << content.size() << " bytes with key: " << key;
}

void ObjectStore::get(const std::string& key, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving object for key: " << key;

  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (index_.count(key) == 0) {
    throw ObjectNotFoundError(key);
  }

  std::filesystem::path file_path = resolve_key_path(key);

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  char buffer[4096];
  std::size_t total_bytes = 0;

  // Read file in chunks to handle large files efficiently
  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  if (!output.good()) {
    throw StoreError("Store: Failed to write to output stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully streamed " << total_bytes << " bytes for key: " << key;
}

void ObjectStore::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Removing object with key: " << key;

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (index_.erase(key) == 0) {
    throw ObjectNotFoundError(key);
  }

  // Convert the key to its corresponding file path using content-addressing
  std::filesystem::path file_path = resolve_key_path(key);
  std::filesystem::remove(metadata_path(file_path));
  if (!std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Object file was already missing for key: " << key;
  }

  prune_empty_directories(file_path.parent_path());
  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully removed object with key: " << key;
}

void ObjectStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_;
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
  index_.clear();
  BOOST_LOG_TRIVIAL(info) << "Store: Store cleared successfully";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ObjectStore::has(const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return index_.count(key) > 0;
}

ObjectStore::ObjectInfo ObjectStore::stat(const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = index_.find(key);
  if (it == index_.end()) {
    throw ObjectNotFoundError(key);
  }
  return it->second;
}

std::vector<std::string> ObjectStore::list(const std::string& prefix) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = index_.lower_bound(prefix);
       it != index_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
    keys.push_back(it->first);
  }
  return keys;
}

bool ObjectStore::has_prefix(const std::string& prefix) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = index_.lower_bound(prefix);
  return it != index_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

std::size_t ObjectStore::object_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return index_.size();
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string ObjectStore::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("Store: Failed to create hash context");
  }

  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Store: Failed to initialize hash context");
  }

  // Feed the input key data into the hash function
  if (!EVP_DigestUpdate(ctx, key.c_str(), key.length())) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Store: Failed to update hash");
  }

  // Generate the final hash value
  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Store: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path ObjectStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (std::size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path ObjectStore::metadata_path(const std::filesystem::path& object_path) {
  std::filesystem::path meta = object_path;
  meta += METADATA_SUFFIX;
  return meta;
}


//==============================================
// INDEX SUPPORT
//==============================================

void ObjectStore::load_index() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  index_.clear();

  std::vector<std::filesystem::path> stale_temp_files;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(base_path_)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const std::filesystem::path& entry_path = entry.path();
    if (entry_path.extension() == TEMP_SUFFIX) {
      stale_temp_files.push_back(entry_path);
      continue;
    }
    if (entry_path.extension() != METADATA_SUFFIX) {
      continue;
    }

    std::filesystem::path object_path = entry_path;
    object_path.replace_extension();
    if (!std::filesystem::exists(object_path)) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Ignoring metadata without object: " << entry_path.string();
      continue;
    }

    std::ifstream meta(entry_path, std::ios::binary);
    std::string mtime_line;
    if (!std::getline(meta, mtime_line)) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Ignoring unreadable metadata: " << entry_path.string();
      continue;
    }
    std::string key{std::istreambuf_iterator<char>(meta), std::istreambuf_iterator<char>()};

    try {
      const auto mtime = static_cast<uint32_t>(std::stoul(mtime_line));
      index_[key] = ObjectInfo{std::filesystem::file_size(object_path), mtime};
    } catch (const std::logic_error& e) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Ignoring corrupt metadata " << entry_path.string() << ": " << e.what();
    }
  }

  // Leftovers of interrupted writes
  for (const auto& temp : stale_temp_files) {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Failed to remove stale file " << temp.string() << ": " << ec.message();
    }
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void ObjectStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::filesystem::path ObjectStore::resolve_key_path(const std::string& key) const {
  std::string hash = hash_key(key);
  return get_path_for_hash(hash);
}

void ObjectStore::prune_empty_directories(std::filesystem::path current) const {
  while (current != base_path_ && current.has_parent_path()) {
    std::error_code ec;
    if (!std::filesystem::is_empty(current, ec) || ec) {
      break;
    }
    std::filesystem::remove(current, ec);
    current = current.parent_path();
  }
}

} // namespace store
} // namespace sftpgw
