#include "backend/object_store_backend.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <mutex>
#include <set>
#include <sstream>
#include <system_error>

namespace sftpgw {
namespace backend {

namespace {

// Runs a store operation and translates store failures into backend errors
template <typename Operation>
auto translate_store_errors(const std::string& context, Operation&& operation) -> decltype(operation()) {
  try {
    return operation();
  } catch (const store::ObjectNotFoundError&) {
    throw BackendError(BackendErrc::NOT_FOUND, context);
  } catch (const std::filesystem::filesystem_error& e) {
    if (e.code() == std::errc::permission_denied) {
      throw BackendError(BackendErrc::PERMISSION_DENIED, context);
    }
    BOOST_LOG_TRIVIAL(error) << "Object store backend: Filesystem failure on " << context << ": " << e.what();
    throw BackendError(BackendErrc::IO_ERROR, context);
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store backend: Store failure on " << context << ": " << e.what();
    throw BackendError(BackendErrc::IO_ERROR, context);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ObjectStoreBackend::ObjectStoreBackend(std::shared_ptr<store::ObjectStore> store, const std::string& key_prefix)
  : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("Object store backend: store must not be null");
  }

  // Keys never start with '/' and a non-empty prefix always ends with one
  std::string prefix = key_prefix;
  while (!prefix.empty() && prefix.front() == '/') {
    prefix.erase(0, 1);
  }
  if (!prefix.empty() && prefix.back() != '/') {
    prefix.push_back('/');
  }
  key_prefix_ = prefix;

  BOOST_LOG_TRIVIAL(info) << "Object store backend: Initialized over " << store_->base_path().string()
                          << " with key prefix '" << key_prefix_ << "'";
}


//==============================================
// BACKEND OPERATIONS
//==============================================

std::vector<DirEntry> ObjectStoreBackend::list_dir(const path::NormalizedPath& path) {
  return translate_store_errors(path.str(), [&] {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (is_file(path)) {
      throw BackendError(BackendErrc::NOT_A_DIRECTORY, path.str());
    }
    if (!is_directory(path)) {
      throw BackendError(BackendErrc::NOT_FOUND, path.str());
    }

    const std::string prefix = directory_prefix(path);
    std::vector<DirEntry> entries;
    std::set<std::string> seen_directories;

    for (const auto& key : store_->list(prefix)) {
      const std::string rest = key.substr(prefix.size());
      const auto separator = rest.find('/');

      if (separator == std::string::npos) {
        if (rest.empty() || rest == DIRECTORY_MARKER) {
          continue;
        }
        const auto info = store_->stat(key);
        entries.push_back(DirEntry{rest, FileAttributes::file(info.size, info.mtime)});
        continue;
      }

      // Anything deeper collapses into its first segment
      const std::string name = rest.substr(0, separator);
      if (name.empty() || !seen_directories.insert(name).second) {
        continue;
      }
      entries.push_back(DirEntry{name, FileAttributes::directory(directory_mtime(path.join(name)))});
    }

    BOOST_LOG_TRIVIAL(debug) << "Object store backend: Listed " << entries.size() << " entries in " << path;
    return entries;
  });
}

FileAttributes ObjectStoreBackend::file_info(const path::NormalizedPath& path) {
  return translate_store_errors(path.str(), [&] {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (is_file(path)) {
      const auto info = store_->stat(object_key(path));
      return FileAttributes::file(info.size, info.mtime);
    }
    if (is_directory(path)) {
      return FileAttributes::directory(directory_mtime(path));
    }
    throw BackendError(BackendErrc::NOT_FOUND, path.str());
  });
}

void ObjectStoreBackend::make_dir(const path::NormalizedPath& path) {
  translate_store_errors(path.str(), [&] {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (is_file(path) || is_directory(path)) {
      throw BackendError(BackendErrc::ALREADY_EXISTS, path.str());
    }
    require_unreserved_name(path);
    require_no_file_ancestor(path);

    store_object(marker_key(path), Bytes{});
    BOOST_LOG_TRIVIAL(debug) << "Object store backend: Created directory marker for " << path;
  });
}

void ObjectStoreBackend::del_dir(const path::NormalizedPath& path) {
  translate_store_errors(path.str(), [&] {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (path.is_root()) {
      throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot remove the root directory");
    }
    if (is_file(path)) {
      throw BackendError(BackendErrc::NOT_A_DIRECTORY, path.str());
    }
    if (!is_directory(path)) {
      throw BackendError(BackendErrc::NOT_FOUND, path.str());
    }

    const std::string marker = marker_key(path);
    for (const auto& key : store_->list(directory_prefix(path))) {
      if (key != marker) {
        throw BackendError(BackendErrc::NOT_EMPTY, path.str());
      }
    }

    store_->remove(marker);
    BOOST_LOG_TRIVIAL(debug) << "Object store backend: Removed directory " << path;
  });
}

void ObjectStoreBackend::remove_file(const path::NormalizedPath& path) {
  translate_store_errors(path.str(), [&] {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (is_file(path)) {
      store_->remove(object_key(path));
      BOOST_LOG_TRIVIAL(debug) << "Object store backend: Removed file " << path;
      return;
    }
    if (is_directory(path)) {
      throw BackendError(BackendErrc::IS_A_DIRECTORY, path.str());
    }
    throw BackendError(BackendErrc::NOT_FOUND, path.str());
  });
}

void ObjectStoreBackend::rename(const path::NormalizedPath& src, const path::NormalizedPath& dst) {
  translate_store_errors(src.str(), [&] {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const bool src_is_file = is_file(src);
    if (!src_is_file && !is_directory(src)) {
      throw BackendError(BackendErrc::NOT_FOUND, src.str());
    }
    if (src == dst) {
      return;
    }
    if (src.is_root()) {
      throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot rename the root directory");
    }
    if (is_file(dst) || is_directory(dst)) {
      throw BackendError(BackendErrc::ALREADY_EXISTS, dst.str());
    }
    require_unreserved_name(dst);
    require_no_file_ancestor(dst);

    if (src_is_file) {
      const std::string src_key = object_key(src);
      const std::string dst_key = object_key(dst);
      store_object(dst_key, load_object(src_key));
      try {
        store_->remove(src_key);
      } catch (const std::exception&) {
        remove_objects({dst_key});
        throw;
      }
      BOOST_LOG_TRIVIAL(debug) << "Object store backend: Renamed file " << src << " to " << dst;
      return;
    }

    if (dst.is_within(src)) {
      throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot move a directory into itself");
    }

    // Copy the whole subtree before deleting anything. A failed copy removes the
    // destination keys written so far, leaving only the source visible.
    const std::string src_prefix = directory_prefix(src);
    const std::string dst_prefix = directory_prefix(dst);
    const std::vector<std::string> keys = store_->list(src_prefix);
    std::vector<std::string> copied;
    try {
      for (const auto& key : keys) {
        const std::string dst_key = dst_prefix + key.substr(src_prefix.size());
        store_object(dst_key, load_object(key));
        copied.push_back(dst_key);
      }
    } catch (const std::exception&) {
      remove_objects(copied);
      throw;
    }
    for (const auto& key : keys) {
      store_->remove(key);
    }
    BOOST_LOG_TRIVIAL(debug) << "Object store backend: Moved directory " << src << " to " << dst
                             << " with " << keys.size() << " objects";
  });
}

Bytes ObjectStoreBackend::read_file(const path::NormalizedPath& path) {
  return translate_store_errors(path.str(), [&] {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (is_file(path)) {
      return load_object(object_key(path));
    }
    if (is_directory(path)) {
      throw BackendError(BackendErrc::IS_A_DIRECTORY, path.str());
    }
    throw BackendError(BackendErrc::NOT_FOUND, path.str());
  });
}

void ObjectStoreBackend::write_file(const path::NormalizedPath& path, const Bytes& content) {
  translate_store_errors(path.str(), [&] {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!is_file(path) && is_directory(path)) {
      throw BackendError(BackendErrc::IS_A_DIRECTORY, path.str());
    }
    require_unreserved_name(path);
    require_no_file_ancestor(path);

    store_object(object_key(path), content);
    BOOST_LOG_TRIVIAL(debug) << "Object store backend: Wrote " << content.size() << " bytes to " << path;
  });
}

std::string ObjectStoreBackend::describe() const {
  std::string description = "object store at " + store_->base_path().string();
  if (!key_prefix_.empty()) {
    description += " (prefix " + key_prefix_ + ")";
  }
  return description;
}


//==============================================
// KEY MAPPING
//==============================================

std::string ObjectStoreBackend::object_key(const path::NormalizedPath& path) const {
  return key_prefix_ + std::string(path.relative());
}

std::string ObjectStoreBackend::directory_prefix(const path::NormalizedPath& path) const {
  if (path.is_root()) {
    return key_prefix_;
  }
  return object_key(path) + "/";
}

std::string ObjectStoreBackend::marker_key(const path::NormalizedPath& path) const {
  return directory_prefix(path) + DIRECTORY_MARKER;
}


//==============================================
// UTILITY METHODS
//==============================================

bool ObjectStoreBackend::is_file(const path::NormalizedPath& path) const {
  return !path.is_root() && store_->has(object_key(path));
}

bool ObjectStoreBackend::is_directory(const path::NormalizedPath& path) const {
  return path.is_root() || store_->has_prefix(directory_prefix(path));
}

std::optional<uint32_t> ObjectStoreBackend::directory_mtime(const path::NormalizedPath& path) const {
  const std::string marker = marker_key(path);
  if (!store_->has(marker)) {
    return std::nullopt;
  }
  return store_->stat(marker).mtime;
}

void ObjectStoreBackend::require_no_file_ancestor(const path::NormalizedPath& path) const {
  path::NormalizedPath ancestor = path.parent();
  while (!ancestor.is_root()) {
    if (is_file(ancestor)) {
      throw BackendError(BackendErrc::NOT_A_DIRECTORY, ancestor.str());
    }
    ancestor = ancestor.parent();
  }
}

void ObjectStoreBackend::require_unreserved_name(const path::NormalizedPath& path) {
  if (path.file_name() == DIRECTORY_MARKER) {
    throw BackendError(BackendErrc::PERMISSION_DENIED, "reserved name " + path.str());
  }
}

Bytes ObjectStoreBackend::load_object(const std::string& key) const {
  std::ostringstream output;
  store_->get(key, output);
  const std::string data = output.str();
  return Bytes(data.begin(), data.end());
}

void ObjectStoreBackend::store_object(const std::string& key, const Bytes& content) {
  std::istringstream input(std::string(content.begin(), content.end()));
  store_->store(key, input);
}

void ObjectStoreBackend::remove_objects(const std::vector<std::string>& keys) {
  for (const auto& key : keys) {
    try {
      store_->remove(key);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Object store backend: Failed to roll back object " << key << ": " << e.what();
    }
  }
}

} // namespace backend
} // namespace sftpgw
