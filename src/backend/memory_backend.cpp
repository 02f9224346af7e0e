#include "backend/memory_backend.hpp"
#include <boost/log/trivial.hpp>
#include <mutex>

namespace sftpgw {
namespace backend {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MemoryBackend::MemoryBackend() {
  nodes_.emplace("/", Node{FileType::DIRECTORY, {}, current_timestamp()});
  BOOST_LOG_TRIVIAL(info) << "Memory backend: Initialized empty store";
}

MemoryBackend::MemoryBackend(const std::map<std::string, Bytes>& files) : MemoryBackend() {
  const uint32_t now = current_timestamp();
  for (const auto& [raw_path, content] : files) {
    path::NormalizedPath file_path = path::normalize(raw_path);
    if (file_path.is_root()) {
      throw BackendError(BackendErrc::IS_A_DIRECTORY, raw_path);
    }

    // Create missing ancestors so seeded trees do not need explicit directories
    const path::NormalizedPath parent = file_path.parent();
    path::NormalizedPath ancestor;
    for (const auto& segment : parent.segments()) {
      ancestor = ancestor.join(segment);
      nodes_.emplace(ancestor.str(), Node{FileType::DIRECTORY, {}, now});
    }
    nodes_[file_path.str()] = Node{FileType::REGULAR, content, now};
  }
  BOOST_LOG_TRIVIAL(info) << "Memory backend: Seeded store with " << files.size() << " files";
}


//==============================================
// BACKEND OPERATIONS
//==============================================

std::vector<DirEntry> MemoryBackend::list_dir(const path::NormalizedPath& path) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const std::string key = path.str();

  const Node& dir = require_node(key);
  if (dir.type != FileType::DIRECTORY) {
    throw BackendError(BackendErrc::NOT_A_DIRECTORY, key);
  }

  std::vector<DirEntry> entries;
  const std::string prefix = child_prefix(key);
  for (auto it = nodes_.lower_bound(prefix); it != nodes_.end(); ++it) {
    const std::string& child = it->first;
    if (child.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    const std::string name = child.substr(prefix.size());
    // Skip grandchildren
    if (name.empty() || name.find('/') != std::string::npos) {
      continue;
    }
    const Node& node = it->second;
    entries.push_back(DirEntry{
      name,
      node.type == FileType::DIRECTORY ? FileAttributes::directory(node.mtime)
                                       : FileAttributes::file(node.content.size(), node.mtime)
    });
  }

  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Listed " << entries.size() << " entries in " << key;
  return entries;
}

FileAttributes MemoryBackend::file_info(const path::NormalizedPath& path) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const Node& node = require_node(path.str());
  if (node.type == FileType::DIRECTORY) {
    return FileAttributes::directory(node.mtime);
  }
  return FileAttributes::file(node.content.size(), node.mtime);
}

void MemoryBackend::make_dir(const path::NormalizedPath& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const std::string key = path.str();

  if (nodes_.count(key) > 0) {
    throw BackendError(BackendErrc::ALREADY_EXISTS, key);
  }
  require_parent_directory(path);

  nodes_.emplace(key, Node{FileType::DIRECTORY, {}, current_timestamp()});
  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Created directory " << key;
}

void MemoryBackend::del_dir(const path::NormalizedPath& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const std::string key = path.str();

  if (path.is_root()) {
    throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot remove the root directory");
  }
  const Node& node = require_node(key);
  if (node.type != FileType::DIRECTORY) {
    throw BackendError(BackendErrc::NOT_A_DIRECTORY, key);
  }

  const std::string prefix = child_prefix(key);
  auto child = nodes_.lower_bound(prefix);
  if (child != nodes_.end() && child->first.compare(0, prefix.size(), prefix) == 0) {
    throw BackendError(BackendErrc::NOT_EMPTY, key);
  }

  nodes_.erase(key);
  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Removed directory " << key;
}

void MemoryBackend::remove_file(const path::NormalizedPath& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const std::string key = path.str();

  const Node& node = require_node(key);
  if (node.type == FileType::DIRECTORY) {
    throw BackendError(BackendErrc::IS_A_DIRECTORY, key);
  }

  nodes_.erase(key);
  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Removed file " << key;
}

void MemoryBackend::rename(const path::NormalizedPath& src, const path::NormalizedPath& dst) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const std::string src_key = src.str();
  const std::string dst_key = dst.str();

  const Node& node = require_node(src_key);
  if (src == dst) {
    return;
  }
  if (src.is_root()) {
    throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot rename the root directory");
  }
  if (nodes_.count(dst_key) > 0) {
    throw BackendError(BackendErrc::ALREADY_EXISTS, dst_key);
  }
  require_parent_directory(dst);

  if (node.type != FileType::DIRECTORY) {
    auto handle = nodes_.extract(src_key);
    handle.key() = dst_key;
    nodes_.insert(std::move(handle));
    BOOST_LOG_TRIVIAL(debug) << "Memory backend: Renamed file " << src_key << " to " << dst_key;
    return;
  }

  if (dst.is_within(src)) {
    throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot move a directory into itself");
  }

  // Collect the directory and its subtree, then re-key every node
  std::vector<std::string> moved{src_key};
  const std::string prefix = child_prefix(src_key);
  for (auto it = nodes_.lower_bound(prefix);
       it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
    moved.push_back(it->first);
  }

  for (const auto& old_key : moved) {
    auto handle = nodes_.extract(old_key);
    handle.key() = dst_key + old_key.substr(src_key.size());
    nodes_.insert(std::move(handle));
  }
  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Moved directory " << src_key << " to " << dst_key
                           << " with " << moved.size() - 1 << " descendants";
}

Bytes MemoryBackend::read_file(const path::NormalizedPath& path) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const std::string key = path.str();

  const Node& node = require_node(key);
  if (node.type == FileType::DIRECTORY) {
    throw BackendError(BackendErrc::IS_A_DIRECTORY, key);
  }
  return node.content;
}

void MemoryBackend::write_file(const path::NormalizedPath& path, const Bytes& content) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const std::string key = path.str();

  auto existing = nodes_.find(key);
  if (existing != nodes_.end()) {
    if (existing->second.type == FileType::DIRECTORY) {
      throw BackendError(BackendErrc::IS_A_DIRECTORY, key);
    }
    existing->second.content = content;
    existing->second.mtime = current_timestamp();
  } else {
    require_parent_directory(path);
    nodes_.emplace(key, Node{FileType::REGULAR, content, current_timestamp()});
  }
  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Wrote " << content.size() << " bytes to " << key;
}

std::string MemoryBackend::describe() const {
  return "in-memory store";
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::size_t MemoryBackend::node_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return nodes_.size() - 1;
}


//==============================================
// UTILITY METHODS
//==============================================

const MemoryBackend::Node& MemoryBackend::require_node(const std::string& key) const {
  auto it = nodes_.find(key);
  if (it == nodes_.end()) {
    throw BackendError(BackendErrc::NOT_FOUND, key);
  }
  return it->second;
}

void MemoryBackend::require_parent_directory(const path::NormalizedPath& path) const {
  const std::string parent_key = path.parent().str();
  auto parent = nodes_.find(parent_key);
  if (parent == nodes_.end()) {
    throw BackendError(BackendErrc::NOT_FOUND, "parent directory " + parent_key);
  }
  if (parent->second.type != FileType::DIRECTORY) {
    throw BackendError(BackendErrc::NOT_A_DIRECTORY, parent_key);
  }
}

std::string MemoryBackend::child_prefix(const std::string& key) {
  return key == "/" ? key : key + "/";
}

} // namespace backend
} // namespace sftpgw
