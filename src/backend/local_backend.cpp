#include "backend/local_backend.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sys/stat.h>

namespace sftpgw {
namespace backend {

namespace {

constexpr uint32_t PERMISSION_BITS = 07777;

bool has_temp_suffix(const std::string& name) {
  const std::string suffix = LocalBackend::TEMP_SUFFIX;
  return name.size() >= suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Temporary names are reserved for write_file
void require_unreserved_name(const path::NormalizedPath& path) {
  if (has_temp_suffix(std::string(path.file_name()))) {
    throw BackendError(BackendErrc::PERMISSION_DENIED, "reserved name " + path.str());
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalBackend::LocalBackend(const std::string& root) {
  if (root.empty()) {
    throw std::invalid_argument("Local backend: root must not be empty");
  }

  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    throw std::invalid_argument("Local backend: cannot create root " + root + ": " + ec.message());
  }
  if (!std::filesystem::is_directory(root, ec)) {
    throw std::invalid_argument("Local backend: root is not a directory: " + root);
  }
  root_ = std::filesystem::canonical(root);

  BOOST_LOG_TRIVIAL(info) << "Local backend: Serving " << root_.string();
}


//==============================================
// BACKEND OPERATIONS
//==============================================

std::vector<DirEntry> LocalBackend::list_dir(const path::NormalizedPath& path) {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  switch (entry_type(path)) {
    case std::filesystem::file_type::directory:
      break;
    case std::filesystem::file_type::not_found:
      throw BackendError(BackendErrc::NOT_FOUND, path.str());
    case std::filesystem::file_type::symlink:
      throw BackendError(BackendErrc::PERMISSION_DENIED, "symbolic link " + path.str());
    default:
      throw BackendError(BackendErrc::NOT_A_DIRECTORY, path.str());
  }

  std::error_code ec;
  std::filesystem::directory_iterator it(full_path(path), ec);
  if (ec) {
    throw error_for(ec, path.str());
  }

  std::vector<DirEntry> entries;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (has_temp_suffix(name)) {
      continue;
    }
    try {
      entries.push_back(DirEntry{name, attributes_of(it->path(), path.join(name).str())});
    } catch (const BackendError& e) {
      // Removed by someone else while listing
      if (e.code() != BackendErrc::NOT_FOUND) {
        throw;
      }
    }
  }
  if (ec) {
    throw error_for(ec, path.str());
  }

  BOOST_LOG_TRIVIAL(debug) << "Local backend: Listed " << entries.size() << " entries in " << path;
  return entries;
}

FileAttributes LocalBackend::file_info(const path::NormalizedPath& path) {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  if (entry_type(path) == std::filesystem::file_type::not_found) {
    throw BackendError(BackendErrc::NOT_FOUND, path.str());
  }
  return attributes_of(full_path(path), path.str());
}

void LocalBackend::make_dir(const path::NormalizedPath& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (entry_type(path) != std::filesystem::file_type::not_found) {
    throw BackendError(BackendErrc::ALREADY_EXISTS, path.str());
  }
  require_unreserved_name(path);
  require_parent_directory(path);

  std::error_code ec;
  std::filesystem::create_directory(full_path(path), ec);
  if (ec) {
    throw error_for(ec, path.str());
  }
  BOOST_LOG_TRIVIAL(debug) << "Local backend: Created directory " << path;
}

void LocalBackend::del_dir(const path::NormalizedPath& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (path.is_root()) {
    throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot remove the root directory");
  }
  const auto type = entry_type(path);
  if (type == std::filesystem::file_type::not_found) {
    throw BackendError(BackendErrc::NOT_FOUND, path.str());
  }
  if (type != std::filesystem::file_type::directory) {
    throw BackendError(BackendErrc::NOT_A_DIRECTORY, path.str());
  }

  const std::filesystem::path location = full_path(path);
  std::error_code ec;
  const bool empty = std::filesystem::is_empty(location, ec);
  if (ec) {
    throw error_for(ec, path.str());
  }
  if (!empty) {
    throw BackendError(BackendErrc::NOT_EMPTY, path.str());
  }

  std::filesystem::remove(location, ec);
  if (ec) {
    throw error_for(ec, path.str());
  }
  BOOST_LOG_TRIVIAL(debug) << "Local backend: Removed directory " << path;
}

void LocalBackend::remove_file(const path::NormalizedPath& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  const auto type = entry_type(path);
  if (type == std::filesystem::file_type::not_found) {
    throw BackendError(BackendErrc::NOT_FOUND, path.str());
  }
  if (type == std::filesystem::file_type::directory) {
    throw BackendError(BackendErrc::IS_A_DIRECTORY, path.str());
  }

  std::error_code ec;
  std::filesystem::remove(full_path(path), ec);
  if (ec) {
    throw error_for(ec, path.str());
  }
  BOOST_LOG_TRIVIAL(debug) << "Local backend: Removed file " << path;
}

void LocalBackend::rename(const path::NormalizedPath& src, const path::NormalizedPath& dst) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  const auto src_type = entry_type(src);
  if (src_type == std::filesystem::file_type::not_found) {
    throw BackendError(BackendErrc::NOT_FOUND, src.str());
  }
  if (src == dst) {
    return;
  }
  if (src.is_root()) {
    throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot rename the root directory");
  }
  if (entry_type(dst) != std::filesystem::file_type::not_found) {
    throw BackendError(BackendErrc::ALREADY_EXISTS, dst.str());
  }
  require_unreserved_name(dst);
  require_parent_directory(dst);
  if (src_type == std::filesystem::file_type::directory && dst.is_within(src)) {
    throw BackendError(BackendErrc::PERMISSION_DENIED, "cannot move a directory into itself");
  }

  std::error_code ec;
  std::filesystem::rename(full_path(src), full_path(dst), ec);
  if (ec) {
    throw error_for(ec, src.str());
  }
  BOOST_LOG_TRIVIAL(debug) << "Local backend: Renamed " << src << " to " << dst;
}

Bytes LocalBackend::read_file(const path::NormalizedPath& path) {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  switch (entry_type(path)) {
    case std::filesystem::file_type::regular:
      break;
    case std::filesystem::file_type::not_found:
      throw BackendError(BackendErrc::NOT_FOUND, path.str());
    case std::filesystem::file_type::directory:
      throw BackendError(BackendErrc::IS_A_DIRECTORY, path.str());
    default:
      throw BackendError(BackendErrc::PERMISSION_DENIED, "not a regular file " + path.str());
  }

  std::ifstream file(full_path(path), std::ios::binary);
  if (!file) {
    throw error_for(std::error_code(errno, std::generic_category()), path.str());
  }
  Bytes content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
  if (file.bad()) {
    throw BackendError(BackendErrc::IO_ERROR, "failed to read " + path.str());
  }
  return content;
}

void LocalBackend::write_file(const path::NormalizedPath& path, const Bytes& content) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  switch (entry_type(path)) {
    case std::filesystem::file_type::regular:
      break;
    case std::filesystem::file_type::not_found:
      require_unreserved_name(path);
      require_parent_directory(path);
      break;
    case std::filesystem::file_type::directory:
      throw BackendError(BackendErrc::IS_A_DIRECTORY, path.str());
    default:
      throw BackendError(BackendErrc::PERMISSION_DENIED, "not a regular file " + path.str());
  }

  const std::filesystem::path target = full_path(path);
  std::filesystem::path temp = target;
  temp += TEMP_SUFFIX;
  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw error_for(std::error_code(errno, std::generic_category()), path.str());
    }
    file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    if (!file) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(temp, ignored);
      throw BackendError(BackendErrc::IO_ERROR, "failed to write " + path.str());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    throw error_for(ec, path.str());
  }
  BOOST_LOG_TRIVIAL(debug) << "Local backend: Wrote " << content.size() << " bytes to " << path;
}

std::string LocalBackend::describe() const {
  return "local directory " + root_.string();
}


//==============================================
// GETTERS
//==============================================

std::filesystem::path LocalBackend::full_path(const path::NormalizedPath& path) const {
  if (path.is_root()) {
    return root_;
  }
  return root_ / std::string(path.relative());
}


//==============================================
// UTILITY METHODS
//==============================================

std::filesystem::file_type LocalBackend::entry_type(const path::NormalizedPath& path) const {
  std::filesystem::path location = root_;
  const auto segments = path.segments();
  if (segments.empty()) {
    return std::filesystem::file_type::directory;
  }

  for (std::size_t i = 0; i < segments.size(); ++i) {
    location /= std::string(segments[i]);
    std::error_code ec;
    const std::filesystem::file_status status = std::filesystem::symlink_status(location, ec);
    const std::filesystem::file_type type = status.type();
    if (type == std::filesystem::file_type::not_found) {
      return type;
    }
    if (ec) {
      throw error_for(ec, path.str());
    }
    if (i + 1 == segments.size()) {
      return type;
    }
    if (type == std::filesystem::file_type::symlink) {
      throw BackendError(BackendErrc::PERMISSION_DENIED, "symbolic link in " + path.str());
    }
    // Nothing exists beneath a file
    if (type != std::filesystem::file_type::directory) {
      return std::filesystem::file_type::not_found;
    }
  }
  return std::filesystem::file_type::not_found;
}

void LocalBackend::require_parent_directory(const path::NormalizedPath& path) const {
  const path::NormalizedPath parent = path.parent();
  switch (entry_type(parent)) {
    case std::filesystem::file_type::directory:
      return;
    case std::filesystem::file_type::not_found:
      throw BackendError(BackendErrc::NOT_FOUND, "parent directory " + parent.str());
    case std::filesystem::file_type::symlink:
      throw BackendError(BackendErrc::PERMISSION_DENIED, "symbolic link " + parent.str());
    default:
      throw BackendError(BackendErrc::NOT_A_DIRECTORY, parent.str());
  }
}

FileAttributes LocalBackend::attributes_of(const std::filesystem::path& location, const std::string& context) const {
  struct stat st;
  if (::lstat(location.c_str(), &st) != 0) {
    throw error_for(std::error_code(errno, std::generic_category()), context);
  }

  const auto mtime = static_cast<uint32_t>(st.st_mtime);
  FileAttributes attrs;
  if (S_ISDIR(st.st_mode)) {
    attrs = FileAttributes::directory(mtime);
  } else if (S_ISREG(st.st_mode)) {
    attrs = FileAttributes::file(static_cast<uint64_t>(st.st_size), mtime);
  } else {
    attrs.type = S_ISLNK(st.st_mode) ? FileType::SYMLINK : FileType::SPECIAL;
    attrs.mtime = mtime;
  }
  attrs.permissions = static_cast<uint32_t>(st.st_mode) & PERMISSION_BITS;
  attrs.atime = static_cast<uint32_t>(st.st_atime);
  attrs.uid = static_cast<uint32_t>(st.st_uid);
  attrs.gid = static_cast<uint32_t>(st.st_gid);
  return attrs;
}

BackendError LocalBackend::error_for(const std::error_code& ec, const std::string& context) {
  if (ec == std::errc::no_such_file_or_directory) {
    return BackendError(BackendErrc::NOT_FOUND, context);
  }
  if (ec == std::errc::file_exists) {
    return BackendError(BackendErrc::ALREADY_EXISTS, context);
  }
  if (ec == std::errc::not_a_directory) {
    return BackendError(BackendErrc::NOT_A_DIRECTORY, context);
  }
  if (ec == std::errc::is_a_directory) {
    return BackendError(BackendErrc::IS_A_DIRECTORY, context);
  }
  if (ec == std::errc::directory_not_empty) {
    return BackendError(BackendErrc::NOT_EMPTY, context);
  }
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
      ec == std::errc::read_only_file_system) {
    return BackendError(BackendErrc::PERMISSION_DENIED, context);
  }
  BOOST_LOG_TRIVIAL(error) << "Local backend: Filesystem failure on " << context << ": " << ec.message();
  return BackendError(BackendErrc::IO_ERROR, context + ": " + ec.message());
}

} // namespace backend
} // namespace sftpgw
