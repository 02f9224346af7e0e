#ifndef SFTPGW_PATH_NORMALIZER_HPP
#define SFTPGW_PATH_NORMALIZER_HPP

#include <cstddef>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sftpgw {
namespace path {

class PathError : public std::runtime_error {
public:
  explicit PathError(const std::string& message)
    : std::runtime_error("Invalid path: " + message) {}
};

/**
 * Canonical absolute path inside the virtual filesystem.
 * Always starts with '/', has no '.' or '..' segments, no repeated separators
 * and no trailing separator unless it is the root.
 *
 * Instances produced from input that was already canonical borrow the caller's
 * buffer; the caller must keep that buffer alive or call to_owned().
 */
class NormalizedPath {
public:
  // ---- CONSTRUCTOR ----
  // The root path "/"
  NormalizedPath();


  // ---- ACCESSORS ----
  std::string_view view() const;
  std::string str() const { return std::string(view()); }
  // True when the path does not own its buffer (canonical input or the root)
  bool is_borrowed() const { return std::holds_alternative<std::string_view>(repr_); }
  bool is_root() const { return view().size() == 1; }


  // ---- DERIVED PATHS ----
  // Owned copy that is safe to keep past the input buffer's lifetime
  NormalizedPath to_owned() const;
  // Parent directory, the root is its own parent
  NormalizedPath parent() const;
  // Last segment, empty for the root
  std::string_view file_name() const;
  // Appends a single segment, throws PathError if the segment is not a plain name
  NormalizedPath join(std::string_view segment) const;
  // Path without the leading separator, empty for the root
  std::string_view relative() const;
  // True if this path equals ancestor or lies beneath it
  bool is_within(const NormalizedPath& ancestor) const;
  std::vector<std::string_view> segments() const;

private:
  friend NormalizedPath normalize(std::string_view raw);

  explicit NormalizedPath(std::string_view borrowed) : repr_(borrowed) {}
  explicit NormalizedPath(std::string owned) : repr_(std::move(owned)) {}

  std::variant<std::string_view, std::string> repr_;
};

// Checks whether raw is already in canonical form
bool is_normalized(std::string_view raw);

// Canonicalizes raw against the virtual root.
// Throws PathError for embedded NUL bytes or '..' escaping the root.
NormalizedPath normalize(std::string_view raw);

inline bool operator==(const NormalizedPath& lhs, const NormalizedPath& rhs) {
  return lhs.view() == rhs.view();
}

inline bool operator!=(const NormalizedPath& lhs, const NormalizedPath& rhs) {
  return !(lhs == rhs);
}

inline bool operator<(const NormalizedPath& lhs, const NormalizedPath& rhs) {
  return lhs.view() < rhs.view();
}

inline std::ostream& operator<<(std::ostream& os, const NormalizedPath& p) {
  return os << p.view();
}

} // namespace path
} // namespace sftpgw

namespace std {
template <>
struct hash<sftpgw::path::NormalizedPath> {
  std::size_t operator()(const sftpgw::path::NormalizedPath& p) const noexcept {
    return std::hash<std::string_view>()(p.view());
  }
};
} // namespace std

#endif // SFTPGW_PATH_NORMALIZER_HPP
