#include "path/path_normalizer.hpp"
#include <boost/log/trivial.hpp>

namespace sftpgw {
namespace path {

namespace {

constexpr char SEPARATOR = '/';
constexpr std::string_view ROOT = "/";

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

NormalizedPath::NormalizedPath() : repr_(ROOT) {}


//==============================================
// ACCESSORS
//==============================================

std::string_view NormalizedPath::view() const {
  if (const auto* borrowed = std::get_if<std::string_view>(&repr_)) {
    return *borrowed;
  }
  return std::get<std::string>(repr_);
}


//==============================================
// DERIVED PATHS
//==============================================

NormalizedPath NormalizedPath::to_owned() const {
  return NormalizedPath(std::string(view()));
}

NormalizedPath NormalizedPath::parent() const {
  const std::string_view current = view();
  if (is_root()) {
    return NormalizedPath();
  }
  const std::size_t last = current.rfind(SEPARATOR);
  if (last == 0) {
    return NormalizedPath();
  }
  return NormalizedPath(std::string(current.substr(0, last)));
}

std::string_view NormalizedPath::file_name() const {
  const std::string_view current = view();
  if (is_root()) {
    return {};
  }
  return current.substr(current.rfind(SEPARATOR) + 1);
}

NormalizedPath NormalizedPath::join(std::string_view segment) const {
  if (segment.empty() || segment == "." || segment == ".." ||
      segment.find(SEPARATOR) != std::string_view::npos ||
      segment.find('\0') != std::string_view::npos) {
    throw PathError("'" + std::string(segment) + "' is not a single path segment");
  }
  std::string joined(view());
  if (!is_root()) {
    joined.push_back(SEPARATOR);
  }
  joined.append(segment);
  return NormalizedPath(std::move(joined));
}

std::string_view NormalizedPath::relative() const {
  return view().substr(1);
}

bool NormalizedPath::is_within(const NormalizedPath& ancestor) const {
  const std::string_view self = view();
  const std::string_view base = ancestor.view();
  if (ancestor.is_root() || self == base) {
    return true;
  }
  return self.size() > base.size() &&
         self.compare(0, base.size(), base) == 0 &&
         self[base.size()] == SEPARATOR;
}

std::vector<std::string_view> NormalizedPath::segments() const {
  std::vector<std::string_view> parts;
  std::string_view rest = relative();
  while (!rest.empty()) {
    const std::size_t next = rest.find(SEPARATOR);
    parts.push_back(rest.substr(0, next));
    if (next == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(next + 1);
  }
  return parts;
}


//==============================================
// NORMALIZATION
//==============================================

bool is_normalized(std::string_view raw) {
  if (raw.empty() || raw.front() != SEPARATOR) {
    return false;
  }
  if (raw.size() == 1) {
    return true;
  }
  if (raw.back() == SEPARATOR || raw.find('\0') != std::string_view::npos) {
    return false;
  }

  // Every segment after the leading separator must be a plain name
  std::size_t start = 1;
  while (start <= raw.size()) {
    std::size_t end = raw.find(SEPARATOR, start);
    if (end == std::string_view::npos) {
      end = raw.size();
    }
    const std::string_view segment = raw.substr(start, end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      return false;
    }
    start = end + 1;
  }
  return true;
}

NormalizedPath normalize(std::string_view raw) {
  if (raw.find('\0') != std::string_view::npos) {
    BOOST_LOG_TRIVIAL(debug) << "Path normalizer: Rejecting path with embedded NUL byte";
    throw PathError("path contains a NUL byte");
  }

  if (is_normalized(raw)) {
    return NormalizedPath(raw);
  }

  std::vector<std::string_view> retained;
  std::size_t start = 0;
  while (start <= raw.size()) {
    std::size_t end = raw.find(SEPARATOR, start);
    if (end == std::string_view::npos) {
      end = raw.size();
    }
    const std::string_view segment = raw.substr(start, end - start);

    if (segment == "..") {
      if (retained.empty()) {
        BOOST_LOG_TRIVIAL(debug) << "Path normalizer: Path escapes the virtual root: " << raw;
        throw PathError("'" + std::string(raw) + "' resolves above the root");
      }
      retained.pop_back();
    } else if (!segment.empty() && segment != ".") {
      retained.push_back(segment);
    }
    start = end + 1;
  }

  if (retained.empty()) {
    return NormalizedPath();
  }

  std::string result;
  result.reserve(raw.size() + 1);
  for (const auto& segment : retained) {
    result.push_back(SEPARATOR);
    result.append(segment);
  }
  return NormalizedPath(std::move(result));
}

} // namespace path
} // namespace sftpgw
