#pragma once

#include <stdexcept>
#include <string>

namespace docflow::storage::common {

inline void ValidateContainer(const std::string& container) {
  if (container.empty()) {
    throw std::invalid_argument("container must not be empty");
  }
  for (char c : container) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("container contains invalid character");
    }
  }
  if (container == "." || container == "..") {
    throw std::invalid_argument("container must not be a relative path component");
  }
}

// Keys may contain '/' separators but no empty, "." or ".." segments.
inline void ValidateObjectKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("object key must not be empty");
  }

  std::size_t start = 0;
  while (start <= key.size()) {
    const auto end     = key.find('/', start);
    const auto segment = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (segment.empty() || segment == "." || segment == ".." || segment.find('\0') != std::string::npos) {
      throw std::invalid_argument("object key has an invalid path segment: " + key);
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
}

inline std::string ObjectPath(const std::string& root, const std::string& container, const std::string& key) {
  ValidateContainer(container);
  ValidateObjectKey(key);
  if (root.empty()) {
    return container + "/" + key;
  }
  if (root.back() == '/') {
    return root + container + "/" + key;
  }
  return root + "/" + container + "/" + key;
}

} // namespace docflow::storage::common
