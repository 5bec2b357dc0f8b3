#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace docstore::storage::common {

/*
  Object keys are "<transaction>/<document>". Each side must be a single
  path component so that keys map one-to-one onto store paths.
*/
inline void ValidatePathComponent(std::string_view what, const std::string& component) {
  if (component.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (component == "." || component == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

inline void ValidateObjectKey(const std::string& key) {
  const auto slash = key.find('/');
  if (slash == std::string::npos) {
    throw std::invalid_argument("object key must have the form <prefix>/<name>: " + key);
  }
  ValidatePathComponent("object key prefix", key.substr(0, slash));
  ValidatePathComponent("object name", key.substr(slash + 1));
}

inline std::string JoinPath(const std::string& base, const std::string& child) {
  if (base.empty()) {
    return child;
  }
  if (base.back() == '/') {
    return base + child;
  }
  return base + "/" + child;
}

} // namespace docstore::storage::common
