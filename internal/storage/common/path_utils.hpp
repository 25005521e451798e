#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace mirrorsync::storage::common {

// A key is one path component: no separators, no dot entries.
inline void ValidateContentKey(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidArgument("content key must not be empty");
  }
  for (char c : key) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("content key contains invalid character");
    }
  }
  if (key == "." || key == ".." || key.front() == '.') {
    throw util::InvalidArgument("content key must not start with a dot");
  }
}

inline std::filesystem::path ContentPath(const std::filesystem::path& root, const std::string& key) {
  ValidateContentKey(key);
  return root / key;
}

// Staging files are dot-prefixed so they can never collide with a key.
inline std::filesystem::path StagingPath(const std::filesystem::path& root, const std::string& key, const std::string& nonce) {
  ValidateContentKey(key);
  return root / ("." + key + "." + nonce + ".partial");
}

} // namespace mirrorsync::storage::common
