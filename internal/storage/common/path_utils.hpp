#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/model/replica.hpp"

namespace reaper::storage::common {

inline void ValidatePathComponent(const std::string& component, const char* what) {
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

/*
  Resolve the on-disk location of a replica below root.

  An explicit replica path is used as given (relative to root) but may
  not climb out of it; otherwise the location is root/<scope>/<name>.
*/
inline std::filesystem::path ReplicaPath(const std::filesystem::path& root, const reaper::model::Replica& replica) {
  if (replica.path.empty()) {
    ValidatePathComponent(replica.ref.scope, "replica scope");
    ValidatePathComponent(replica.ref.name, "replica name");
    return root / replica.ref.scope / replica.ref.name;
  }

  const auto relative = std::filesystem::path(replica.path).relative_path().lexically_normal();
  if (relative.empty() || *relative.begin() == "..") {
    throw std::invalid_argument("replica path escapes storage root: " + replica.path);
  }
  return root / relative;
}

} // namespace reaper::storage::common
