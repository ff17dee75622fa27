#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

namespace reaper::model {

enum class ReplicaState : std::uint8_t {
  kUnspecified          = 0,
  kAvailable            = 1,
  kUnavailable          = 2,
  kCopying              = 3,
  kBeingDeleted         = 4,
  kBad                  = 5,
  kTemporaryUnavailable = 6,
};

constexpr std::string_view ToString(ReplicaState state) {
  switch (state) {
    case ReplicaState::kAvailable:
      return "available";
    case ReplicaState::kUnavailable:
      return "unavailable";
    case ReplicaState::kCopying:
      return "copying";
    case ReplicaState::kBeingDeleted:
      return "being_deleted";
    case ReplicaState::kBad:
      return "bad";
    case ReplicaState::kTemporaryUnavailable:
      return "temporary_unavailable";
    case ReplicaState::kUnspecified:
    default:
      return "unspecified";
  }
}

/*
  Identity of one physical copy: (scope, name) names the data object,
  rse_id names the storage location.
*/
struct ReplicaRef {
  std::string scope;
  std::string name;
  std::string rse_id;

  std::string ToString() const {
    return scope + ":" + name + "@" + rse_id;
  }

  bool operator==(const ReplicaRef& other) const {
    return scope == other.scope && name == other.name && rse_id == other.rse_id;
  }

  bool operator<(const ReplicaRef& other) const {
    return std::tie(rse_id, scope, name) < std::tie(other.rse_id, other.scope, other.name);
  }
};

/*
  A claimed replica as handed to the deletion worker.

  bytes and path are passed through to the physical deleter untouched.
*/
struct Replica {
  ReplicaRef    ref;
  ReplicaState  state         = ReplicaState::kUnspecified;
  std::uint64_t bytes         = 0;
  std::string   path;
  std::uint64_t updated_at_ms = 0;
};

} // namespace reaper::model
