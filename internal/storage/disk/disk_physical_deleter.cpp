#include "disk_physical_deleter.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace reaper::storage {

using observability::StringField;

DiskPhysicalDeleter::DiskPhysicalDeleter(std::filesystem::path root)
    : root_(std::move(root)) {

  std::filesystem::create_directories(root_);
}

/*
  Remove one replica file.

  A file that is already gone counts as deleted: a previous worker may
  have removed it and crashed before committing the catalog row.
*/
bool DiskPhysicalDeleter::Delete(const model::Replica& replica) {
  std::filesystem::path path;
  try {
    path = common::ReplicaPath(root_, replica);
  } catch (const std::invalid_argument& e) {
    REAPER_LOG_WARN("replica path rejected", {StringField("replica", replica.ref.ToString()), StringField("error", e.what())});
    return false;
  }

  std::error_code ec;
  const bool      removed = std::filesystem::remove(path, ec);
  if (ec) {
    REAPER_LOG_WARN("physical deletion failed",
                    {StringField("replica", replica.ref.ToString()), StringField("path", path.string()), StringField("error", ec.message())});
    return false;
  }

  if (!removed) {
    REAPER_LOG_DEBUG("replica already absent", {StringField("replica", replica.ref.ToString()), StringField("path", path.string())});
  }
  return true;
}

} // namespace reaper::storage
