#pragma once

#include <filesystem>

#include "internal/storage/physical_deleter.hpp"

namespace reaper::storage {

class DiskPhysicalDeleter final : public PhysicalDeleter {
 public:
  explicit DiskPhysicalDeleter(std::filesystem::path root);

  bool Delete(const model::Replica& replica) override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace reaper::storage
