#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include "log.hpp"

// Decides whether a download may start given the free space of the work
// directory and a reserve that is never handed out.
class SpaceGuard {
public:
  // Returns free bytes, nullopt when the filesystem cannot be queried.
  using FreeSpaceProbe = std::function<std::optional<uint64_t>(const std::filesystem::path&)>;

  SpaceGuard(std::filesystem::path work_dir,
             uint64_t safety_margin,
             FreeSpaceProbe probe = FreeSpaceProbe(),
             std::shared_ptr<Logger> logger = nullptr);

  // free - margin >= file_size; rejects when free < margin.
  bool authorize(uint64_t file_size) const;
  // Same rule for an artifact that already occupies `bytes` on disk.
  bool can_keep(uint64_t bytes) const;

  std::optional<uint64_t> free_space() const;
  uint64_t safety_margin() const { return safety_margin_; }

  static std::optional<uint64_t> filesystem_free_space(const std::filesystem::path& dir);

private:
  std::filesystem::path work_dir_;
  uint64_t safety_margin_;
  FreeSpaceProbe probe_;
  std::shared_ptr<Logger> logger_;
};
