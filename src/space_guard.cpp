#include "space_guard.hpp"

#include <system_error>

#include "utils.hpp"

SpaceGuard::SpaceGuard(std::filesystem::path work_dir,
                       uint64_t safety_margin,
                       FreeSpaceProbe probe,
                       std::shared_ptr<Logger> logger)
  : work_dir_(std::move(work_dir)),
    safety_margin_(safety_margin),
    probe_(probe ? std::move(probe) : FreeSpaceProbe(&SpaceGuard::filesystem_free_space)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("space")) {}

std::optional<uint64_t> SpaceGuard::filesystem_free_space(const std::filesystem::path& dir) {
  std::error_code ec;
  auto info = std::filesystem::space(dir, ec);
  if(ec) return std::nullopt;
  return static_cast<uint64_t>(info.available);
}

std::optional<uint64_t> SpaceGuard::free_space() const {
  return probe_(work_dir_);
}

bool SpaceGuard::authorize(uint64_t file_size) const {
  auto available = free_space();
  if(!available) {
    logger_->warn("Cannot query free space of {}", work_dir_.string());
    return false;
  }
  if(*available < safety_margin_ || *available - safety_margin_ < file_size) {
    logger_->info("Not enough space for {}: {} free, {} reserved",
                  format_size(file_size), format_size(*available), format_size(safety_margin_));
    return false;
  }
  return true;
}

bool SpaceGuard::can_keep(uint64_t bytes) const {
  // the artifact already occupies its bytes, so only the margin must stay free
  auto available = free_space();
  if(available && *available >= safety_margin_) return true;
  logger_->info("Releasing {} artifact to restore the {} reserve", format_size(bytes), format_size(safety_margin_));
  return false;
}
