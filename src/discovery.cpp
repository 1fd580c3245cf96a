#include "discovery.hpp"

#include <algorithm>

#include "settings_manager.hpp"
#include "utils.hpp"

std::string RemoteEntry::file_name() const {
  auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string extension_of(const std::string& name) {
  auto dot = name.rfind('.');
  if(dot == std::string::npos || dot == 0) return std::string();
  return SettingsManager::to_lower(name.substr(dot));
}

DiscoveryWalker::DiscoveryWalker(RemoteSource& source,
                                 std::string root,
                                 DiscoveryFilter filter,
                                 std::shared_ptr<Logger> logger)
  : source_(source),
    root_(normalize_remote_path(root)),
    filter_(std::move(filter)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")) {
  for(auto& ext : filter_.extensions) {
    ext = SettingsManager::to_lower(ext);
  }
}

bool DiscoveryWalker::accepts(const std::string& name, uint64_t size) const {
  if(size < filter_.min_size || size > filter_.max_size) return false;
  if(filter_.extensions.empty()) return true;
  auto ext = extension_of(name);
  return std::find(filter_.extensions.begin(), filter_.extensions.end(), ext) != filter_.extensions.end();
}

std::vector<RemoteEntry> DiscoveryWalker::scan() {
  failed_directories_.clear();
  std::vector<RemoteEntry> out;
  walk(root_, out);
  if(filter_.smallest_first) {
    std::stable_sort(out.begin(), out.end(), [](const RemoteEntry& a, const RemoteEntry& b){
      return a.size < b.size;
    });
  }
  uint64_t total = 0;
  for(const auto& entry : out) total += entry.size;
  logger_->info("Discovered {} candidate files ({}) under {}", out.size(), format_size(total), root_);
  return out;
}

void DiscoveryWalker::walk(const std::string& directory, std::vector<RemoteEntry>& out) {
  std::vector<RemoteItem> items;
  try {
    items = source_.list(directory);
  } catch(const TransferError& e) {
    logger_->warn("Skipping {} for this pass: {}", directory, e.what());
    failed_directories_.push_back(directory);
    return;
  }

  for(const auto& item : items) {
    if(item.name.empty() || item.name == "." || item.name == ".." || item.is_symlink) continue;
    auto path = join_remote_path(directory, item.name);
    if(item.is_directory) {
      walk(path, out);
      continue;
    }
    if(!accepts(item.name, item.size)) continue;
    RemoteEntry entry;
    entry.path = path;
    entry.size = item.size;
    entry.extension = extension_of(item.name);
    entry.directory = directory;
    out.push_back(std::move(entry));
  }
}
