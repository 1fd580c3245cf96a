#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "remote_source.hpp"

struct RemoteEntry {
  std::string path;       // absolute remote path, the ledger key
  uint64_t size = 0;
  std::string extension;  // lower-cased, with leading dot
  std::string directory;  // remote parent directory

  std::string file_name() const;
};

struct DiscoveryFilter {
  uint64_t min_size = 0;
  uint64_t max_size = UINT64_MAX;
  std::vector<std::string> extensions;
  bool smallest_first = true;
};

// Walks the remote tree depth first and keeps the files that pass the
// filter. Every scan() starts a fresh walk; nothing is cached.
class DiscoveryWalker {
public:
  DiscoveryWalker(RemoteSource& source,
                  std::string root,
                  DiscoveryFilter filter,
                  std::shared_ptr<Logger> logger = nullptr);

  std::vector<RemoteEntry> scan();

  bool accepts(const std::string& name, uint64_t size) const;

  // directories whose listing failed during the last scan
  const std::vector<std::string>& failed_directories() const { return failed_directories_; }

private:
  void walk(const std::string& directory, std::vector<RemoteEntry>& out);

  RemoteSource& source_;
  std::string root_;
  DiscoveryFilter filter_;
  std::shared_ptr<Logger> logger_;
  std::vector<std::string> failed_directories_;
};

std::string extension_of(const std::string& name);
