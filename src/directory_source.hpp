#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "remote_source.hpp"

// A remote share that is already mounted locally (NFS, SMB, sshfs...).
// Remote paths are interpreted relative to the root directory.
class DirectoryRemoteSource : public RemoteSource {
public:
  explicit DirectoryRemoteSource(std::filesystem::path root,
                                 std::shared_ptr<Logger> logger = nullptr);

  std::string describe() const override;
  std::vector<RemoteItem> list(const std::string& directory) override;
  void retrieve(const std::string& remote_path,
                const std::filesystem::path& local_path,
                uint64_t resume_offset,
                const TransferProgress& progress) override;
  bool supports_resume() const override { return true; }

  std::size_t chunk_size() const { return chunk_size_; }
  void set_chunk_size(std::size_t bytes) { chunk_size_ = bytes == 0 ? 1 : bytes; }

private:
  std::filesystem::path resolve(const std::string& remote_path) const;

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;
  std::size_t chunk_size_ = 4 * 1024 * 1024;
};
