#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"

struct RemoteItem {
  std::string name;
  uint64_t size = 0;
  bool is_directory = false;
  bool is_symlink = false;
};

class TransferError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Raised when a progress callback asked the transport to stop.
class TransferAborted : public TransferError {
public:
  using TransferError::TransferError;
};

// Receives the number of bytes present in the local file (resume offset
// included). Returning false aborts the transfer with TransferAborted.
// Transports call it regularly even while no data arrives.
using TransferProgress = std::function<bool(uint64_t bytes_in_file)>;

class RemoteSource {
public:
  virtual ~RemoteSource() = default;

  virtual std::string describe() const = 0;

  // Entries of one directory, without "." and "..". Throws TransferError.
  virtual std::vector<RemoteItem> list(const std::string& directory) = 0;

  // Writes the remote file to local_path. With resume_offset > 0 the data
  // from that offset is appended to the existing file, otherwise the local
  // file is truncated first. Throws TransferError / TransferAborted.
  virtual void retrieve(const std::string& remote_path,
                        const std::filesystem::path& local_path,
                        uint64_t resume_offset,
                        const TransferProgress& progress) = 0;

  virtual bool supports_resume() const = 0;
};

struct SourceOptions {
  std::string url;
  std::string user = "anonymous";
  std::string password;
  int connect_timeout_seconds = 120;
};

// ftp://, ftps:// (explicit TLS), file:// or a plain local path.
std::unique_ptr<RemoteSource> make_remote_source(const SourceOptions& options,
                                                 std::shared_ptr<Logger> logger);

// "/A" + "b.mkv" -> "/A/b.mkv"; always absolute, single separators.
std::string join_remote_path(const std::string& directory, const std::string& name);
std::string normalize_remote_path(const std::string& path);
