#include "directory_source.hpp"

#include <fstream>

DirectoryRemoteSource::DirectoryRemoteSource(std::filesystem::path root, std::shared_ptr<Logger> logger)
  : root_(std::move(root)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("share")) {}

std::string DirectoryRemoteSource::describe() const {
  return "file://" + root_.string();
}

std::filesystem::path DirectoryRemoteSource::resolve(const std::string& remote_path) const {
  auto relative = std::filesystem::path(normalize_remote_path(remote_path)).relative_path();
  for(const auto& part : relative) {
    if(part == "..") {
      throw TransferError("path escapes the share: " + remote_path);
    }
  }
  return root_ / relative;
}

std::vector<RemoteItem> DirectoryRemoteSource::list(const std::string& directory) {
  const auto dir = resolve(directory);
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if(ec) {
    throw TransferError("cannot list " + directory + ": " + ec.message());
  }

  std::vector<RemoteItem> out;
  for(; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if(ec) {
      throw TransferError("listing " + directory + " failed: " + ec.message());
    }
    const auto& entry = *it;
    RemoteItem item;
    item.name = entry.path().filename().string();
    std::error_code status_ec;
    item.is_symlink = entry.is_symlink(status_ec);
    if(!item.is_symlink) {
      item.is_directory = entry.is_directory(status_ec);
      if(!item.is_directory) {
        if(!entry.is_regular_file(status_ec)) continue;
        item.size = entry.file_size(status_ec);
        if(status_ec) {
          logger_->warn("Cannot stat {}: {}", entry.path().string(), status_ec.message());
          continue;
        }
      }
    }
    out.push_back(std::move(item));
  }
  if(ec) {
    throw TransferError("listing " + directory + " failed: " + ec.message());
  }
  return out;
}

void DirectoryRemoteSource::retrieve(const std::string& remote_path,
                                     const std::filesystem::path& local_path,
                                     uint64_t resume_offset,
                                     const TransferProgress& progress) {
  const auto source_path = resolve(remote_path);
  std::ifstream in(source_path, std::ios::binary);
  if(!in) {
    throw TransferError("cannot open " + remote_path);
  }
  if(resume_offset > 0) {
    in.seekg(static_cast<std::streamoff>(resume_offset));
    if(!in) {
      throw TransferError("cannot seek " + remote_path + " to " + std::to_string(resume_offset));
    }
  }

  auto mode = std::ios::binary | (resume_offset > 0 ? std::ios::app : std::ios::trunc);
  std::ofstream out(local_path, mode);
  if(!out) {
    throw TransferError("cannot write " + local_path.string());
  }

  uint64_t in_file = resume_offset;
  if(progress && !progress(in_file)) {
    throw TransferAborted("transfer of " + remote_path + " aborted");
  }
  std::vector<char> buffer(chunk_size_);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto read = in.gcount();
    if(read <= 0) break;
    out.write(buffer.data(), read);
    if(!out) {
      throw TransferError("write to " + local_path.string() + " failed");
    }
    in_file += static_cast<uint64_t>(read);
    if(progress && !progress(in_file)) {
      out.flush();
      throw TransferAborted("transfer of " + remote_path + " aborted");
    }
  }
  if(in.bad()) {
    throw TransferError("read of " + remote_path + " failed");
  }
  out.flush();
  if(!out) {
    throw TransferError("flush of " + local_path.string() + " failed");
  }
}
