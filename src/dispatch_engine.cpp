#include "dispatch_engine.hpp"

#include <system_error>

#include "utils.hpp"

std::string derive_grouping_key(const std::string& remote_path) {
  auto slash = remote_path.rfind('/');
  if(slash == std::string::npos) return std::string();
  std::string directory = remote_path.substr(0, slash);
  auto begin = directory.find_first_not_of('/');
  if(begin == std::string::npos) return std::string();
  auto end = directory.find_last_not_of('/');
  return directory.substr(begin, end - begin + 1);
}

DispatchEngine::DispatchEngine(Uploader& uploader,
                               const SpaceGuard& space_guard,
                               std::shared_ptr<Logger> logger)
  : uploader_(uploader),
    space_guard_(space_guard),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("dispatch")) {}

DispatchResult DispatchEngine::dispatch(const std::filesystem::path& local_path,
                                        const RemoteEntry& entry,
                                        const std::optional<std::string>& previous_group) {
  DispatchResult result;
  result.grouping_key = previous_group ? *previous_group : derive_grouping_key(entry.path);

  std::error_code ec;
  auto size = std::filesystem::file_size(local_path, ec);
  if(ec) {
    result.error = "local artifact missing: " + ec.message();
    return result;
  }
  if(size != entry.size) {
    result.error = "local artifact has " + std::to_string(size) + " bytes, expected " + std::to_string(entry.size);
    std::filesystem::remove(local_path, ec);
    return result;
  }

  auto digest = sha256_file_hex(local_path);
  if(!digest) {
    result.error = "cannot read " + local_path.string() + " for hashing";
    release_artifact(local_path, result);
    return result;
  }
  result.content_sha256 = *digest;

  UploadRequest request;
  request.file = local_path;
  request.size = size;
  request.sha256 = result.content_sha256;
  if(!result.grouping_key.empty()) request.group = result.grouping_key;

  try {
    if(request.group) {
      try {
        uploader_.ensure_group(*request.group);
      } catch(const GroupConflict&) {
        logger_->debug("Album '{}' already exists", *request.group);
      }
    }
    logger_->info("Uploading {} ({}) to album '{}'", entry.file_name(), format_size(size), result.grouping_key);
    result.upload_token = uploader_.upload(request);
  } catch(const UploadError& e) {
    result.error = e.what();
    logger_->error("Upload of {} failed: {}", entry.path, result.error);
    release_artifact(local_path, result);
    return result;
  }

  result.ok = true;
  std::filesystem::remove(local_path, ec);
  if(ec) {
    logger_->warn("Cannot delete {}: {}", local_path.string(), ec.message());
  }
  logger_->info("Uploaded {} -> {}", entry.path, result.upload_token.empty() ? "<no token>" : result.upload_token);
  return result;
}

void DispatchEngine::release_artifact(const std::filesystem::path& local_path, DispatchResult& result) {
  std::error_code ec;
  auto size = std::filesystem::file_size(local_path, ec);
  if(!ec && space_guard_.can_keep(size)) {
    result.artifact_kept = true;
    logger_->info("Keeping {} for the next attempt", local_path.string());
    return;
  }
  std::filesystem::remove(local_path, ec);
  if(ec) {
    logger_->warn("Cannot delete {}: {}", local_path.string(), ec.message());
  }
}
