#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "discovery.hpp"
#include "log.hpp"
#include "space_guard.hpp"
#include "uploader.hpp"

struct DispatchResult {
  bool ok = false;
  std::string error;
  std::string grouping_key;  // "" when the file sits in the remote root
  std::string upload_token;
  std::string content_sha256;
  bool artifact_kept = false;
};

// "/A/B/f1.mkv" -> "A/B"; files in the root have no key ("").
std::string derive_grouping_key(const std::string& remote_path);

// Hands a complete local file to the uploader and cleans up after it.
class DispatchEngine {
public:
  DispatchEngine(Uploader& uploader,
                 const SpaceGuard& space_guard,
                 std::shared_ptr<Logger> logger = nullptr);

  // previous_group is the key stored on the record by an earlier attempt;
  // when present it wins over the derived one.
  DispatchResult dispatch(const std::filesystem::path& local_path,
                          const RemoteEntry& entry,
                          const std::optional<std::string>& previous_group);

private:
  void release_artifact(const std::filesystem::path& local_path, DispatchResult& result);

  Uploader& uploader_;
  const SpaceGuard& space_guard_;
  std::shared_ptr<Logger> logger_;
};
