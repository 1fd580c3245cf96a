#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "log.hpp"

struct UploadRequest {
  std::filesystem::path file;
  std::optional<std::string> group;  // album name; none for root files
  uint64_t size = 0;
  std::string sha256;
};

class UploadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The group already exists on the service side.
class GroupConflict : public UploadError {
public:
  using UploadError::UploadError;
};

// Hands complete files to the photo service.
class Uploader {
public:
  virtual ~Uploader() = default;
  // Throws GroupConflict when the group exists already, UploadError otherwise.
  virtual void ensure_group(const std::string& group) = 0;
  // Returns the confirmation token of the service. Throws UploadError.
  virtual std::string upload(const UploadRequest& request) = 0;
};

struct CommandOutput {
  int exit_code = -1;
  std::string out;
  std::string err;
};

class SystemCommandError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Runs `/bin/sh -c command` with stdin on /dev/null. The child is killed and
// SystemCommandError raised when it runs longer than timeout.
CommandOutput run_shell_command(const std::string& command, std::chrono::milliseconds timeout);

// Replaces {name} placeholders with the shell-quoted value; unknown
// placeholders are left untouched.
std::string expand_command(const std::string& pattern,
                           const std::map<std::string, std::string>& values);

// Delegates to external commands, e.g. an rclone or gphotos-uploader wrapper.
// The confirmation token is the last non-empty line the upload command
// prints on stdout. An album command that fails saying "already exists"
// reports a GroupConflict.
class CommandUploader : public Uploader {
public:
  CommandUploader(std::string upload_command,
                  std::string album_command,
                  std::chrono::milliseconds timeout,
                  std::shared_ptr<Logger> logger = nullptr);

  void ensure_group(const std::string& group) override;
  std::string upload(const UploadRequest& request) override;

private:
  std::string upload_command_;
  std::string album_command_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;
};
