#include "uploader.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

// Anonymous temp file receiving one output stream of the child.
class CaptureFile {
public:
  CaptureFile() {
    std::error_code ec;
    auto temp_dir = std::filesystem::temp_directory_path(ec);
    if(ec) throw SystemCommandError("no temporary directory: " + ec.message());
    auto pattern = (temp_dir / "mediaferry-XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');
    fd_ = ::mkstemp(name.data());
    if(fd_ == -1) throw SystemCommandError(errno_text("mkstemp"));
    ::unlink(name.data());
  }
  ~CaptureFile() { if(fd_ != -1) ::close(fd_); }

  CaptureFile(const CaptureFile&) = delete;
  CaptureFile& operator=(const CaptureFile&) = delete;

  int fd() const { return fd_; }

  std::string read_all() const {
    if(::lseek(fd_, 0, SEEK_SET) < 0) throw SystemCommandError(errno_text("lseek"));
    std::string data;
    char buffer[4096];
    for(;;) {
      ssize_t n = ::read(fd_, buffer, sizeof(buffer));
      if(n < 0) {
        if(errno == EINTR) continue;
        throw SystemCommandError(errno_text("read"));
      }
      if(n == 0) break;
      data.append(buffer, static_cast<std::size_t>(n));
    }
    return data;
  }

private:
  int fd_ = -1;
};

void reap(pid_t pid, int* status) {
  while(::waitpid(pid, status, 0) < 0) {
    if(errno != EINTR) throw SystemCommandError(errno_text("waitpid"));
  }
}

std::string last_non_empty_line(const std::string& text) {
  std::size_t end = text.size();
  while(end > 0) {
    auto begin = text.rfind('\n', end - 1);
    begin = (begin == std::string::npos) ? 0 : begin + 1;
    auto line = SettingsManager::trim_copy(text.substr(begin, end - begin));
    if(!line.empty()) return line;
    if(begin == 0) break;
    end = begin - 1;
  }
  return std::string();
}

std::string describe_failure(const CommandOutput& output) {
  auto detail = last_non_empty_line(output.err);
  if(detail.empty()) detail = last_non_empty_line(output.out);
  std::string text = "exit code " + std::to_string(output.exit_code);
  if(!detail.empty()) text += ": " + detail;
  return text;
}

} // namespace

CommandOutput run_shell_command(const std::string& command, std::chrono::milliseconds timeout) {
  CaptureFile out;
  CaptureFile err;

  // EOF on this pipe tells the parent that the child has exited
  int life_sign[2] = {};
  if(::pipe2(life_sign, O_CLOEXEC) != 0) throw SystemCommandError(errno_text("pipe2"));

  const pid_t pid = ::fork();
  if(pid < 0) {
    ::close(life_sign[0]);
    ::close(life_sign[1]);
    throw SystemCommandError(errno_text("fork"));
  }

  if(pid == 0) {
    ::setpgid(0, 0);
    ::dup2(out.fd(), STDOUT_FILENO);
    ::dup2(err.fd(), STDERR_FILENO);
    int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if(dev_null != -1) ::dup2(dev_null, STDIN_FILENO);
    // dup() drops O_CLOEXEC, so the shell keeps the write end until it exits
    if(::dup(life_sign[1]) == -1) ::_exit(126);
    const char* argv[] = { "sh", "-c", command.c_str(), nullptr };
    ::execv("/bin/sh", const_cast<char**>(argv));
    ::_exit(127);
  }

  ::close(life_sign[1]);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool timed_out = false;
  for(;;) {
    auto now = std::chrono::steady_clock::now();
    if(now >= deadline) {
      timed_out = true;
      break;
    }
    auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    pollfd pfd{life_sign[0], POLLIN, 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(wait_ms, 1000)));
    if(rv < 0) {
      if(errno == EINTR) continue;
      auto error = errno_text("poll");
      ::close(life_sign[0]);
      ::kill(-pid, SIGKILL);
      reap(pid, nullptr);
      throw SystemCommandError(error);
    }
    if(rv == 0) continue;
    char buffer[16];
    ssize_t n = ::read(life_sign[0], buffer, sizeof(buffer));
    if(n == 0) break;
    if(n < 0 && errno != EINTR && errno != EAGAIN) {
      auto error = errno_text("read");
      ::close(life_sign[0]);
      ::kill(-pid, SIGKILL);
      reap(pid, nullptr);
      throw SystemCommandError(error);
    }
  }
  ::close(life_sign[0]);

  if(timed_out) {
    ::kill(-pid, SIGKILL);
    reap(pid, nullptr);
    throw SystemCommandError("command timed out after " +
                             std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count()) + "s");
  }

  int status = 0;
  reap(pid, &status);
  CommandOutput result;
  if(WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  result.out = out.read_all();
  result.err = err.read_all();
  return result;
}

std::string expand_command(const std::string& pattern,
                           const std::map<std::string, std::string>& values) {
  std::string out;
  out.reserve(pattern.size());
  std::size_t pos = 0;
  while(pos < pattern.size()) {
    auto open = pattern.find('{', pos);
    if(open == std::string::npos) {
      out.append(pattern, pos, std::string::npos);
      break;
    }
    out.append(pattern, pos, open - pos);
    auto close = pattern.find('}', open + 1);
    if(close == std::string::npos) {
      out.append(pattern, open, std::string::npos);
      break;
    }
    auto it = values.find(pattern.substr(open + 1, close - open - 1));
    if(it == values.end()) {
      out.append(pattern, open, close - open + 1);
    } else {
      out += shell_quote(it->second);
    }
    pos = close + 1;
  }
  return out;
}

CommandUploader::CommandUploader(std::string upload_command,
                                 std::string album_command,
                                 std::chrono::milliseconds timeout,
                                 std::shared_ptr<Logger> logger)
  : upload_command_(std::move(upload_command)),
    album_command_(std::move(album_command)),
    timeout_(timeout),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("upload")) {}

void CommandUploader::ensure_group(const std::string& group) {
  if(album_command_.empty()) return;
  auto command = expand_command(album_command_, {{"album", group}});
  logger_->debug("Running album command: {}", command);

  CommandOutput output;
  try {
    output = run_shell_command(command, timeout_);
  } catch(const SystemCommandError& e) {
    throw UploadError(std::string("album command failed: ") + e.what());
  }
  if(output.exit_code == 0) return;
  auto text = SettingsManager::to_lower(output.out + "\n" + output.err);
  if(text.find("already exists") != std::string::npos) {
    throw GroupConflict("album '" + group + "' already exists");
  }
  throw UploadError("album command failed with " + describe_failure(output));
}

std::string CommandUploader::upload(const UploadRequest& request) {
  if(upload_command_.empty()) {
    throw UploadError("no upload command configured");
  }
  auto command = expand_command(upload_command_, {
    {"file", request.file.string()},
    {"album", request.group.value_or(std::string())},
    {"size", std::to_string(request.size)},
    {"sha256", request.sha256}
  });
  logger_->debug("Running upload command: {}", command);

  CommandOutput output;
  try {
    output = run_shell_command(command, timeout_);
  } catch(const SystemCommandError& e) {
    throw UploadError(std::string("upload command failed: ") + e.what());
  }
  if(output.exit_code != 0) {
    throw UploadError("upload command failed with " + describe_failure(output));
  }
  auto token = last_non_empty_line(output.out);
  if(token.empty()) {
    logger_->warn("Upload command printed no confirmation token for {}", request.file.string());
  }
  return token;
}
