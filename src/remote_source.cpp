#include "remote_source.hpp"

#include <cstdlib>

#include "directory_source.hpp"
#include "ftp_source.hpp"
#include "settings_manager.hpp"

namespace {

bool starts_with_ci(const std::string& text, const std::string& prefix) {
  if(text.size() < prefix.size()) return false;
  return SettingsManager::to_lower(text.substr(0, prefix.size())) == prefix;
}

FtpOptions parse_ftp_url(const std::string& url, const SourceOptions& options, bool tls) {
  FtpOptions ftp;
  ftp.use_tls = tls;
  ftp.user = options.user;
  ftp.password = options.password;
  ftp.connect_timeout_seconds = options.connect_timeout_seconds;

  std::string rest = url.substr(url.find("://") + 3);
  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);

  auto at = authority.rfind('@');
  if(at != std::string::npos) {
    std::string credentials = authority.substr(0, at);
    authority = authority.substr(at + 1);
    auto colon = credentials.find(':');
    ftp.user = credentials.substr(0, colon);
    if(colon != std::string::npos) ftp.password = credentials.substr(colon + 1);
  }

  auto colon = authority.rfind(':');
  if(colon != std::string::npos) {
    ftp.host = authority.substr(0, colon);
    char* end = nullptr;
    long port = std::strtol(authority.c_str() + colon + 1, &end, 10);
    if(*end != '\0' || port <= 0 || port > 65535) {
      throw TransferError("invalid port in source URL: " + url);
    }
    ftp.port = static_cast<int>(port);
  } else {
    ftp.host = authority;
  }
  if(ftp.host.empty()) {
    throw TransferError("missing host in source URL: " + url);
  }
  return ftp;
}

} // namespace

std::unique_ptr<RemoteSource> make_remote_source(const SourceOptions& options,
                                                 std::shared_ptr<Logger> logger) {
  const std::string& url = options.url;
  if(url.empty()) {
    throw TransferError("no source configured");
  }
  if(starts_with_ci(url, "ftps://")) {
    return std::make_unique<FtpRemoteSource>(parse_ftp_url(url, options, true), std::move(logger));
  }
  if(starts_with_ci(url, "ftp://")) {
    return std::make_unique<FtpRemoteSource>(parse_ftp_url(url, options, false), std::move(logger));
  }
  if(starts_with_ci(url, "file://")) {
    return std::make_unique<DirectoryRemoteSource>(url.substr(7), std::move(logger));
  }
  if(url.find("://") != std::string::npos) {
    throw TransferError("unsupported source scheme: " + url);
  }
  return std::make_unique<DirectoryRemoteSource>(url, std::move(logger));
}

std::string normalize_remote_path(const std::string& path) {
  std::string out = "/";
  for(char c : path) {
    if(c == '/' && out.back() == '/') continue;
    out.push_back(c);
  }
  if(out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

std::string join_remote_path(const std::string& directory, const std::string& name) {
  return normalize_remote_path(directory + "/" + name);
}
