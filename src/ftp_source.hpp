#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "remote_source.hpp"

struct FtpOptions {
  std::string host;
  int port = 21;
  std::string user = "anonymous";
  std::string password;
  bool use_tls = false;  // explicit FTPS (AUTH TLS) for control and data
  int connect_timeout_seconds = 120;
  int response_timeout_seconds = 120;
};

// FTP / FTPS transport on libcurl. One easy handle is kept for the lifetime
// of the object so listing and download reuse the control connection.
class FtpRemoteSource : public RemoteSource {
public:
  explicit FtpRemoteSource(FtpOptions options, std::shared_ptr<Logger> logger = nullptr);
  ~FtpRemoteSource() override;

  FtpRemoteSource(const FtpRemoteSource&) = delete;
  FtpRemoteSource& operator=(const FtpRemoteSource&) = delete;

  std::string describe() const override;
  std::vector<RemoteItem> list(const std::string& directory) override;
  void retrieve(const std::string& remote_path,
                const std::filesystem::path& local_path,
                uint64_t resume_offset,
                const TransferProgress& progress) override;
  // FTP REST is part of RFC 3659 and supported by the servers we talk to.
  bool supports_resume() const override { return true; }

private:
  struct Session;

  std::string make_url(const std::string& path, bool is_directory) const;
  // Returns the libcurl result; the raw listing is appended to out.
  int fetch_listing(const std::string& directory, bool use_mlsd, std::string& out);

  FtpOptions options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<Session> session_;
  std::optional<bool> mlsd_supported_;
};

// Listing parsers, exposed for tests.
std::vector<RemoteItem> parse_mlsd_listing(std::string_view listing);
std::vector<RemoteItem> parse_unix_listing(std::string_view listing);
