#include "ftp_source.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <mutex>
#include <optional>
#include <system_error>

namespace {

std::once_flag g_curl_init_once;

void curl_init_once() {
  std::call_once(g_curl_init_once, []{
    if(curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw TransferError("curl_global_init failed");
    }
  });
}

template<typename T>
void set_option(CURL* curl, CURLoption option, T value) {
  CURLcode code = curl_easy_setopt(curl, option, value);
  if(code != CURLE_OK) {
    throw TransferError(std::string("curl_easy_setopt: ") + curl_easy_strerror(code));
  }
}

bool equals_ci(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y){
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

bool starts_with_ci(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && equals_ci(text.substr(0, prefix.size()), prefix);
}

// nullopt for anything but a plain decimal that fits 64 bits
std::optional<uint64_t> parse_size(std::string_view text) {
  uint64_t value = 0;
  auto end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if(text.empty() || ec != std::errc() || ptr != end) return std::nullopt;
  return value;
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while(start < text.size()) {
    auto end = text.find('\n', start);
    if(end == std::string_view::npos) end = text.size();
    auto line = text.substr(start, end - start);
    if(!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if(!line.empty()) lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

size_t append_to_string(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(data, size * nmemb);
  return size * nmemb;
}

struct DownloadContext {
  std::FILE* file = nullptr;
  const TransferProgress* progress = nullptr;
  uint64_t resume_offset = 0;
  bool write_failed = false;
  bool aborted = false;
};

size_t write_to_file(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<DownloadContext*>(userdata);
  const size_t bytes = size * nmemb;
  if(std::fwrite(data, 1, bytes, ctx->file) != bytes) {
    ctx->write_failed = true;
    return 0;
  }
  return bytes;
}

// libcurl calls this about once per second even when nothing arrives, which
// is what lets a stalled transfer be aborted from outside.
int on_transfer_info(void* userdata, curl_off_t, curl_off_t dlnow, curl_off_t, curl_off_t) {
  auto* ctx = static_cast<DownloadContext*>(userdata);
  if(ctx->progress && *ctx->progress) {
    if(!(*ctx->progress)(ctx->resume_offset + static_cast<uint64_t>(dlnow))) {
      ctx->aborted = true;
      return 1;
    }
  }
  return 0;
}

bool is_connection_error(CURLcode code) {
  switch(code) {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_LOGIN_DENIED:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_USE_SSL_FAILED:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
      return true;
    default:
      return false;
  }
}

std::string_view next_token(std::string_view& rest) {
  auto begin = rest.find_first_not_of(" \t");
  if(begin == std::string_view::npos) {
    rest = std::string_view();
    return std::string_view();
  }
  rest.remove_prefix(begin);
  auto end = rest.find_first_of(" \t");
  auto token = rest.substr(0, end);
  rest.remove_prefix(end == std::string_view::npos ? rest.size() : end);
  return token;
}

} // namespace

struct FtpRemoteSource::Session {
  using Handle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

  Handle handle{nullptr, &curl_easy_cleanup};
  char error_buffer[CURL_ERROR_SIZE] = {};

  void reset(const FtpOptions& options) {
    CURL* curl = handle.get();
    curl_easy_reset(curl);
    error_buffer[0] = '\0';
    set_option(curl, CURLOPT_ERRORBUFFER, error_buffer);
    set_option(curl, CURLOPT_USERNAME, options.user.c_str());
    set_option(curl, CURLOPT_PASSWORD, options.password.c_str());
    set_option(curl, CURLOPT_NOSIGNAL, 1L);
    set_option(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_seconds));
    set_option(curl, CURLOPT_FTP_RESPONSE_TIMEOUT, static_cast<long>(options.response_timeout_seconds));
    set_option(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    set_option(curl, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    if(options.use_tls) {
      set_option(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
      set_option(curl, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
    }
  }

  std::string describe_error(int code) const {
    std::string text = curl_easy_strerror(static_cast<CURLcode>(code));
    if(error_buffer[0] != '\0') {
      text += " (";
      text += error_buffer;
      text += ")";
    }
    return text;
  }
};

FtpRemoteSource::FtpRemoteSource(FtpOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("ftp")),
    session_(std::make_unique<Session>()) {
  curl_init_once();
  session_->handle.reset(curl_easy_init());
  if(!session_->handle) {
    throw TransferError("curl_easy_init failed");
  }
}

FtpRemoteSource::~FtpRemoteSource() = default;

std::string FtpRemoteSource::describe() const {
  return std::string(options_.use_tls ? "ftps://" : "ftp://") + options_.host + ":" + std::to_string(options_.port);
}

std::string FtpRemoteSource::make_url(const std::string& path, bool is_directory) const {
  // explicit FTPS still uses the ftp:// scheme; CURLOPT_USE_SSL upgrades it
  std::string url = "ftp://" + options_.host + ":" + std::to_string(options_.port);
  const std::string normalized = normalize_remote_path(path);
  std::size_t start = 1;
  while(start <= normalized.size()) {
    auto end = normalized.find('/', start);
    if(end == std::string::npos) end = normalized.size();
    if(end > start) {
      std::string segment = normalized.substr(start, end - start);
      char* escaped = curl_easy_escape(session_->handle.get(), segment.c_str(), static_cast<int>(segment.size()));
      if(!escaped) {
        throw TransferError("cannot escape path segment " + segment);
      }
      url += "/";
      url += escaped;
      curl_free(escaped);
    }
    start = end + 1;
  }
  if(is_directory) url += "/";
  return url;
}

int FtpRemoteSource::fetch_listing(const std::string& directory, bool use_mlsd, std::string& out) {
  CURL* curl = session_->handle.get();
  session_->reset(options_);
  set_option(curl, CURLOPT_URL, make_url(directory, true).c_str());
  set_option(curl, CURLOPT_WRITEFUNCTION, &append_to_string);
  set_option(curl, CURLOPT_WRITEDATA, &out);
  if(use_mlsd) {
    set_option(curl, CURLOPT_CUSTOMREQUEST, "MLSD");
  }
  return curl_easy_perform(curl);
}

std::vector<RemoteItem> FtpRemoteSource::list(const std::string& directory) {
  if(mlsd_supported_.value_or(true)) {
    std::string raw;
    int code = fetch_listing(directory, true, raw);
    if(code == CURLE_OK) {
      mlsd_supported_ = true;
      return parse_mlsd_listing(raw);
    }
    if(mlsd_supported_.has_value() || is_connection_error(static_cast<CURLcode>(code))) {
      throw TransferError("MLSD " + directory + ": " + session_->describe_error(code));
    }
    logger_->debug("MLSD rejected by {} ({}), using LIST", describe(), session_->describe_error(code));
    mlsd_supported_ = false;
  }

  std::string raw;
  int code = fetch_listing(directory, false, raw);
  if(code != CURLE_OK) {
    throw TransferError("LIST " + directory + ": " + session_->describe_error(code));
  }
  return parse_unix_listing(raw);
}

void FtpRemoteSource::retrieve(const std::string& remote_path,
                               const std::filesystem::path& local_path,
                               uint64_t resume_offset,
                               const TransferProgress& progress) {
  std::unique_ptr<std::FILE, decltype(&std::fclose)> file(
    std::fopen(local_path.c_str(), resume_offset > 0 ? "ab" : "wb"), &std::fclose);
  if(!file) {
    throw TransferError("cannot open " + local_path.string() + " for writing");
  }

  DownloadContext ctx;
  ctx.file = file.get();
  ctx.progress = &progress;
  ctx.resume_offset = resume_offset;

  CURL* curl = session_->handle.get();
  session_->reset(options_);
  set_option(curl, CURLOPT_URL, make_url(remote_path, false).c_str());
  set_option(curl, CURLOPT_WRITEFUNCTION, &write_to_file);
  set_option(curl, CURLOPT_WRITEDATA, &ctx);
  set_option(curl, CURLOPT_NOPROGRESS, 0L);
  set_option(curl, CURLOPT_XFERINFOFUNCTION, &on_transfer_info);
  set_option(curl, CURLOPT_XFERINFODATA, &ctx);
  if(resume_offset > 0) {
    set_option(curl, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(resume_offset));
  }

  const int code = curl_easy_perform(curl);
  const bool flushed = std::fflush(file.get()) == 0;

  if(ctx.aborted || code == CURLE_ABORTED_BY_CALLBACK) {
    throw TransferAborted("RETR " + remote_path + " aborted");
  }
  if(ctx.write_failed || !flushed) {
    throw TransferError("writing " + local_path.string() + " failed");
  }
  if(code != CURLE_OK) {
    throw TransferError("RETR " + remote_path + ": " + session_->describe_error(code));
  }
}

std::vector<RemoteItem> parse_mlsd_listing(std::string_view listing) {
  // type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt
  std::vector<RemoteItem> out;
  for(auto line : split_lines(listing)) {
    if(!line.empty() && line.front() == ' ') line.remove_prefix(1);
    auto blank = line.find(' ');
    if(blank == std::string_view::npos) continue;
    auto facts = line.substr(0, blank);
    RemoteItem item;
    item.name = std::string(line.substr(blank + 1));
    if(item.name.empty() || item.name == "." || item.name == "..") continue;

    std::string_view type;
    std::string_view size;
    while(!facts.empty()) {
      auto semi = facts.find(';');
      auto fact = facts.substr(0, semi);
      facts.remove_prefix(semi == std::string_view::npos ? facts.size() : semi + 1);
      auto eq = fact.find('=');
      if(eq == std::string_view::npos) continue;
      auto key = fact.substr(0, eq);
      auto value = fact.substr(eq + 1);
      if(equals_ci(key, "type")) type = value;
      else if(equals_ci(key, "size")) size = value;
    }

    if(equals_ci(type, "cdir") || equals_ci(type, "pdir")) continue;
    if(equals_ci(type, "dir")) {
      item.is_directory = true;
    } else if(starts_with_ci(type, "OS.unix=slink") || starts_with_ci(type, "OS.unix=symlink")) {
      item.is_symlink = true;
    } else if(!size.empty()) {
      auto bytes = parse_size(size);
      if(!bytes) continue;
      item.size = *bytes;
    }
    out.push_back(std::move(item));
  }
  return out;
}

std::vector<RemoteItem> parse_unix_listing(std::string_view listing) {
  // drwxr-xr-x   2 user group     4096 Oct 31 10:33 Some Folder
  // -rw-r--r--   1 user group 12345678 Oct 31  2024 movie.mkv
  std::vector<RemoteItem> out;
  for(auto line : split_lines(listing)) {
    if(starts_with_ci(line, "total ")) continue;
    const char kind = line.front();
    if(kind != 'd' && kind != '-' && kind != 'l') continue;

    std::string_view rest = line;
    std::string_view fields[8];
    bool complete = true;
    for(auto& field : fields) {
      field = next_token(rest);
      if(field.empty()) {
        complete = false;
        break;
      }
    }
    if(!complete) continue;
    auto name_begin = rest.find_first_not_of(" \t");
    if(name_begin == std::string_view::npos) continue;
    auto name = rest.substr(name_begin);

    RemoteItem item;
    if(kind == 'l') {
      item.is_symlink = true;
      auto arrow = name.find(" -> ");
      if(arrow != std::string_view::npos) name = name.substr(0, arrow);
    } else if(kind == 'd') {
      item.is_directory = true;
    } else {
      auto bytes = parse_size(fields[4]);
      if(!bytes) continue;
      item.size = *bytes;
    }
    item.name = std::string(name);
    if(item.name == "." || item.name == "..") continue;
    out.push_back(std::move(item));
  }
  return out;
}
