#include "transfer_config.hpp"

#include <cstdlib>
#include <stdexcept>

#include "settings_manager.hpp"

namespace {

std::vector<std::chrono::seconds> read_backoff(const nlohmann::json& value) {
  if(!value.is_array() || value.empty()) {
    throw std::invalid_argument("backoff_schedule must be a non-empty array of seconds");
  }
  std::vector<std::chrono::seconds> out;
  for(const auto& item : value) {
    if(!item.is_number_integer() || item.get<int64_t>() < 0) {
      throw std::invalid_argument("backoff_schedule entries must be non-negative integers");
    }
    std::chrono::seconds wait(item.get<int64_t>());
    if(!out.empty() && wait <= out.back()) {
      throw std::invalid_argument("backoff_schedule must be strictly increasing");
    }
    out.push_back(wait);
  }
  return out;
}

std::vector<std::string> read_extensions(const nlohmann::json& value) {
  if(!value.is_array()) {
    throw std::invalid_argument("extensions must be an array of strings");
  }
  std::vector<std::string> out;
  for(const auto& item : value) {
    if(!item.is_string()) {
      throw std::invalid_argument("extensions must be an array of strings");
    }
    auto ext = normalize_extension(item.get<std::string>());
    if(ext.size() > 1) out.push_back(ext);
  }
  return out;
}

std::chrono::seconds positive_seconds(const SettingsManager& settings, const std::string& key) {
  int value = settings.get<int>(key);
  if(value <= 0) {
    throw std::invalid_argument(key + " must be positive");
  }
  return std::chrono::seconds(value);
}

} // namespace

std::string normalize_extension(const std::string& extension) {
  std::string out = SettingsManager::to_lower(SettingsManager::trim_copy(extension));
  if(out.empty() || out.front() != '.') out.insert(out.begin(), '.');
  return out;
}

TransferConfig TransferConfig::from_settings(const SettingsManager& settings,
                                             const std::filesystem::path& workspace_root) {
  TransferConfig config;
  config.source.url = settings.get<std::string>("source");
  config.source.user = settings.get<std::string>("ftp_user");
  config.source.password = settings.get<std::string>("ftp_password");
  if(config.source.password.empty()) {
    if(const char* env = std::getenv("MEDIAFERRY_FTP_PASSWORD")) {
      config.source.password = env;
    }
  }
  config.source.connect_timeout_seconds = static_cast<int>(positive_seconds(settings, "connect_timeout").count());
  config.remote_root = normalize_remote_path(settings.get<std::string>("remote_root"));

  config.min_size = settings.get<uint64_t>("min_size");
  config.max_size = settings.get<uint64_t>("max_size");
  if(config.min_size > config.max_size) {
    throw std::invalid_argument("min_size is larger than max_size");
  }
  config.extensions = read_extensions(settings.get<nlohmann::json>("extensions"));
  config.smallest_first = settings.get<bool>("smallest_first");

  config.max_attempts_per_run = settings.get<int>("max_attempts_per_run");
  if(config.max_attempts_per_run < 1) {
    throw std::invalid_argument("max_attempts_per_run must be at least 1");
  }
  config.attempt_cap = settings.get<int>("attempt_cap");
  if(config.attempt_cap < 1) {
    throw std::invalid_argument("attempt_cap must be at least 1");
  }
  config.backoff_schedule = read_backoff(settings.get<nlohmann::json>("backoff_schedule"));
  config.stall_timeout = positive_seconds(settings, "stall_timeout");
  config.stall_sample_interval = positive_seconds(settings, "stall_sample_interval");
  config.progress_interval = positive_seconds(settings, "progress_interval");

  config.safety_margin = settings.get<uint64_t>("safety_margin");
  auto work_dir = settings.get<std::string>("work_dir");
  config.work_dir = work_dir.empty() ? workspace_root / ".work" : std::filesystem::path(work_dir);
  std::filesystem::path ledger_path = settings.get<std::string>("ledger_path");
  config.ledger_path = ledger_path.is_absolute() ? ledger_path : workspace_root / ledger_path;
  int budget = settings.get<int>("time_budget");
  if(budget < 0) {
    throw std::invalid_argument("time_budget must not be negative");
  }
  config.time_budget = std::chrono::seconds(budget);
  config.retry_capacity_skips = settings.get<bool>("retry_capacity_skips");

  config.upload_command = settings.get<std::string>("upload_command");
  config.album_command = settings.get<std::string>("album_command");
  config.upload_timeout = positive_seconds(settings, "upload_timeout");
  return config;
}
