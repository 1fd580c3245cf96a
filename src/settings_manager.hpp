#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

constexpr uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source"},               {"aliases", {"src","s"}},        {"type","string"}, {"default",""},          {"description","Remote file source (ftp://host:port, ftps://host:port, file:///mnt/share or a local path)"}, {"persistent", true}},
  {{"key","ftp_user"},             {"aliases", {"user","u"}},       {"type","string"}, {"default","anonymous"}, {"description","FTP login name"}, {"persistent", true}},
  {{"key","ftp_password"},         {"aliases", {"password","pw"}},  {"type","string"}, {"default",""},          {"description","FTP password (falls back to $MEDIAFERRY_FTP_PASSWORD)"}, {"persistent", false}},
  {{"key","remote_root"},          {"aliases", {"root","r"}},       {"type","string"}, {"default","/"},         {"description","Remote directory the walk starts from"}, {"persistent", true}},
  {{"key","min_size"},             {"aliases", {"min"}},            {"type","uint64"}, {"default",1 * kGiB},    {"description","Smallest file considered, bytes (K/M/G/T suffix allowed)"}, {"persistent", true}},
  {{"key","max_size"},             {"aliases", {"max"}},            {"type","uint64"}, {"default",100 * kGiB},  {"description","Largest file considered, bytes (K/M/G/T suffix allowed)"}, {"persistent", true}},
  {{"key","extensions"},           {"aliases", {"ext"}},            {"type","json"},   {"default", nlohmann::json::array({".mkv",".iso",".mp4",".m4v",".avi",".m2ts"})}, {"description","JSON array of accepted file extensions"}, {"persistent", true}},
  {{"key","max_attempts_per_run"}, {"aliases", {"attempts","a"}},   {"type","int"},    {"default",3},           {"description","Download attempts per file within one run"}, {"persistent", true}},
  {{"key","attempt_cap"},          {"aliases", {"cap"}},            {"type","int"},    {"default",3},           {"description","Lifetime failed attempts before a file is skipped for good"}, {"persistent", true}},
  {{"key","backoff_schedule"},     {"aliases", {"backoff"}},        {"type","json"},   {"default", nlohmann::json::array({30,60,120,300,600})}, {"description","JSON array of seconds to wait between attempts"}, {"persistent", true}},
  {{"key","stall_timeout"},        {"aliases", {"stall"}},          {"type","int"},    {"default",300},         {"description","Seconds without progress before a transfer is aborted"}, {"persistent", true}},
  {{"key","stall_sample_interval"},{"aliases", {"sample"}},         {"type","int"},    {"default",5},           {"description","Seconds between progress samples of the stall watchdog"}, {"persistent", true}},
  {{"key","connect_timeout"},      {"aliases", {"ct"}},             {"type","int"},    {"default",120},         {"description","Seconds allowed for connecting to the remote source"}, {"persistent", true}},
  {{"key","safety_margin"},        {"aliases", {"margin"}},         {"type","uint64"}, {"default",2 * kGiB},    {"description","Bytes of free space always kept in reserve"}, {"persistent", true}},
  {{"key","work_dir"},             {"aliases", {"work","w"}},       {"type","string"}, {"default",""},          {"description","Directory receiving downloads (default: ./.work)"}, {"persistent", true}},
  {{"key","ledger_path"},          {"aliases", {"ledger","l"}},     {"type","string"}, {"default","upload_state.json"}, {"description","Transfer ledger document"}, {"persistent", true}},
  {{"key","time_budget"},          {"aliases", {"budget","tb"}},    {"type","int"},    {"default",0},           {"description","Wall-clock budget for one run in seconds (0 = unlimited)"}, {"persistent", true}},
  {{"key","smallest_first"},       {"aliases", {"sf"}},             {"type","bool"},   {"default",true},        {"description","Transfer the smallest discovered files first"}, {"persistent", true}},
  {{"key","retry_capacity_skips"}, {"aliases", {"rcs"}},            {"type","bool"},   {"default",true},        {"description","Re-evaluate files skipped for lack of disk space"}, {"persistent", true}},
  {{"key","upload_command"},       {"aliases", {"upload","up"}},    {"type","string"}, {"default",""},          {"description","Upload command; {file} {album} {size} {sha256} are substituted"}, {"persistent", true}},
  {{"key","album_command"},        {"aliases", {"album"}},          {"type","string"}, {"default",""},          {"description","Optional album creation command; {album} is substituted"}, {"persistent", true}},
  {{"key","upload_timeout"},       {"aliases", {"ut"}},             {"type","int"},    {"default",21600},       {"description","Seconds allowed for one upload command"}, {"persistent", true}},
  {{"key","progress_interval"},    {"aliases", {"pi"}},             {"type","int"},    {"default",30},          {"description","Seconds between transfer progress log lines"}, {"persistent", true}},
  {{"key","log_file"},             {"aliases", {"log"}},            {"type","string"}, {"default","mediaferry.log"}, {"description","Log file (empty disables)"}, {"persistent", true}},
  {{"key","verbose"},              {"aliases", {"v"}},              {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","summary"},              {"aliases", {"status"}},         {"type","bool"},   {"default",false},       {"description","Print the ledger summary and exit"}, {"persistent", false}},
  {{"key","reset_skipped"},        {"aliases", {"reset"}},          {"type","bool"},   {"default",false},       {"description","Forget skipped files so they are considered again"}, {"persistent", false}},
  {{"key","help"},                 {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},        {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  // "1536", "512K", "1.5G", "2T": binary multiples.
  static std::optional<uint64_t> parse_byte_size(const std::string& text);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const std::vector<SettingSpec>& setting_specs() const { return setting_specs_; }

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs().size());
  for(const auto& spec : setting_specs()) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return true;
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs()) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "uint64") {
    if(value.is_number_unsigned()) {
      settings_[spec.key] = value.get<uint64_t>();
      return true;
    }
    if(value.is_number_integer() && value.get<int64_t>() >= 0) {
      settings_[spec.key] = static_cast<uint64_t>(value.get<int64_t>());
      return true;
    }
    if(value.is_string()) {
      if(auto bytes = parse_byte_size(value.get<std::string>())) {
        settings_[spec.key] = *bytes;
        return true;
      }
    }
    error = "expected byte size";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "json") {
    settings_[spec.key] = value;
    return true;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      return std::stoi(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "uint64") {
    if(auto bytes = parse_byte_size(clean)) return *bytes;
    error = "expected byte size (e.g. 1536, 512M, 2G)";
    return {};
  }
  if(spec.type == "string") {
    return clean;
  }
  if(spec.type == "json") {
    try {
      return nlohmann::json::parse(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<uint64_t> SettingsManager::parse_byte_size(const std::string& text) {
  std::string clean = trim_copy(text);
  if(clean.empty()) return std::nullopt;

  uint64_t multiplier = 1;
  char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(clean.back())));
  if(suffix == 'B' && clean.size() > 1) {
    clean.pop_back();
    suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(clean.back())));
  }
  switch(suffix) {
    case 'K': multiplier = 1024ULL; break;
    case 'M': multiplier = 1024ULL * 1024ULL; break;
    case 'G': multiplier = kGiB; break;
    case 'T': multiplier = kGiB * 1024ULL; break;
    default: break;
  }
  if(multiplier != 1) clean.pop_back();
  if(clean.empty() || clean[0] == '-') return std::nullopt;

  try {
    std::size_t consumed = 0;
    if(multiplier == 1) {
      uint64_t value = std::stoull(clean, &consumed);
      if(consumed != clean.size()) return std::nullopt;
      return value;
    }
    double value = std::stod(clean, &consumed);
    if(consumed != clean.size() || value < 0) return std::nullopt;
    double bytes = value * static_cast<double>(multiplier);
    if(bytes >= static_cast<double>(std::numeric_limits<uint64_t>::max())) return std::nullopt;
    return static_cast<uint64_t>(bytes);
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
