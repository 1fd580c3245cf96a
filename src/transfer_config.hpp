#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "remote_source.hpp"

class SettingsManager;

// Everything one run needs, read from the settings once at startup.
struct TransferConfig {
  SourceOptions source;
  std::string remote_root = "/";

  uint64_t min_size = 0;
  uint64_t max_size = 0;
  std::vector<std::string> extensions;  // lower-cased, with leading dot
  bool smallest_first = true;

  int max_attempts_per_run = 3;
  int attempt_cap = 3;
  std::vector<std::chrono::seconds> backoff_schedule;
  std::chrono::seconds stall_timeout{300};
  std::chrono::seconds stall_sample_interval{5};
  std::chrono::seconds progress_interval{30};

  uint64_t safety_margin = 0;
  std::filesystem::path work_dir;
  std::filesystem::path ledger_path;
  std::chrono::seconds time_budget{0};  // 0 = unlimited
  bool retry_capacity_skips = true;

  std::string upload_command;
  std::string album_command;
  std::chrono::seconds upload_timeout{21600};

  // Throws std::invalid_argument when a value is out of range.
  static TransferConfig from_settings(const SettingsManager& settings,
                                      const std::filesystem::path& workspace_root);
};

// Lower-cases and adds the leading dot: "MKV" -> ".mkv".
std::string normalize_extension(const std::string& extension);
