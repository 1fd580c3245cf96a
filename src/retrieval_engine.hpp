#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "discovery.hpp"
#include "log.hpp"
#include "remote_source.hpp"

struct TransferConfig;

struct RetrievalPolicy {
  int max_attempts = 3;
  std::vector<std::chrono::milliseconds> backoff_schedule;
  std::chrono::milliseconds stall_timeout{std::chrono::seconds(300)};
  std::chrono::milliseconds stall_sample_interval{std::chrono::seconds(5)};
  std::chrono::milliseconds progress_interval{std::chrono::seconds(30)};

  static RetrievalPolicy from_config(const TransferConfig& config);

  // attempt is 1-based; the first attempt never waits and the last schedule
  // entry is repeated once the schedule runs out.
  std::chrono::milliseconds backoff_before(int attempt) const;
};

struct RetrievalResult {
  bool ok = false;
  bool stopped = false;  // a stop was requested; nothing should be recorded
  std::string error;
  int attempts = 0;      // transfer attempts made in this call
  uint64_t bytes = 0;    // bytes received in this call
};

// Downloads one RemoteEntry to a local file with bounded retries, backoff,
// stall detection and resume of partial files.
class RetrievalEngine {
public:
  // Waits for the given time; returns false when interrupted by a stop.
  using Sleeper = std::function<bool(std::chrono::milliseconds)>;

  RetrievalEngine(RemoteSource& source,
                  RetrievalPolicy policy,
                  const std::atomic<bool>* stop_flag = nullptr,
                  Sleeper sleeper = Sleeper(),
                  std::shared_ptr<Logger> logger = nullptr);

  RetrievalResult retrieve(const RemoteEntry& entry, const std::filesystem::path& local_path);

  const RetrievalPolicy& policy() const { return policy_; }

  static bool interruptible_sleep(std::chrono::milliseconds duration,
                                  const std::atomic<bool>* stop_flag);

private:
  enum class AttemptOutcome { Complete, Failed, Stopped };

  AttemptOutcome attempt(const RemoteEntry& entry,
                         const std::filesystem::path& local_path,
                         RetrievalResult& result);
  uint64_t prepare_partial(const RemoteEntry& entry, const std::filesystem::path& local_path);
  bool stop_requested() const { return stop_flag_ && stop_flag_->load(); }

  RemoteSource& source_;
  RetrievalPolicy policy_;
  const std::atomic<bool>* stop_flag_;
  Sleeper sleeper_;
  std::shared_ptr<Logger> logger_;
};
