#include "retrieval_engine.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include "transfer_config.hpp"
#include "utils.hpp"

namespace {

using Clock = std::chrono::steady_clock;
constexpr std::chrono::milliseconds kPollStep{50};

// Samples the byte counter of one transfer and raises the abort flag when it
// stops moving for the stall timeout, or when a stop is requested.
class StallWatchdog {
public:
  StallWatchdog(const std::atomic<uint64_t>& counter,
                std::atomic<bool>& abort,
                const std::atomic<bool>* stop_flag,
                std::chrono::milliseconds timeout,
                std::chrono::milliseconds sample_interval)
    : counter_(counter), abort_(abort), stop_flag_(stop_flag),
      timeout_(timeout), sample_interval_(sample_interval) {
    if(sample_interval_.count() <= 0) sample_interval_ = std::chrono::milliseconds(1000);
    thread_ = std::thread([this]{ run(); });
  }

  ~StallWatchdog() {
    done_ = true;
    if(thread_.joinable()) thread_.join();
  }

  StallWatchdog(const StallWatchdog&) = delete;
  StallWatchdog& operator=(const StallWatchdog&) = delete;

  bool stalled() const { return stalled_.load(); }

private:
  void run() {
    uint64_t last_value = counter_.load();
    auto last_change = Clock::now();
    const auto step = std::min(sample_interval_, kPollStep);
    auto next_sample = last_change + sample_interval_;
    while(!done_.load()) {
      while(!done_.load() && Clock::now() < next_sample) {
        std::this_thread::sleep_for(step);
      }
      if(done_.load()) break;
      auto now = Clock::now();
      next_sample = now + sample_interval_;
      if(stop_flag_ && stop_flag_->load()) {
        abort_ = true;
        break;
      }
      uint64_t value = counter_.load();
      if(value != last_value) {
        last_value = value;
        last_change = now;
      } else if(now - last_change >= timeout_) {
        stalled_ = true;
        abort_ = true;
        break;
      }
    }
  }

  const std::atomic<uint64_t>& counter_;
  std::atomic<bool>& abort_;
  const std::atomic<bool>* stop_flag_;
  std::chrono::milliseconds timeout_;
  std::chrono::milliseconds sample_interval_;
  std::atomic<bool> done_{false};
  std::atomic<bool> stalled_{false};
  std::thread thread_;
};

std::string format_rate(uint64_t bytes, Clock::duration elapsed) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
  if(ms <= 0) return "-";
  return format_size(bytes * 1000 / static_cast<uint64_t>(ms)) + "/s";
}

} // namespace

RetrievalPolicy RetrievalPolicy::from_config(const TransferConfig& config) {
  RetrievalPolicy policy;
  policy.max_attempts = config.max_attempts_per_run;
  for(auto wait : config.backoff_schedule) {
    policy.backoff_schedule.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(wait));
  }
  policy.stall_timeout = config.stall_timeout;
  policy.stall_sample_interval = config.stall_sample_interval;
  policy.progress_interval = config.progress_interval;
  return policy;
}

std::chrono::milliseconds RetrievalPolicy::backoff_before(int attempt) const {
  if(attempt <= 1 || backoff_schedule.empty()) return std::chrono::milliseconds(0);
  auto index = static_cast<std::size_t>(attempt - 2);
  if(index >= backoff_schedule.size()) return backoff_schedule.back();
  return backoff_schedule[index];
}

RetrievalEngine::RetrievalEngine(RemoteSource& source,
                                 RetrievalPolicy policy,
                                 const std::atomic<bool>* stop_flag,
                                 Sleeper sleeper,
                                 std::shared_ptr<Logger> logger)
  : source_(source),
    policy_(std::move(policy)),
    stop_flag_(stop_flag),
    sleeper_(std::move(sleeper)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("retrieval")) {
  if(policy_.max_attempts < 1) policy_.max_attempts = 1;
  if(!sleeper_) {
    sleeper_ = [stop_flag](std::chrono::milliseconds wait){
      return interruptible_sleep(wait, stop_flag);
    };
  }
}

bool RetrievalEngine::interruptible_sleep(std::chrono::milliseconds duration,
                                          const std::atomic<bool>* stop_flag) {
  auto deadline = Clock::now() + duration;
  while(Clock::now() < deadline) {
    if(stop_flag && stop_flag->load()) return false;
    std::this_thread::sleep_for(std::min<Clock::duration>(kPollStep, deadline - Clock::now()));
  }
  return !(stop_flag && stop_flag->load());
}

RetrievalResult RetrievalEngine::retrieve(const RemoteEntry& entry, const std::filesystem::path& local_path) {
  RetrievalResult result;

  std::error_code ec;
  auto existing = std::filesystem::file_size(local_path, ec);
  if(!ec && existing == entry.size) {
    logger_->info("{} is already complete locally ({})", entry.path, format_size(existing));
    result.ok = true;
    return result;
  }

  for(int n = 1; n <= policy_.max_attempts; ++n) {
    if(stop_requested()) {
      result.stopped = true;
      result.error = "stop requested";
      return result;
    }
    auto wait = policy_.backoff_before(n);
    if(wait.count() > 0) {
      logger_->info("Waiting {} before attempt {}/{} of {}",
                    format_duration_compact(wait), n, policy_.max_attempts, entry.path);
      if(!sleeper_(wait)) {
        result.stopped = true;
        result.error = "stop requested";
        return result;
      }
    }

    result.attempts = n;
    switch(attempt(entry, local_path, result)) {
      case AttemptOutcome::Complete:
        result.ok = true;
        result.error.clear();
        return result;
      case AttemptOutcome::Stopped:
        result.stopped = true;
        return result;
      case AttemptOutcome::Failed:
        logger_->warn("Attempt {}/{} for {} failed: {}", n, policy_.max_attempts, entry.path, result.error);
        break;
    }
  }

  logger_->error("Giving up on {} for this run after {} attempts: {}",
                 entry.path, result.attempts, result.error);
  return result;
}

uint64_t RetrievalEngine::prepare_partial(const RemoteEntry& entry, const std::filesystem::path& local_path) {
  std::error_code ec;
  if(!std::filesystem::exists(local_path, ec)) return 0;
  auto size = std::filesystem::file_size(local_path, ec);
  if(!ec && size <= entry.size && source_.supports_resume()) {
    return size;
  }
  if(!ec && size > entry.size) {
    logger_->warn("Discarding {}: partial file is larger than the remote file", local_path.string());
  }
  std::filesystem::remove(local_path, ec);
  if(ec) {
    throw TransferError("cannot remove partial file " + local_path.string() + ": " + ec.message());
  }
  return 0;
}

RetrievalEngine::AttemptOutcome RetrievalEngine::attempt(const RemoteEntry& entry,
                                                         const std::filesystem::path& local_path,
                                                         RetrievalResult& result) {
  uint64_t offset = 0;
  try {
    offset = prepare_partial(entry, local_path);
  } catch(const TransferError& e) {
    result.error = e.what();
    return AttemptOutcome::Failed;
  }
  if(offset > 0) {
    logger_->info("Resuming {} at {} of {}", entry.path, format_size(offset), format_size(entry.size));
  } else {
    logger_->info("Retrieving {} ({})", entry.path, format_size(entry.size));
  }

  std::atomic<uint64_t> in_file{offset};
  std::atomic<bool> abort_requested{false};
  const auto started = Clock::now();
  auto last_report = started;

  TransferProgress progress = [&](uint64_t bytes_in_file){
    in_file = bytes_in_file;
    auto now = Clock::now();
    if(now - last_report >= policy_.progress_interval && entry.size > 0) {
      last_report = now;
      uint64_t received = bytes_in_file > offset ? bytes_in_file - offset : 0;
      auto elapsed = now - started;
      std::string eta = "-";
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
      if(received > 0 && ms > 0 && bytes_in_file < entry.size) {
        auto remaining_ms = (entry.size - bytes_in_file) * static_cast<uint64_t>(ms) / received;
        eta = format_duration_compact(std::chrono::milliseconds(remaining_ms));
      }
      logger_->info("{}: {:.1f}% ({} / {}) {} ETA {}",
                    entry.file_name(),
                    100.0 * static_cast<double>(bytes_in_file) / static_cast<double>(entry.size),
                    format_size(bytes_in_file), format_size(entry.size),
                    format_rate(received, elapsed), eta);
    }
    return !abort_requested.load() && !stop_requested();
  };

  std::string failure;
  bool stalled = false;
  {
    StallWatchdog watchdog(in_file, abort_requested, stop_flag_, policy_.stall_timeout, policy_.stall_sample_interval);
    try {
      source_.retrieve(entry.path, local_path, offset, progress);
    } catch(const TransferError& e) {
      failure = e.what();
    }
    stalled = watchdog.stalled();
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(local_path, ec);
  if(!ec && size > offset) result.bytes += size - offset;

  if(!failure.empty()) {
    if(stop_requested()) {
      result.error = "stop requested";
      return AttemptOutcome::Stopped;
    }
    if(stalled) {
      auto timeout = std::chrono::duration_cast<std::chrono::seconds>(policy_.stall_timeout).count();
      result.error = "stalled: no progress for " + std::to_string(timeout) + "s";
    } else {
      result.error = failure;
    }
    return AttemptOutcome::Failed;
  }

  if(ec) {
    result.error = "local file missing after transfer: " + ec.message();
    return AttemptOutcome::Failed;
  }
  if(size != entry.size) {
    result.error = "size mismatch: expected " + std::to_string(entry.size) + " bytes, got " + std::to_string(size);
    if(size > entry.size) {
      std::filesystem::remove(local_path, ec);
    }
    return AttemptOutcome::Failed;
  }

  auto elapsed = Clock::now() - started;
  logger_->info("Retrieved {} in {} ({})", entry.file_name(), format_duration_compact(elapsed),
                format_rate(size - offset, elapsed));
  return AttemptOutcome::Complete;
}
