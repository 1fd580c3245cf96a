#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "discovery.hpp"
#include "dispatch_engine.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "retrieval_engine.hpp"
#include "space_guard.hpp"
#include "transfer_config.hpp"

enum class StopReason { Exhausted, Budget, Signal };

const char* to_string(StopReason reason);

struct PassReport {
  std::size_t discovered = 0;
  std::size_t completed = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
  std::size_t untouched = 0;  // already done, terminal, or not reached
  uint64_t bytes_moved = 0;
  StopReason stop_reason = StopReason::Exhausted;
};

// Runs one sequential pass: discovery, ledger filter, space check, retrieval
// and dispatch, one file at a time, within the wall-clock budget.
class Orchestrator {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  Orchestrator(const TransferConfig& config,
               LedgerStore& store,
               DiscoveryWalker& discovery,
               const SpaceGuard& space_guard,
               RetrievalEngine& retrieval,
               DispatchEngine& dispatch,
               const std::atomic<bool>* stop_flag = nullptr,
               std::shared_ptr<Logger> logger = nullptr);

  void set_clock(Clock clock) { clock_ = std::move(clock); }
  void set_timestamp_clock(TransferLedger::Clock clock) { timestamp_clock_ = std::move(clock); }

  // Loads the ledger, walks the remote tree and processes what is due.
  // Throws LedgerError when the ledger cannot be persisted.
  PassReport run_pass();

  std::filesystem::path local_path_for(const RemoteEntry& entry) const;

private:
  enum class Outcome { Completed, Failed, Skipped, Untouched, Stopped };

  Outcome process(const RemoteEntry& entry, TransferLedger& ledger, PassReport& report);
  // FAILED, and SKIPPED(attempt_cap) once the lifetime attempts reach the cap
  void record_failure(const RemoteEntry& entry,
                      TransferLedger& ledger,
                      const std::string& error,
                      const std::optional<std::string>& grouping_key);
  // Deletes the local artifact of entry, if any.
  void discard_local(const RemoteEntry& entry);
  // Keeps a partial for the next run only while the safety margin survives.
  void release_partial(const RemoteEntry& entry);
  bool budget_exhausted(std::chrono::steady_clock::time_point started) const;
  bool stop_requested() const { return stop_flag_ && stop_flag_->load(); }

  const TransferConfig& config_;
  LedgerStore& store_;
  DiscoveryWalker& discovery_;
  const SpaceGuard& space_guard_;
  RetrievalEngine& retrieval_;
  DispatchEngine& dispatch_;
  const std::atomic<bool>* stop_flag_;
  std::shared_ptr<Logger> logger_;
  Clock clock_;
  TransferLedger::Clock timestamp_clock_;
};

void log_pass_report(const PassReport& report, Logger& logger);
// Counts per status, bytes moved, the in-progress path and failing files.
void print_ledger_summary(const Ledger& ledger, Logger& logger);
