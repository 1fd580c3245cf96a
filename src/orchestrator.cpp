#include "orchestrator.hpp"

#include <system_error>
#include <vector>

#include "utils.hpp"

const char* to_string(StopReason reason) {
  switch(reason) {
    case StopReason::Exhausted: return "discovery exhausted";
    case StopReason::Budget: return "time budget reached";
    case StopReason::Signal: return "stop requested";
  }
  return "unknown";
}

Orchestrator::Orchestrator(const TransferConfig& config,
                           LedgerStore& store,
                           DiscoveryWalker& discovery,
                           const SpaceGuard& space_guard,
                           RetrievalEngine& retrieval,
                           DispatchEngine& dispatch,
                           const std::atomic<bool>* stop_flag,
                           std::shared_ptr<Logger> logger)
  : config_(config),
    store_(store),
    discovery_(discovery),
    space_guard_(space_guard),
    retrieval_(retrieval),
    dispatch_(dispatch),
    stop_flag_(stop_flag),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("orchestrator")),
    clock_([]{ return std::chrono::steady_clock::now(); }) {}

std::filesystem::path Orchestrator::local_path_for(const RemoteEntry& entry) const {
  // the path hash keeps equally named files from different folders apart
  return config_.work_dir / (sha256_hex(entry.path).substr(0, 8) + "-" + sanitize_file_name(entry.file_name()));
}

bool Orchestrator::budget_exhausted(std::chrono::steady_clock::time_point started) const {
  if(config_.time_budget.count() <= 0) return false;
  return clock_() - started >= config_.time_budget;
}

PassReport Orchestrator::run_pass() {
  const auto started = clock_();
  PassReport report;

  Ledger ledger = store_.load();
  TransferLedger transfers(ledger, store_, timestamp_clock_);
  if(auto stale = ledger.in_progress_path()) {
    logger_->warn("Previous run stopped while transferring {}", *stale);
  }

  std::vector<RemoteEntry> entries = discovery_.scan();
  report.discovered = entries.size();

  std::size_t index = 0;
  for(; index < entries.size(); ++index) {
    if(stop_requested()) {
      report.stop_reason = StopReason::Signal;
      break;
    }
    if(budget_exhausted(started)) {
      report.stop_reason = StopReason::Budget;
      break;
    }
    auto outcome = process(entries[index], transfers, report);
    if(outcome == Outcome::Stopped) {
      // the interrupted file stays IN_PROGRESS and counts as not reached
      report.stop_reason = StopReason::Signal;
      break;
    }
    switch(outcome) {
      case Outcome::Completed: ++report.completed; break;
      case Outcome::Failed: ++report.failed; break;
      case Outcome::Skipped: ++report.skipped; break;
      case Outcome::Untouched: ++report.untouched; break;
      case Outcome::Stopped: break;
    }
  }
  report.untouched += entries.size() - index;
  return report;
}

Orchestrator::Outcome Orchestrator::process(const RemoteEntry& entry,
                                            TransferLedger& ledger,
                                            PassReport& report) {
  const TransferRecord* existing = ledger.find(entry.path);
  std::optional<std::string> previous_group;
  if(existing) {
    if(existing->status == TransferStatus::Completed) return Outcome::Untouched;
    if(existing->status == TransferStatus::Skipped) {
      if(existing->skip_reason == SkipReason::AttemptCap) {
        discard_local(entry);
        return Outcome::Untouched;
      }
      if(!config_.retry_capacity_skips) return Outcome::Untouched;
    }
    if(existing->attempts >= config_.attempt_cap) {
      logger_->warn("Skipping {} for good after {} failed runs", entry.path, existing->attempts);
      ledger.mark_skipped(entry.path, entry.size, SkipReason::AttemptCap,
                          "attempt cap reached: " + existing->last_error);
      discard_local(entry);
      return Outcome::Skipped;
    }
    previous_group = existing->grouping_key;
  }

  const auto local_path = local_path_for(entry);
  std::error_code ec;
  uint64_t present = std::filesystem::file_size(local_path, ec);
  if(ec || present > entry.size) present = 0;
  if(!space_guard_.authorize(entry.size - present)) {
    const bool already = existing && existing->status == TransferStatus::Skipped &&
                         existing->skip_reason == SkipReason::Capacity;
    if(!already) {
      ledger.mark_skipped(entry.path, entry.size, SkipReason::Capacity, "not enough free space");
    }
    return Outcome::Skipped;
  }

  ledger.mark_in_progress(entry.path, entry.size);
  auto retrieval = retrieval_.retrieve(entry, local_path);
  report.bytes_moved += retrieval.bytes;
  if(retrieval.stopped) {
    logger_->info("Stopped while retrieving {}", entry.path);
    return Outcome::Stopped;
  }
  if(!retrieval.ok) {
    record_failure(entry, ledger, retrieval.error, std::nullopt);
    return Outcome::Failed;
  }

  auto dispatched = dispatch_.dispatch(local_path, entry, previous_group);
  if(!dispatched.ok) {
    record_failure(entry, ledger, dispatched.error, dispatched.grouping_key);
    return Outcome::Failed;
  }
  ledger.mark_completed(entry.path, dispatched.grouping_key, dispatched.upload_token, dispatched.content_sha256);
  return Outcome::Completed;
}

void Orchestrator::record_failure(const RemoteEntry& entry,
                                  TransferLedger& ledger,
                                  const std::string& error,
                                  const std::optional<std::string>& grouping_key) {
  RecordUpdate update;
  update.error = error;
  update.grouping_key = grouping_key;
  const int attempts = ledger.record(entry.path, TransferStatus::Failed, update).attempts;
  if(attempts >= config_.attempt_cap) {
    logger_->warn("Skipping {} for good after {} failed runs", entry.path, attempts);
    ledger.mark_skipped(entry.path, entry.size, SkipReason::AttemptCap, "attempt cap reached: " + error);
    discard_local(entry);
    return;
  }
  release_partial(entry);
}

void Orchestrator::discard_local(const RemoteEntry& entry) {
  const auto local_path = local_path_for(entry);
  std::error_code ec;
  if(!std::filesystem::exists(local_path, ec)) return;
  if(std::filesystem::remove(local_path, ec)) {
    logger_->info("Removed local copy of {}", entry.path);
  } else if(ec) {
    logger_->warn("Cannot delete {}: {}", local_path.string(), ec.message());
  }
}

void Orchestrator::release_partial(const RemoteEntry& entry) {
  std::error_code ec;
  auto size = std::filesystem::file_size(local_path_for(entry), ec);
  if(ec || space_guard_.can_keep(size)) return;
  discard_local(entry);
}

void log_pass_report(const PassReport& report, Logger& logger) {
  logger.info("Pass finished ({}): {} discovered, {} completed, {} failed, {} skipped, {} untouched, {} moved",
              to_string(report.stop_reason), report.discovered, report.completed, report.failed,
              report.skipped, report.untouched, format_size(report.bytes_moved));
}

void print_ledger_summary(const Ledger& ledger, Logger& logger) {
  logger.print("Ledger (schema {}, last updated {})",
               ledger.schema_version, ledger.last_updated.empty() ? "never" : ledger.last_updated);
  logger.print("  completed:   {}", ledger.count(TransferStatus::Completed));
  logger.print("  failed:      {}", ledger.count(TransferStatus::Failed));
  logger.print("  skipped:     {}", ledger.count(TransferStatus::Skipped));
  logger.print("  in progress: {}", ledger.in_progress_path().value_or("-"));
  logger.print("  moved:       {} in {} uploads, {} failed attempts",
               format_size(ledger.stats.total_bytes), ledger.stats.total_completed, ledger.stats.total_failed);

  bool header = false;
  for(const auto& [path, record] : ledger.records) {
    if(record.status != TransferStatus::Failed &&
       !(record.status == TransferStatus::Skipped && record.skip_reason == SkipReason::AttemptCap)) {
      continue;
    }
    if(!header) {
      logger.print("Failing files:");
      header = true;
    }
    logger.print("  {} [{}, {} attempts] {}", path, to_string(record.status), record.attempts, record.last_error);
  }
}
