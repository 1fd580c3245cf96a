#include "ledger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>

#include "utils.hpp"

namespace {

nlohmann::json optional_string(const std::optional<std::string>& value) {
  if(!value) return nullptr;
  return *value;
}

std::string string_field(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if(it == obj.end() || !it->is_string()) return std::string();
  return it->get<std::string>();
}

uint64_t unsigned_field(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if(it == obj.end() || !it->is_number()) return 0;
  if(it->is_number_unsigned()) return it->get<uint64_t>();
  if(it->is_number_integer()) {
    auto value = it->get<int64_t>();
    return value < 0 ? 0 : static_cast<uint64_t>(value);
  }
  double value = it->get<double>();
  return value < 0 ? 0 : static_cast<uint64_t>(value);
}

nlohmann::json record_to_json(const TransferRecord& rec) {
  nlohmann::json out = nlohmann::json::object();
  out["status"] = to_string(rec.status);
  out["size"] = rec.size;
  out["attempts"] = rec.attempts;
  out["last_error"] = rec.last_error;
  out["first_failed"] = rec.first_failed;
  out["last_failed"] = rec.last_failed;
  out["started_at"] = rec.started_at;
  out["completed_at"] = rec.completed_at;
  out["grouping_key"] = optional_string(rec.grouping_key);
  out["upload_token"] = rec.upload_token;
  out["content_sha256"] = rec.content_sha256;
  if(rec.skip_reason == SkipReason::None) {
    out["skip_reason"] = nullptr;
  } else {
    out["skip_reason"] = to_string(rec.skip_reason);
  }
  return out;
}

std::optional<TransferRecord> record_from_json(const std::string& path,
                                               const nlohmann::json& obj,
                                               Logger* logger) {
  if(!obj.is_object()) {
    log_warn(logger, "Ignoring ledger record for {}: not an object", path);
    return std::nullopt;
  }
  auto status = transfer_status_from_string(string_field(obj, "status"));
  if(!status) {
    log_warn(logger, "Ignoring ledger record for {}: unknown status '{}'", path, string_field(obj, "status"));
    return std::nullopt;
  }
  TransferRecord rec;
  rec.status = *status;
  rec.size = unsigned_field(obj, "size");
  rec.attempts = static_cast<int>(unsigned_field(obj, "attempts"));
  rec.last_error = string_field(obj, "last_error");
  rec.first_failed = string_field(obj, "first_failed");
  rec.last_failed = string_field(obj, "last_failed");
  rec.started_at = string_field(obj, "started_at");
  rec.completed_at = string_field(obj, "completed_at");
  auto group = obj.find("grouping_key");
  if(group != obj.end() && group->is_string()) {
    rec.grouping_key = group->get<std::string>();
  }
  rec.upload_token = string_field(obj, "upload_token");
  rec.content_sha256 = string_field(obj, "content_sha256");
  rec.skip_reason = skip_reason_from_string(string_field(obj, "skip_reason"));
  if(rec.status == TransferStatus::Skipped && rec.skip_reason == SkipReason::None) {
    rec.skip_reason = SkipReason::Capacity;
  }
  return rec;
}

// Schema 1 kept per-status buckets instead of one record per path.
Ledger ledger_from_v1(const nlohmann::json& doc, Logger* logger) {
  Ledger ledger;
  ledger.last_updated = string_field(doc, "last_updated");

  if(auto it = doc.find("completed"); it != doc.end() && it->is_array()) {
    for(const auto& entry : *it) {
      if(!entry.is_string()) continue;
      TransferRecord rec;
      rec.status = TransferStatus::Completed;
      ledger.records[entry.get<std::string>()] = rec;
    }
  }
  if(auto it = doc.find("failed"); it != doc.end() && it->is_object()) {
    for(const auto& item : it->items()) {
      if(ledger.records.count(item.key())) continue;
      TransferRecord rec;
      rec.status = TransferStatus::Failed;
      if(item.value().is_object()) {
        rec.attempts = static_cast<int>(unsigned_field(item.value(), "attempts"));
        rec.last_error = string_field(item.value(), "last_error");
        rec.first_failed = string_field(item.value(), "first_failed");
        rec.last_failed = string_field(item.value(), "last_failed");
      }
      ledger.records[item.key()] = rec;
    }
  }
  if(auto it = doc.find("skipped"); it != doc.end() && it->is_array()) {
    for(const auto& entry : *it) {
      if(!entry.is_string() || ledger.records.count(entry.get<std::string>())) continue;
      TransferRecord rec;
      rec.status = TransferStatus::Skipped;
      rec.skip_reason = SkipReason::Capacity;
      ledger.records[entry.get<std::string>()] = rec;
    }
  }
  if(auto it = doc.find("in_progress"); it != doc.end() && it->is_object()) {
    auto path = string_field(*it, "path");
    if(!path.empty() && !ledger.records.count(path)) {
      TransferRecord rec;
      rec.status = TransferStatus::InProgress;
      rec.size = unsigned_field(*it, "size");
      rec.started_at = string_field(*it, "started_at");
      ledger.records[path] = rec;
    }
  }
  if(auto it = doc.find("stats"); it != doc.end() && it->is_object()) {
    ledger.stats.total_completed = unsigned_field(*it, "total_uploaded");
    ledger.stats.total_failed = unsigned_field(*it, "total_failed");
    ledger.stats.total_bytes = unsigned_field(*it, "total_bytes");
  }
  log_warn(logger, "Converted schema 1 ledger with {} records", ledger.records.size());
  return ledger;
}

std::string errno_text(const char* what, const std::filesystem::path& path) {
  return std::string(what) + " " + path.string() + ": " + std::strerror(errno);
}

} // namespace

const char* to_string(TransferStatus status) {
  switch(status) {
    case TransferStatus::InProgress: return "in_progress";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed: return "failed";
    case TransferStatus::Skipped: return "skipped";
  }
  return "unknown";
}

const char* to_string(SkipReason reason) {
  switch(reason) {
    case SkipReason::None: return "none";
    case SkipReason::Capacity: return "capacity";
    case SkipReason::AttemptCap: return "attempt_cap";
  }
  return "none";
}

std::optional<TransferStatus> transfer_status_from_string(const std::string& text) {
  if(text == "in_progress") return TransferStatus::InProgress;
  if(text == "completed") return TransferStatus::Completed;
  if(text == "failed") return TransferStatus::Failed;
  if(text == "skipped") return TransferStatus::Skipped;
  return std::nullopt;
}

SkipReason skip_reason_from_string(const std::string& text) {
  if(text == "capacity") return SkipReason::Capacity;
  if(text == "attempt_cap") return SkipReason::AttemptCap;
  return SkipReason::None;
}

bool TransferRecord::is_terminal() const {
  if(status == TransferStatus::Completed) return true;
  return status == TransferStatus::Skipped && skip_reason == SkipReason::AttemptCap;
}

const TransferRecord* Ledger::find(const std::string& path) const {
  auto it = records.find(path);
  return it == records.end() ? nullptr : &it->second;
}

std::size_t Ledger::count(TransferStatus status) const {
  std::size_t total = 0;
  for(const auto& entry : records) {
    if(entry.second.status == status) ++total;
  }
  return total;
}

std::optional<std::string> Ledger::in_progress_path() const {
  for(const auto& entry : records) {
    if(entry.second.status == TransferStatus::InProgress) return entry.first;
  }
  return std::nullopt;
}

nlohmann::json ledger_to_json(const Ledger& ledger) {
  nlohmann::json doc = nlohmann::json::object();
  doc["schema_version"] = kLedgerSchemaVersion;
  doc["last_updated"] = ledger.last_updated;
  nlohmann::json records = nlohmann::json::object();
  for(const auto& entry : ledger.records) {
    records[entry.first] = record_to_json(entry.second);
  }
  doc["records"] = std::move(records);
  doc["stats"] = {
    {"total_bytes", ledger.stats.total_bytes},
    {"total_completed", ledger.stats.total_completed},
    {"total_failed", ledger.stats.total_failed}
  };
  return doc;
}

Ledger ledger_from_json(const nlohmann::json& doc, Logger* logger) {
  if(!doc.is_object()) {
    throw LedgerError("ledger document is not a JSON object");
  }
  if(!doc.contains("records")) {
    if(doc.contains("completed") || doc.contains("failed") || doc.contains("skipped")) {
      return ledger_from_v1(doc, logger);
    }
    throw LedgerError("ledger document has no records");
  }

  const auto& records = doc.at("records");
  if(!records.is_object()) {
    throw LedgerError("ledger records must be an object");
  }

  Ledger ledger;
  auto version = doc.find("schema_version");
  if(version != doc.end() && version->is_number_integer()) {
    int found = version->get<int>();
    if(found > kLedgerSchemaVersion) {
      log_warn(logger, "Ledger schema {} is newer than {}; reading known fields only", found, kLedgerSchemaVersion);
    }
  }
  ledger.last_updated = string_field(doc, "last_updated");
  for(const auto& item : records.items()) {
    if(auto rec = record_from_json(item.key(), item.value(), logger)) {
      ledger.records.emplace(item.key(), std::move(*rec));
    }
  }
  if(auto it = doc.find("stats"); it != doc.end() && it->is_object()) {
    ledger.stats.total_bytes = unsigned_field(*it, "total_bytes");
    ledger.stats.total_completed = unsigned_field(*it, "total_completed");
    ledger.stats.total_failed = unsigned_field(*it, "total_failed");
  }
  return ledger;
}

// ---- FileLedgerStore --------------------------------------------------------

FileLedgerStore::FileLedgerStore(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("ledger")) {}

std::filesystem::path FileLedgerStore::temp_path() const {
  auto tmp = path_;
  tmp += ".tmp";
  return tmp;
}

void FileLedgerStore::quarantine_corrupt_document() const {
  auto target = path_;
  target += ".corrupt";
  std::error_code ec;
  std::filesystem::rename(path_, target, ec);
  if(ec) {
    logger_->warn("Unable to move unreadable ledger aside: {}", ec.message());
  } else {
    logger_->warn("Unreadable ledger kept as {}", target.string());
  }
}

Ledger FileLedgerStore::load() {
  std::error_code ec;
  // a temp file only survives a save that never reached the rename
  if(std::filesystem::remove(temp_path(), ec)) {
    logger_->warn("Discarded unfinished ledger write {}", temp_path().string());
  }

  if(!std::filesystem::exists(path_, ec)) {
    logger_->info("No ledger at {}, starting empty", path_.string());
    return Ledger{};
  }

  std::ifstream in(path_, std::ios::binary);
  if(!in) {
    logger_->warn("Unable to open ledger {}, starting empty", path_.string());
    return Ledger{};
  }

  try {
    auto doc = nlohmann::json::parse(in);
    auto ledger = ledger_from_json(doc, logger_.get());
    logger_->info("Loaded ledger {} ({} records)", path_.string(), ledger.records.size());
    return ledger;
  } catch(const nlohmann::json::exception& e) {
    logger_->warn("Ledger {} is malformed ({}), starting empty", path_.string(), e.what());
  } catch(const LedgerError& e) {
    logger_->warn("Ledger {} is unusable ({}), starting empty", path_.string(), e.what());
  }
  in.close();
  quarantine_corrupt_document();
  return Ledger{};
}

void FileLedgerStore::save(const Ledger& ledger) {
  const std::string payload = ledger_to_json(ledger).dump(2);
  const auto tmp = temp_path();

  std::error_code ec;
  if(path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if(fd < 0) {
    throw LedgerError(errno_text("cannot create", tmp));
  }

  std::size_t written = 0;
  while(written < payload.size()) {
    ssize_t rv = ::write(fd, payload.data() + written, payload.size() - written);
    if(rv < 0) {
      if(errno == EINTR) continue;
      auto message = errno_text("cannot write", tmp);
      ::close(fd);
      throw LedgerError(message);
    }
    written += static_cast<std::size_t>(rv);
  }
  if(::fsync(fd) != 0) {
    auto message = errno_text("cannot sync", tmp);
    ::close(fd);
    throw LedgerError(message);
  }
  if(::close(fd) != 0) {
    throw LedgerError(errno_text("cannot close", tmp));
  }

  std::filesystem::rename(tmp, path_, ec);
  if(ec) {
    throw LedgerError("cannot replace " + path_.string() + ": " + ec.message());
  }

  // persist the rename itself
  auto dir = path_.has_parent_path() ? path_.parent_path() : std::filesystem::path(".");
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if(dir_fd >= 0) {
    if(::fsync(dir_fd) != 0) {
      logger_->debug("fsync of {} failed: {}", dir.string(), std::strerror(errno));
    }
    ::close(dir_fd);
  }
}

// ---- MemoryLedgerStore ------------------------------------------------------

MemoryLedgerStore::MemoryLedgerStore(nlohmann::json document)
  : document_(std::move(document)) {}

Ledger MemoryLedgerStore::load() {
  if(document_.is_null()) return Ledger{};
  try {
    return ledger_from_json(document_);
  } catch(const LedgerError&) {
    return Ledger{};
  } catch(const nlohmann::json::exception&) {
    return Ledger{};
  }
}

void MemoryLedgerStore::save(const Ledger& ledger) {
  if(failing_saves_ > 0) {
    --failing_saves_;
    throw LedgerError("simulated ledger write failure");
  }
  document_ = ledger_to_json(ledger);
  ++save_count_;
}

// ---- TransferLedger ---------------------------------------------------------

TransferLedger::TransferLedger(Ledger& ledger, LedgerStore& store, Clock clock)
  : ledger_(ledger),
    store_(store),
    clock_(clock ? std::move(clock) : Clock(&utc_timestamp_now)) {}

bool TransferLedger::transition_allowed(const TransferRecord* current, TransferStatus next) {
  if(!current) {
    return next == TransferStatus::InProgress || next == TransferStatus::Skipped;
  }
  switch(current->status) {
    case TransferStatus::Completed:
      return false;
    case TransferStatus::InProgress:
      // a record left in progress by a crash may be claimed again
      return true;
    case TransferStatus::Failed:
      return next == TransferStatus::InProgress || next == TransferStatus::Skipped;
    case TransferStatus::Skipped:
      if(current->skip_reason == SkipReason::AttemptCap) return false;
      return next == TransferStatus::InProgress || next == TransferStatus::Skipped;
  }
  return false;
}

void TransferLedger::release_stale_in_progress(const std::string& keep_path) {
  for(auto it = ledger_.records.begin(); it != ledger_.records.end();) {
    auto& rec = it->second;
    if(rec.status != TransferStatus::InProgress || it->first == keep_path) {
      ++it;
      continue;
    }
    if(rec.attempts == 0) {
      it = ledger_.records.erase(it);
      continue;
    }
    rec.status = TransferStatus::Failed;
    rec.last_error = "interrupted before completion";
    ++it;
  }
}

const TransferRecord& TransferLedger::record(const std::string& path,
                                             TransferStatus status,
                                             const RecordUpdate& update) {
  const TransferRecord* current = ledger_.find(path);
  if(!transition_allowed(current, status)) {
    throw LedgerError(fmt::format("illegal transition for {}: {} -> {}",
                                  path,
                                  current ? to_string(current->status) : "absent",
                                  to_string(status)));
  }
  if(status == TransferStatus::InProgress) {
    release_stale_in_progress(path);
  }

  const std::string now = clock_();
  TransferRecord& rec = ledger_.records[path];
  if(update.size) rec.size = *update.size;
  if(update.grouping_key) rec.grouping_key = *update.grouping_key;
  if(update.upload_token) rec.upload_token = *update.upload_token;
  if(update.content_sha256) rec.content_sha256 = *update.content_sha256;

  switch(status) {
    case TransferStatus::InProgress:
      rec.started_at = now;
      rec.skip_reason = SkipReason::None;
      break;
    case TransferStatus::Completed:
      rec.completed_at = now;
      rec.last_error.clear();
      rec.skip_reason = SkipReason::None;
      ledger_.stats.total_completed += 1;
      ledger_.stats.total_bytes += rec.size;
      break;
    case TransferStatus::Failed:
      rec.attempts += 1;
      rec.last_error = update.error.value_or("unknown error");
      if(rec.first_failed.empty()) rec.first_failed = now;
      rec.last_failed = now;
      ledger_.stats.total_failed += 1;
      break;
    case TransferStatus::Skipped:
      rec.skip_reason = update.skip_reason == SkipReason::None ? SkipReason::Capacity : update.skip_reason;
      if(update.error) rec.last_error = *update.error;
      break;
  }
  rec.status = status;

  commit();
  return rec;
}

const TransferRecord& TransferLedger::mark_in_progress(const std::string& path, uint64_t size) {
  RecordUpdate update;
  update.size = size;
  return record(path, TransferStatus::InProgress, update);
}

const TransferRecord& TransferLedger::mark_completed(const std::string& path,
                                                     const std::string& grouping_key,
                                                     const std::string& upload_token,
                                                     const std::string& content_sha256) {
  RecordUpdate update;
  update.grouping_key = grouping_key;
  update.upload_token = upload_token;
  update.content_sha256 = content_sha256;
  return record(path, TransferStatus::Completed, update);
}

const TransferRecord& TransferLedger::mark_failed(const std::string& path, const std::string& error) {
  RecordUpdate update;
  update.error = error;
  return record(path, TransferStatus::Failed, update);
}

const TransferRecord& TransferLedger::mark_skipped(const std::string& path,
                                                   uint64_t size,
                                                   SkipReason reason,
                                                   const std::string& detail) {
  RecordUpdate update;
  update.size = size;
  update.error = detail;
  update.skip_reason = reason;
  return record(path, TransferStatus::Skipped, update);
}

std::size_t TransferLedger::reset_skipped() {
  std::size_t removed = 0;
  for(auto it = ledger_.records.begin(); it != ledger_.records.end();) {
    if(it->second.status == TransferStatus::Skipped) {
      it = ledger_.records.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if(removed > 0) commit();
  return removed;
}

void TransferLedger::commit() {
  ledger_.last_updated = clock_();
  ledger_.schema_version = kLedgerSchemaVersion;
  store_.save(ledger_);
}
