#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

constexpr int kLedgerSchemaVersion = 2;

enum class TransferStatus { InProgress, Completed, Failed, Skipped };

// Why a record sits in SKIPPED. Capacity skips are re-evaluated on later
// passes, attempt-cap skips are final.
enum class SkipReason { None, Capacity, AttemptCap };

const char* to_string(TransferStatus status);
const char* to_string(SkipReason reason);
std::optional<TransferStatus> transfer_status_from_string(const std::string& text);
SkipReason skip_reason_from_string(const std::string& text);

struct TransferRecord {
  TransferStatus status = TransferStatus::InProgress;
  uint64_t size = 0;
  // failed attempts over the lifetime of the record, across runs
  int attempts = 0;
  std::string last_error;
  std::string first_failed;
  std::string last_failed;
  std::string started_at;
  std::string completed_at;
  // nullopt until the first dispatch; "" means uploaded without album
  std::optional<std::string> grouping_key;
  std::string upload_token;
  std::string content_sha256;
  SkipReason skip_reason = SkipReason::None;

  bool is_terminal() const;
};

struct LedgerStats {
  uint64_t total_bytes = 0;
  uint64_t total_completed = 0;
  uint64_t total_failed = 0;
};

struct Ledger {
  int schema_version = kLedgerSchemaVersion;
  std::string last_updated;
  std::map<std::string, TransferRecord> records;
  LedgerStats stats;

  const TransferRecord* find(const std::string& path) const;
  std::size_t count(TransferStatus status) const;
  std::optional<std::string> in_progress_path() const;
};

class LedgerError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

nlohmann::json ledger_to_json(const Ledger& ledger);
// Reads schema 2 documents and converts schema 1 ones (completed/failed/
// skipped buckets). Throws LedgerError when the document is not a ledger.
Ledger ledger_from_json(const nlohmann::json& doc, Logger* logger = nullptr);

class LedgerStore {
public:
  virtual ~LedgerStore() = default;
  // Never throws for missing or malformed state: returns an empty Ledger.
  virtual Ledger load() = 0;
  // Atomic replace of the durable state. Throws LedgerError on I/O failure.
  virtual void save(const Ledger& ledger) = 0;
};

class FileLedgerStore : public LedgerStore {
public:
  explicit FileLedgerStore(std::filesystem::path path,
                           std::shared_ptr<Logger> logger = nullptr);

  Ledger load() override;
  void save(const Ledger& ledger) override;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path temp_path() const;

private:
  void quarantine_corrupt_document() const;

  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
};

// Keeps the serialized document in memory, so loads and saves go through
// the same JSON mapping as the file store.
class MemoryLedgerStore : public LedgerStore {
public:
  MemoryLedgerStore() = default;
  explicit MemoryLedgerStore(nlohmann::json document);

  Ledger load() override;
  void save(const Ledger& ledger) override;

  const nlohmann::json& document() const { return document_; }
  void set_document(nlohmann::json document) { document_ = std::move(document); }
  std::size_t save_count() const { return save_count_; }
  // Makes the next N saves throw LedgerError.
  void fail_next_saves(std::size_t count) { failing_saves_ = count; }

private:
  nlohmann::json document_;
  std::size_t save_count_ = 0;
  std::size_t failing_saves_ = 0;
};

// Field values applied together with a status transition.
struct RecordUpdate {
  std::optional<uint64_t> size;
  std::optional<std::string> error;
  std::optional<std::string> grouping_key;
  std::optional<std::string> upload_token;
  std::optional<std::string> content_sha256;
  SkipReason skip_reason = SkipReason::None;
};

// Applies status transitions to a Ledger and persists after every one of
// them. The Ledger is owned by the caller and must outlive this object.
class TransferLedger {
public:
  using Clock = std::function<std::string()>;

  TransferLedger(Ledger& ledger, LedgerStore& store, Clock clock = Clock());

  const Ledger& ledger() const { return ledger_; }
  const TransferRecord* find(const std::string& path) const { return ledger_.find(path); }

  // Throws LedgerError for transitions the state machine does not allow and
  // for persistence failures.
  const TransferRecord& record(const std::string& path,
                               TransferStatus status,
                               const RecordUpdate& update = RecordUpdate());

  const TransferRecord& mark_in_progress(const std::string& path, uint64_t size);
  const TransferRecord& mark_completed(const std::string& path,
                                       const std::string& grouping_key,
                                       const std::string& upload_token,
                                       const std::string& content_sha256);
  const TransferRecord& mark_failed(const std::string& path, const std::string& error);
  const TransferRecord& mark_skipped(const std::string& path,
                                     uint64_t size,
                                     SkipReason reason,
                                     const std::string& detail);

  // Drops every SKIPPED record; returns how many were removed.
  std::size_t reset_skipped();

  static bool transition_allowed(const TransferRecord* current, TransferStatus next);

private:
  void release_stale_in_progress(const std::string& keep_path);
  void commit();

  Ledger& ledger_;
  LedgerStore& store_;
  Clock clock_;
};
