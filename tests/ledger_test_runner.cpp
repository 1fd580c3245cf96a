#include "ledger.hpp"
#include "orchestrator.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_config.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using ferry::test::TestCase;
using ferry::test::TestContext;

namespace {

// Hands out "t1", "t2", ... so timestamp fields can be compared exactly.
TransferLedger::Clock counting_clock() {
  auto counter = std::make_shared<int>(0);
  return [counter]{ return "t" + std::to_string(++*counter); };
}

template<typename Fn>
bool throws_ledger_error(Fn&& fn) {
  try {
    fn();
  } catch(const LedgerError&) {
    return true;
  }
  return false;
}

bool test_state_machine_rejects_illegal_transitions(TestContext&) {
  Ledger ledger;
  MemoryLedgerStore store;
  TransferLedger transfers(ledger, store, counting_clock());

  if(!throws_ledger_error([&]{ transfers.mark_failed("/new.mkv", "boom"); })) return false;
  if(!throws_ledger_error([&]{ transfers.mark_completed("/new.mkv", "", "tok", "sha"); })) return false;
  if(ledger.find("/new.mkv")) return false;

  transfers.mark_in_progress("/a.mkv", 10);
  transfers.mark_completed("/a.mkv", "", "tok", "sha");
  if(!throws_ledger_error([&]{ transfers.mark_in_progress("/a.mkv", 10); })) return false;
  if(!throws_ledger_error([&]{ transfers.mark_skipped("/a.mkv", 10, SkipReason::Capacity, "full"); })) return false;

  transfers.mark_in_progress("/b.mkv", 10);
  transfers.mark_failed("/b.mkv", "reset");
  transfers.mark_skipped("/b.mkv", 10, SkipReason::AttemptCap, "cap");
  if(!throws_ledger_error([&]{ transfers.mark_in_progress("/b.mkv", 10); })) return false;

  transfers.mark_skipped("/c.mkv", 10, SkipReason::Capacity, "full");
  transfers.mark_in_progress("/c.mkv", 10);
  return ledger.find("/c.mkv")->status == TransferStatus::InProgress &&
         ledger.find("/c.mkv")->skip_reason == SkipReason::None &&
         ledger.find("/a.mkv")->status == TransferStatus::Completed;
}

bool test_every_transition_is_saved(TestContext&) {
  Ledger ledger;
  MemoryLedgerStore store;
  TransferLedger transfers(ledger, store, counting_clock());

  transfers.mark_in_progress("/a.mkv", 5);
  if(store.save_count() != 1) return false;
  transfers.mark_failed("/a.mkv", "timeout");
  if(store.save_count() != 2) return false;
  transfers.mark_in_progress("/a.mkv", 5);
  transfers.mark_completed("/a.mkv", "A", "tok", "abc");
  if(store.save_count() != 4) return false;

  auto reloaded = store.load();
  const auto* rec = reloaded.find("/a.mkv");
  return rec && rec->status == TransferStatus::Completed && rec->upload_token == "tok" &&
         rec->grouping_key == std::optional<std::string>("A") && rec->content_sha256 == "abc" &&
         rec->attempts == 1 && reloaded.last_updated == ledger.last_updated;
}

bool test_failures_track_attempts_and_timestamps(TestContext&) {
  Ledger ledger;
  MemoryLedgerStore store;
  TransferLedger transfers(ledger, store, counting_clock());

  transfers.mark_in_progress("/a.mkv", 5);
  transfers.mark_failed("/a.mkv", "first");
  const auto first_failed = ledger.find("/a.mkv")->first_failed;
  transfers.mark_in_progress("/a.mkv", 5);
  transfers.mark_failed("/a.mkv", "second");

  const auto* rec = ledger.find("/a.mkv");
  return rec->attempts == 2 && rec->last_error == "second" &&
         rec->first_failed == first_failed && rec->last_failed != first_failed &&
         ledger.stats.total_failed == 2;
}

bool test_completion_updates_stats(TestContext&) {
  Ledger ledger;
  MemoryLedgerStore store;
  TransferLedger transfers(ledger, store, counting_clock());

  transfers.mark_in_progress("/a.mkv", 100);
  transfers.mark_completed("/a.mkv", "", "t1", "s1");
  transfers.mark_in_progress("/b.mkv", 50);
  transfers.mark_completed("/b.mkv", "B", "t2", "s2");
  return ledger.stats.total_completed == 2 && ledger.stats.total_bytes == 150 &&
         ledger.count(TransferStatus::Completed) == 2 && !ledger.in_progress_path();
}

bool test_single_in_progress_record(TestContext&) {
  Ledger ledger;
  MemoryLedgerStore store;
  TransferLedger transfers(ledger, store, counting_clock());

  // never failed: a stale claim simply disappears
  transfers.mark_in_progress("/a.mkv", 5);
  transfers.mark_in_progress("/b.mkv", 5);
  if(ledger.find("/a.mkv")) return false;

  // failed before: the record goes back to FAILED without a new attempt
  transfers.mark_failed("/b.mkv", "reset");
  transfers.mark_in_progress("/b.mkv", 5);
  transfers.mark_in_progress("/c.mkv", 5);
  const auto* b = ledger.find("/b.mkv");
  return b && b->status == TransferStatus::Failed && b->attempts == 1 &&
         ledger.in_progress_path() == std::optional<std::string>("/c.mkv");
}

bool test_save_failure_is_reported(TestContext&) {
  Ledger ledger;
  MemoryLedgerStore store;
  TransferLedger transfers(ledger, store, counting_clock());
  store.fail_next_saves(1);
  if(!throws_ledger_error([&]{ transfers.mark_in_progress("/a.mkv", 5); })) return false;
  transfers.mark_in_progress("/b.mkv", 5);
  return store.save_count() == 1;
}

bool test_reset_skipped(TestContext&) {
  Ledger ledger;
  MemoryLedgerStore store;
  TransferLedger transfers(ledger, store, counting_clock());
  transfers.mark_skipped("/a.mkv", 5, SkipReason::Capacity, "full");
  transfers.mark_in_progress("/b.mkv", 5);
  transfers.mark_failed("/b.mkv", "x");
  transfers.mark_skipped("/b.mkv", 5, SkipReason::AttemptCap, "cap");
  transfers.mark_in_progress("/c.mkv", 5);
  transfers.mark_completed("/c.mkv", "", "t", "s");

  if(transfers.reset_skipped() != 2) return false;
  auto reloaded = store.load();
  return reloaded.records.size() == 1 && reloaded.find("/c.mkv");
}

bool test_file_store_round_trip(TestContext& ctx) {
  auto dir = ferry::test::fresh_directory("ledger_round_trip");
  auto path = dir / "state" / "upload_state.json";
  FileLedgerStore store(path, ctx.logs.make_logger("ledger"));

  Ledger empty = store.load();
  if(!empty.records.empty()) return false;

  Ledger ledger;
  TransferLedger transfers(ledger, store, counting_clock());
  transfers.mark_in_progress("/Movies/A/film.mkv", 4096);
  transfers.mark_completed("/Movies/A/film.mkv", "Movies/A", "tok-1", "deadbeef");
  transfers.mark_skipped("/big.iso", 1ULL << 40, SkipReason::Capacity, "not enough free space");

  if(std::filesystem::exists(store.temp_path())) return false;
  Ledger loaded = FileLedgerStore(path).load();
  const auto* film = loaded.find("/Movies/A/film.mkv");
  const auto* big = loaded.find("/big.iso");
  auto doc = nlohmann::json::parse(ferry::test::read_file(path));
  return film && big && film->grouping_key == std::optional<std::string>("Movies/A") &&
         film->size == 4096 && film->upload_token == "tok-1" &&
         big->status == TransferStatus::Skipped && big->skip_reason == SkipReason::Capacity &&
         big->size == (1ULL << 40) && loaded.stats.total_bytes == 4096 &&
         doc.at("schema_version") == kLedgerSchemaVersion;
}

bool test_leftover_temp_file_is_ignored(TestContext& ctx) {
  auto dir = ferry::test::fresh_directory("ledger_leftover_tmp");
  auto path = dir / "upload_state.json";
  FileLedgerStore store(path, ctx.logs.make_logger("ledger"));

  Ledger ledger;
  TransferLedger transfers(ledger, store, counting_clock());
  transfers.mark_in_progress("/a.mkv", 5);
  transfers.mark_completed("/a.mkv", "", "tok", "sha");

  // a crash between write and rename leaves a partial temp document behind
  ferry::test::write_file(store.temp_path(), "{\"schema_version\": 2, \"records\": {\"/b.mk");
  Ledger loaded = store.load();
  return loaded.records.size() == 1 && loaded.find("/a.mkv") &&
         !std::filesystem::exists(store.temp_path()) &&
         ctx.logs.contains("Discarded unfinished ledger write");
}

bool test_corrupt_document_starts_empty(TestContext& ctx) {
  auto dir = ferry::test::fresh_directory("ledger_corrupt");
  auto path = dir / "upload_state.json";
  ferry::test::write_file(path, "{\"schema_version\": 2, \"records\": {\"/a.mkv\": {\"status\": \"comp");

  FileLedgerStore store(path, ctx.logs.make_logger("ledger"));
  Ledger loaded = store.load();
  auto quarantined = path;
  quarantined += ".corrupt";
  if(!loaded.records.empty() || !std::filesystem::exists(quarantined)) return false;

  // the next save produces a clean document again
  TransferLedger transfers(loaded, store, counting_clock());
  transfers.mark_in_progress("/a.mkv", 5);
  return FileLedgerStore(path).load().find("/a.mkv") != nullptr;
}

bool test_schema_one_import(TestContext& ctx) {
  nlohmann::json v1 = {
    {"completed", {"/A/done.mkv"}},
    {"failed", {{"/A/bad.mkv", {{"attempts", 2}, {"last_error", "timeout"}, {"first_failed", "2024-01-01T00:00:00Z"}}}}},
    {"skipped", {"/huge.iso"}},
    {"in_progress", {{"path", "/A/now.mkv"}, {"size", 123}}},
    {"stats", {{"total_uploaded", 1}, {"total_failed", 2}, {"total_bytes", 999}}},
    {"last_updated", "2024-01-02T00:00:00Z"}
  };
  auto logger = ctx.logs.make_logger("ledger");
  Ledger ledger = ledger_from_json(v1, logger.get());

  const auto* bad = ledger.find("/A/bad.mkv");
  const auto* now = ledger.find("/A/now.mkv");
  const auto* huge = ledger.find("/huge.iso");
  if(!bad || !now || !huge || !ledger.find("/A/done.mkv")) return false;
  if(bad->status != TransferStatus::Failed || bad->attempts != 2 || bad->last_error != "timeout") return false;
  if(now->status != TransferStatus::InProgress || now->size != 123) return false;
  if(huge->skip_reason != SkipReason::Capacity) return false;
  if(ledger.stats.total_completed != 1 || ledger.stats.total_bytes != 999) return false;

  // written back it becomes a schema 2 document
  auto doc = ledger_to_json(ledger);
  return doc.at("schema_version") == 2 && doc.at("records").size() == 4 &&
         ctx.logs.contains("Converted schema 1 ledger");
}

bool test_unknown_status_is_dropped(TestContext& ctx) {
  nlohmann::json doc = {
    {"schema_version", 2},
    {"records", {
      {"/a.mkv", {{"status", "completed"}, {"size", 5}}},
      {"/b.mkv", {{"status", "exploded"}}}
    }}
  };
  auto logger = ctx.logs.make_logger("ledger");
  Ledger ledger = ledger_from_json(doc, logger.get());
  return ledger.records.size() == 1 && ledger.find("/a.mkv") &&
         ctx.logs.contains("unknown status 'exploded'");
}

bool test_byte_size_settings(TestContext&) {
  if(SettingsManager::parse_byte_size("1G") != kGiB) return false;
  if(SettingsManager::parse_byte_size("512K") != 512ULL * 1024ULL) return false;
  if(SettingsManager::parse_byte_size("1.5G") != kGiB + kGiB / 2) return false;
  if(SettingsManager::parse_byte_size("2TB") != 2ULL * 1024ULL * kGiB) return false;
  if(SettingsManager::parse_byte_size("1536") != 1536ULL) return false;
  if(SettingsManager::parse_byte_size("abc") || SettingsManager::parse_byte_size("-1G")) return false;
  if(SettingsManager::parse_byte_size("")) return false;

  SettingsManager settings;
  std::string error;
  if(!settings.set_from_string("min", "2G", error)) return false;
  if(settings.set_from_string("max_size", "lots", error)) return false;
  return settings.get<uint64_t>("min_size") == 2 * kGiB &&
         settings.get<uint64_t>("max_size") == 100 * kGiB;
}

bool test_settings_file_overrides_defaults(TestContext&) {
  auto dir = ferry::test::fresh_directory("settings_file");
  ferry::test::write_config_before_start(dir, "settings.json", {
    {"source", "ftp://nas.local:2121"},
    {"min_size", "500M"},
    {"extensions", {"MKV", ".Iso"}},
    {"not_a_setting", 1}
  });
  SettingsManager settings;
  settings.set_settings_path(dir / ".config" / "settings.json");
  if(!settings.load()) return false;

  auto config = TransferConfig::from_settings(settings, dir);
  return config.source.url == "ftp://nas.local:2121" &&
         config.min_size == 500ULL * 1024ULL * 1024ULL &&
         config.extensions == std::vector<std::string>({".mkv", ".iso"}) &&
         config.work_dir == dir / ".work" &&
         config.ledger_path == dir / "upload_state.json" &&
         config.backoff_schedule.size() == 5 &&
         config.backoff_schedule.back() == std::chrono::seconds(600);
}

bool test_config_rejects_bad_backoff(TestContext&) {
  SettingsManager settings;
  std::string error;
  if(!settings.set_from_json("backoff_schedule", nlohmann::json::array({30, 30, 60}), error)) return false;
  try {
    TransferConfig::from_settings(settings, std::filesystem::temp_directory_path());
  } catch(const std::invalid_argument& e) {
    return std::string(e.what()).find("strictly increasing") != std::string::npos;
  }
  return false;
}

bool test_summary_lists_failing_files(TestContext& ctx) {
  Ledger ledger;
  MemoryLedgerStore store;
  TransferLedger transfers(ledger, store, counting_clock());
  transfers.mark_in_progress("/a.mkv", 5);
  transfers.mark_failed("/a.mkv", "425 data connection");
  transfers.mark_in_progress("/b.mkv", 7);

  auto logger = ctx.logs.make_logger("summary");
  print_ledger_summary(ledger, *logger);
  return ctx.logs.contains("in progress: /b.mkv") &&
         ctx.logs.contains("Failing files:") &&
         ctx.logs.contains("/a.mkv [failed, 1 attempts] 425 data connection");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"state_machine_rejects_illegal_transitions", test_state_machine_rejects_illegal_transitions},
    {"every_transition_is_saved", test_every_transition_is_saved},
    {"failures_track_attempts_and_timestamps", test_failures_track_attempts_and_timestamps},
    {"completion_updates_stats", test_completion_updates_stats},
    {"single_in_progress_record", test_single_in_progress_record},
    {"save_failure_is_reported", test_save_failure_is_reported},
    {"reset_skipped", test_reset_skipped},
    {"file_store_round_trip", test_file_store_round_trip},
    {"leftover_temp_file_is_ignored", test_leftover_temp_file_is_ignored},
    {"corrupt_document_starts_empty", test_corrupt_document_starts_empty},
    {"schema_one_import", test_schema_one_import},
    {"unknown_status_is_dropped", test_unknown_status_is_dropped},
    {"byte_size_settings", test_byte_size_settings},
    {"settings_file_overrides_defaults", test_settings_file_overrides_defaults},
    {"config_rejects_bad_backoff", test_config_rejects_bad_backoff},
    {"summary_lists_failing_files", test_summary_lists_failing_files}
  };
  return ferry::test::run_suite("ledger", tests, argc, argv);
}
