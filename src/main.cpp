#include <cpptrace/cpptrace.hpp>

#include <atomic>
#include <signal.h>
#include <filesystem>
#include <memory>
#include <system_error>

#include "command_line_parser.hpp"
#include "discovery.hpp"
#include "dispatch_engine.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "orchestrator.hpp"
#include "remote_source.hpp"
#include "retrieval_engine.hpp"
#include "settings_manager.hpp"
#include "space_guard.hpp"
#include "transfer_config.hpp"
#include "uploader.hpp"

namespace {

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int) {
  g_stop_requested = true;
}

void install_signal_handlers() {
  struct sigaction action{};
  action.sa_handler = handle_stop_signal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

} // namespace

int main(int argc, char** argv){
  try {
    const auto workspace_root = std::filesystem::current_path();
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "mediaferry");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("mediaferry");
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    const auto config = TransferConfig::from_settings(*settings, workspace_root);
    FileLedgerStore store(config.ledger_path, std::make_shared<Logger>("ledger"));

    if(settings->get<bool>("summary")) {
      print_ledger_summary(store.load(), *logger);
      return 0;
    }
    if(settings->get<bool>("reset_skipped")) {
      Ledger ledger = store.load();
      TransferLedger transfers(ledger, store);
      logger->info("Cleared {} skipped records", transfers.reset_skipped());
      if(config.source.url.empty()) return 0;
    }

    if(config.source.url.empty()) {
      logger->error("No source configured, see --help");
      return 1;
    }
    if(config.upload_command.empty()) {
      logger->error("No upload_command configured, see --help");
      return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.work_dir, ec);
    if(ec) {
      logger->error("Cannot create work directory {}: {}", config.work_dir.string(), ec.message());
      return 1;
    }

    install_signal_handlers();

    auto source = make_remote_source(config.source, std::make_shared<Logger>("source"));
    logger->info("Transferring from {}{} (work dir {})", source->describe(), config.remote_root, config.work_dir.string());

    DiscoveryFilter filter;
    filter.min_size = config.min_size;
    filter.max_size = config.max_size;
    filter.extensions = config.extensions;
    filter.smallest_first = config.smallest_first;
    DiscoveryWalker discovery(*source, config.remote_root, filter, std::make_shared<Logger>("discovery"));

    SpaceGuard space_guard(config.work_dir, config.safety_margin, SpaceGuard::FreeSpaceProbe(),
                           std::make_shared<Logger>("space"));
    RetrievalEngine retrieval(*source, RetrievalPolicy::from_config(config), &g_stop_requested,
                              RetrievalEngine::Sleeper(), std::make_shared<Logger>("retrieval"));
    CommandUploader uploader(config.upload_command, config.album_command, config.upload_timeout,
                             std::make_shared<Logger>("upload"));
    DispatchEngine dispatch(uploader, space_guard, std::make_shared<Logger>("dispatch"));

    Orchestrator orchestrator(config, store, discovery, space_guard, retrieval, dispatch,
                              &g_stop_requested, logger);
    auto report = orchestrator.run_pass();
    log_pass_report(report, *logger);
    flush_logs();
    return report.stop_reason == StopReason::Signal ? 130 : 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("mediaferry-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    flush_logs();
    return 1;
  }
}
