#include "sync_engine.hpp"

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#endif

#include "lock_manager.hpp"
#include "permissions.hpp"
#include "preconditions.hpp"
#include "run_reporter.hpp"
#include "settings_manager.hpp"
#include "symlink_sync.hpp"
#include "transfer_executor.hpp"

#ifdef HAVE_READLINE
namespace {

const std::function<bool()>* g_prompt_stop = nullptr;

// Called by readline while it waits for keys.
int prompt_event_hook() {
  if(g_prompt_stop && (*g_prompt_stop)()) rl_done = 1;
  return 0;
}

} // namespace
#endif

std::optional<std::string> read_terminal_answer(const std::string& prompt,
                                                const std::function<bool()>& stop) {
  if(!::isatty(STDIN_FILENO)) return std::nullopt;
#ifdef HAVE_READLINE
  g_prompt_stop = stop ? &stop : nullptr;
  rl_event_hook = stop ? prompt_event_hook : nullptr;
  char* line = readline(prompt.c_str());
  rl_event_hook = nullptr;
  g_prompt_stop = nullptr;
  if(!line) return std::string();
  std::string result(line);
  free(line);
  return result;
#else
  std::cout << prompt << std::flush;
  // The terminal is line buffered, so stdin turns readable once Enter is pressed.
  while(stop) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int rc = ::poll(&pfd, 1, 100);
    if(rc > 0) break;
    if(rc < 0 && errno != EINTR) break;
    if(stop()) {
      std::cout << std::endl;
      return std::string();
    }
  }
  std::string line;
  if(!std::getline(std::cin, line)) return std::string();
  return line;
#endif
}

namespace {

bool is_affirmative(std::string answer) {
  answer = SettingsManager::trim_copy(answer);
  answer = SettingsManager::to_lower(answer);
  return answer == "y" || answer == "yes" || answer == "s" || answer == "si";
}

} // namespace

SyncEngine::SyncEngine(RunConfig config,
                       HostContext host,
                       std::shared_ptr<Logger> logger,
                       std::shared_ptr<Notifier> notifier)
  : SyncEngine(std::move(config), std::move(host), std::move(logger), std::move(notifier), Options{}) {}

SyncEngine::SyncEngine(RunConfig config,
                       HostContext host,
                       std::shared_ptr<Logger> logger,
                       std::shared_ptr<Notifier> notifier,
                       Options options)
  : config_(std::move(config)),
    host_(std::move(host)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("syncb")),
    notifier_(notifier ? std::move(notifier) : std::make_shared<LogNotifier>(logger_)),
    options_(std::move(options)),
    runner_(io_, logger_) {
  if(!options_.prompt) {
    options_.prompt = [this](const std::string& prompt) {
      return read_terminal_answer(prompt, [this]{
        poll_events();
        return interrupted_;
      });
    };
  }
  runner_.set_kill_grace(options_.kill_grace);
}

SyncEngine::~SyncEngine() {
  stop_signal_watch();
}

bool SyncEngine::force_release_lock(const std::filesystem::path& lock_path, Logger* logger) {
  return LockManager::force_release(lock_path, logger);
}

void SyncEngine::request_interrupt() {
  if(!interrupted_) {
    logger_->warn("Interrupt received, stopping after cleanup");
  }
  interrupted_ = true;
  runner_.cancel();
}

void SyncEngine::start_signal_watch() {
  if(!options_.watch_signals || signals_) return;
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM, SIGHUP);
  await_signal();
}

void SyncEngine::await_signal() {
  signals_->async_wait([this](const std::error_code& ec, int signo){
    if(ec) return;
    logger_->debug("Signal {} received", signo);
    request_interrupt();
    await_signal();
  });
}

void SyncEngine::stop_signal_watch() {
  if(!signals_) return;
  std::error_code ec;
  signals_->cancel(ec);
  signals_->clear(ec);
  io_.restart();
  io_.poll();
  signals_.reset();
}

void SyncEngine::poll_events() {
  io_.restart();
  io_.poll();
}

int SyncEngine::run_sync() {
  stats_ = RunStats{};
  interrupted_ = false;
  start_signal_watch();
  int exit_code = run_locked();
  stop_signal_watch();
  return exit_code;
}

int SyncEngine::run_locked() {
  LockManager locks(config_.lock_path, logger_);
  auto acquired = locks.acquire(config_.direction);
  if(acquired.error) return abort_run(acquired.error->message);
  // Released on every path out of this function.
  LockHandle lock = std::move(*acquired.handle);

  if(auto error = check_preconditions(config_, logger_.get())) {
    return abort_run(error->message);
  }

  auto plan = resolve_plan(config_, host_, logger_.get());
  if(plan.fatal) return abort_run(plan.fatal->message);

  print_banner(plan);

  auto answer = confirm();
  poll_events();
  if(interrupted_) return abort_run("Synchronization interrupted before any transfer");
  switch(answer) {
    case Confirmation::Proceed:
      break;
    case Confirmation::Declined:
      logger_->info("Synchronization cancelled by the user");
      stats_.finish();
      report_summary(stats_, config_, logger_.get());
      return 0;
    case Confirmation::Unavailable:
      logger_->error("No interactive terminal available; rerun with --yes");
      return abort_run("No interactive terminal available");
  }

  stats_.sync_errors += plan.rejected.size();

  TransferExecutor executor(config_, runner_, logger_);
  transfer_elements(plan, executor);

  bool manifest_failed = false;
  poll_events();
  if(!interrupted_) {
    manifest_failed = !run_link_phase(plan, executor);
  }
  poll_events();
  if(!interrupted_) {
    auto perms = apply_permissions(config_, logger_.get());
    if(perms.failed > 0) {
      logger_->warn("{} permission changes failed", perms.failed);
    }
  }

  return conclude(manifest_failed);
}

void SyncEngine::print_banner(const SyncPlan& plan) const {
  const std::string rule(50, '=');
  Logger* out = logger_.get();
  print_out(out, "{}", rule);
  if(config_.direction == Direction::Upload) {
    print_out(out, "MODE: UPLOAD (local -> cloud)");
  } else {
    print_out(out, "MODE: DOWNLOAD (cloud -> local)");
  }
  print_out(out, "SOURCE: {}", config_.source_root().string());
  print_out(out, "DESTINATION: {}", config_.destination_root().string());
  print_out(out, "BACKUP AREA: {}", to_string(config_.backup_area_mode));
  if(config_.dry_run) print_out(out, "STATE: DRY RUN (no changes will be made)");
  if(config_.delete_extraneous) print_out(out, "DELETE: enabled (extraneous files are removed)");
  print_out(out, "OVERWRITE: {}", config_.overwrite_always ? "always" : "only older files (--update)");
  if(config_.use_checksum_compare) print_out(out, "COMPARE: checksum");
  if(config_.bandwidth_limit_kbps) print_out(out, "BANDWIDTH: {} KB/s", *config_.bandwidth_limit_kbps);
  print_out(out, "TIMEOUT: {} min per element", config_.per_element_timeout.count() / 60);
  if(plan.from_command_line) {
    print_out(out, "ELEMENTS: {} given on the command line", plan.elements.size());
  } else if(host_.host_elements.count(host_.host)) {
    print_out(out, "ELEMENTS: {} configured for host {}", plan.elements.size(), host_.host);
  } else {
    print_out(out, "ELEMENTS: {} from the default list", plan.elements.size());
  }
  if(!config_.config_exclusion_patterns.empty()) {
    print_out(out, "EXCLUSIONS: {} patterns from the profile", config_.config_exclusion_patterns.size());
  }
  if(!config_.cli_exclusion_patterns.empty()) {
    print_out(out, "EXCLUSIONS (command line): {}", config_.cli_exclusion_patterns.size());
    for(std::size_t i = 0; i < config_.cli_exclusion_patterns.size(); ++i) {
      print_out(out, "  {}. {}", i + 1, config_.cli_exclusion_patterns[i]);
    }
  }
  print_out(out, "{}", rule);
}

SyncEngine::Confirmation SyncEngine::confirm() {
  if(config_.dry_run) return Confirmation::Proceed;
  if(config_.assume_yes) {
    logger_->info("Confirmation skipped (--yes)");
    return Confirmation::Proceed;
  }
  auto answer = options_.prompt("Proceed with synchronization? [y/N]: ");
  if(!answer) return Confirmation::Unavailable;
  return is_affirmative(*answer) ? Confirmation::Proceed : Confirmation::Declined;
}

void SyncEngine::transfer_elements(const SyncPlan& plan, TransferExecutor& executor) {
  for(std::size_t i = 0; i < plan.elements.size(); ++i) {
    poll_events();
    if(interrupted_) {
      logger_->warn("Skipping {} remaining elements", plan.elements.size() - i);
      return;
    }
    const auto& element = plan.elements[i];
    logger_->info("[{}/{}] {}", i + 1, plan.elements.size(), element);
    auto outcome = executor.sync_one(element);
    stats_.elements_processed++;
    stats_.files_transferred += outcome.files_changed;
    stats_.files_deleted += outcome.files_deleted;
    if(outcome.interrupted) interrupted_ = true;
    if(outcome.error && !outcome.skipped) stats_.sync_errors++;
  }
}

bool SyncEngine::run_link_phase(const SyncPlan& plan, TransferExecutor& executor) {
  SymlinkSynchronizer links(config_, executor, logger_);
  links.set_interrupt_check([this]{
    poll_events();
    return interrupted_;
  });
  std::optional<SyncError> error;
  if(config_.direction == Direction::Upload) {
    error = links.generate_manifest(plan.elements, stats_);
  } else {
    error = links.restore_from_manifest(stats_);
  }
  if(error && error->code == ErrorCode::Interrupted) {
    logger_->warn("{}", error->message);
    return true;
  }
  if(error) {
    logger_->error("{}", error->message);
    return false;
  }
  return true;
}

int SyncEngine::abort_run(const std::string& reason) {
  stats_.finish();
  report_summary(stats_, config_, logger_.get());
  notifier_->notify("syncb", reason, NotifySeverity::Error);
  return 1;
}

int SyncEngine::conclude(bool manifest_failed) {
  poll_events();
  stats_.finish();
  report_summary(stats_, config_, logger_.get());

  const bool failed = interrupted_ || manifest_failed ||
                      stats_.sync_errors > 0 || stats_.links_failed > 0;
  if(interrupted_) {
    notifier_->notify("syncb", "Synchronization interrupted", NotifySeverity::Warning);
  } else if(failed) {
    notifier_->notify("syncb",
                      fmt::format("Finished with {} errors and {} failed links",
                                  stats_.sync_errors, stats_.links_failed),
                      NotifySeverity::Error);
  } else {
    notifier_->notify("syncb",
                      fmt::format("{} completed: {} files transferred",
                                  to_string(config_.direction), stats_.files_transferred),
                      NotifySeverity::Success);
  }
  return failed ? 1 : 0;
}
