#pragma once

#include <asio.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "notifier.hpp"
#include "plan_resolver.hpp"
#include "process_runner.hpp"
#include "run_config.hpp"
#include "run_stats.hpp"

class TransferExecutor;

class SyncEngine {
public:
  // Returns the operator's answer, or nullopt when no terminal is available.
  using PromptReader = std::function<std::optional<std::string>(const std::string& prompt)>;

  struct Options {
    bool watch_signals = true;
    PromptReader prompt;
    std::chrono::milliseconds kill_grace{std::chrono::seconds(5)};
  };

  SyncEngine(RunConfig config,
             HostContext host,
             std::shared_ptr<Logger> logger = nullptr,
             std::shared_ptr<Notifier> notifier = nullptr);
  SyncEngine(RunConfig config,
             HostContext host,
             std::shared_ptr<Logger> logger,
             std::shared_ptr<Notifier> notifier,
             Options options);
  ~SyncEngine();

  // One complete run. 0 on full success or a declined confirmation, 1 otherwise.
  int run_sync();

  // Same effect as SIGINT: the active transfer is stopped, later phases skipped.
  void request_interrupt();

  const RunStats& stats() const { return stats_; }
  const RunConfig& config() const { return config_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  asio::io_context& io() { return io_; }

  static bool force_release_lock(const std::filesystem::path& lock_path, Logger* logger);

private:
  enum class Confirmation { Proceed, Declined, Unavailable };

  int run_locked();
  void print_banner(const SyncPlan& plan) const;
  Confirmation confirm();
  void transfer_elements(const SyncPlan& plan, TransferExecutor& executor);
  bool run_link_phase(const SyncPlan& plan, TransferExecutor& executor);
  void start_signal_watch();
  void await_signal();
  void stop_signal_watch();
  void poll_events();
  int abort_run(const std::string& reason);
  int conclude(bool manifest_failed);

  RunConfig config_;
  HostContext host_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Notifier> notifier_;
  Options options_;
  asio::io_context io_;
  std::unique_ptr<asio::signal_set> signals_;
  ProcessRunner runner_;
  RunStats stats_;
  bool interrupted_ = false;
};

// Reads one answer from the controlling terminal. `stop` is polled while
// waiting; once it returns true the read ends with an empty answer.
std::optional<std::string> read_terminal_answer(const std::string& prompt,
                                                const std::function<bool()>& stop = {});
