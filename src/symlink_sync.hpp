#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "run_config.hpp"
#include "run_stats.hpp"
#include "symlink_manifest.hpp"
#include "sync_error.hpp"
#include "transfer_executor.hpp"

// Carries symbolic links between the trees through a manifest file, since the
// transfer itself runs with --no-links.
class SymlinkSynchronizer {
public:
  enum class LinkAction { Created, Existing, Failed };

  // Polled between links; returning true stops the scan or the restore.
  using InterruptCheck = std::function<bool()>;

  SymlinkSynchronizer(const RunConfig& config,
                      TransferExecutor& executor,
                      std::shared_ptr<Logger> logger);

  // Links found under the elements, relative to the local root, targets
  // already normalized. Each link appears once.
  std::vector<SymlinkRecord> scan(const std::vector<std::string>& elements) const;

  // Upload side. Only a failed manifest transfer is returned as an error.
  std::optional<SyncError> generate_manifest(const std::vector<std::string>& elements, RunStats& stats);

  // Download side. Same failure contract as generate_manifest.
  std::optional<SyncError> restore_from_manifest(RunStats& stats);

  LinkAction restore_record(const SymlinkRecord& record, RunStats& stats);

  void set_interrupt_check(InterruptCheck check) { interrupt_check_ = std::move(check); }

  std::filesystem::path remote_manifest_path() const;
  std::filesystem::path local_manifest_path() const;

private:
  void collect(const std::filesystem::path& path,
               std::vector<SymlinkRecord>& records,
               std::vector<std::string>& seen) const;
  bool target_allowed(const std::filesystem::path& effective) const;
  bool parent_inside_root(const std::filesystem::path& parent) const;
  bool stop_requested() const { return interrupt_check_ && interrupt_check_(); }

  const RunConfig& config_;
  TransferExecutor& executor_;
  std::shared_ptr<Logger> logger_;
  InterruptCheck interrupt_check_;
};
