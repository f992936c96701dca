#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "process_runner.hpp"
#include "run_config.hpp"
#include "sync_error.hpp"

struct ItemizeCounts {
  std::size_t created = 0;
  std::size_t updated = 0;
  std::size_t deleted = 0;
};

// Counts one line of --itemize-changes output. Unknown lines are ignored.
void count_itemized_line(const std::string& line, ItemizeCounts& counts);
ItemizeCounts parse_itemized(const std::string& output);

struct TransferOutcome {
  std::size_t files_changed = 0;
  std::size_t files_deleted = 0;
  std::optional<SyncError> error;
  // Source absent: warned about, not counted as an error.
  bool skipped = false;
  bool interrupted = false;
};

// Options every invocation carries, before any policy flag.
std::vector<std::string> base_transfer_options();

// Full option list in fixed order: base, update, dry-run, delete, checksum,
// bandwidth, then config exclusions followed by command-line exclusions.
std::vector<std::string> build_transfer_options(const RunConfig& config);

class TransferExecutor {
public:
  TransferExecutor(const RunConfig& config, ProcessRunner& runner, std::shared_ptr<Logger> logger);

  TransferOutcome sync_one(const std::string& element);

  // Copies a single file with the base options only. Used for the link manifest.
  TransferOutcome transfer_file(const std::filesystem::path& source,
                                const std::filesystem::path& destination);

  const std::vector<std::string>& last_command() const { return last_command_; }

private:
  TransferOutcome execute(std::vector<std::string> command, const std::string& label);

  const RunConfig& config_;
  ProcessRunner& runner_;
  std::shared_ptr<Logger> logger_;
  std::vector<std::string> last_command_;
};
