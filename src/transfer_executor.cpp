#include "transfer_executor.hpp"

#include <sstream>

void count_itemized_line(const std::string& line, ItemizeCounts& counts) {
  if(line.rfind("*deleting", 0) == 0) {
    counts.deleted++;
    return;
  }
  // YXcstpoguax: Y is the update type, X the file type.
  if(line.size() < 12 || line[11] != ' ') return;
  if((line[0] != '>' && line[0] != '<') || line[1] != 'f') return;
  if(line.compare(2, 9, "+++++++++") == 0) {
    counts.created++;
  } else {
    counts.updated++;
  }
}

ItemizeCounts parse_itemized(const std::string& output) {
  ItemizeCounts counts;
  std::istringstream in(output);
  std::string line;
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    count_itemized_line(line, counts);
  }
  return counts;
}

std::vector<std::string> base_transfer_options() {
  return {"--recursive", "--times", "--progress", "--itemize-changes", "--no-links"};
}

std::vector<std::string> build_transfer_options(const RunConfig& config) {
  auto opts = base_transfer_options();
  if(!config.overwrite_always) opts.push_back("--update");
  if(config.dry_run) opts.push_back("--dry-run");
  if(config.delete_extraneous) opts.push_back("--delete-delay");
  if(config.use_checksum_compare) opts.push_back("--checksum");
  if(config.bandwidth_limit_kbps) {
    opts.push_back("--bwlimit=" + std::to_string(*config.bandwidth_limit_kbps));
  }
  for(const auto& pattern : config.config_exclusion_patterns) {
    opts.push_back("--exclude=" + pattern);
  }
  for(const auto& pattern : config.cli_exclusion_patterns) {
    opts.push_back("--exclude=" + pattern);
  }
  return opts;
}

TransferExecutor::TransferExecutor(const RunConfig& config,
                                   ProcessRunner& runner,
                                   std::shared_ptr<Logger> logger)
  : config_(config), runner_(runner), logger_(std::move(logger)) {}

TransferOutcome TransferExecutor::sync_one(const std::string& element) {
  namespace fs = std::filesystem;
  TransferOutcome outcome;

  std::string relative = element;
  bool directory = false;
  while(relative.size() > 1 && relative.back() == '/') {
    relative.pop_back();
    directory = true;
  }

  auto source = config_.source_root() / relative;
  auto destination = config_.destination_root() / relative;

  std::error_code ec;
  auto status = fs::symlink_status(source, ec);
  if(ec || !fs::exists(status)) {
    log_warn(logger_.get(), "Source does not exist, skipping: {}", source.string());
    outcome.skipped = true;
    outcome.error = make_error(ErrorKind::TransferFailure, ErrorCode::MissingSource,
                               "missing source " + source.string());
    return outcome;
  }
  if(fs::is_symlink(status)) {
    log_info(logger_.get(), "{} is a symbolic link; it travels through the link manifest", element);
    return outcome;
  }
  if(fs::is_directory(status)) directory = true;

  auto parent = destination.parent_path();
  if(!fs::exists(parent, ec)) {
    if(config_.dry_run) {
      log_info(logger_.get(), "[dry-run] Would create directory {}", parent.string());
    } else {
      fs::create_directories(parent, ec);
      if(ec) {
        outcome.error = make_error(ErrorKind::TransferFailure, ErrorCode::TransferFailed,
                                   "cannot create " + parent.string() + ": " + ec.message());
        log_error(logger_.get(), "{}", outcome.error->message);
        return outcome;
      }
      log_debug(logger_.get(), "Created directory {}", parent.string());
    }
  }

  std::vector<std::string> command;
  command.push_back(config_.transfer_tool);
  for(auto& opt : build_transfer_options(config_)) command.push_back(std::move(opt));
  if(directory) {
    command.push_back(source.string() + "/");
    command.push_back(destination.string() + "/");
  } else {
    command.push_back(source.string());
    command.push_back(destination.string());
  }

  log_info(logger_.get(), "Synchronizing {} ({})", element, directory ? "directory" : "file");
  return execute(std::move(command), element);
}

TransferOutcome TransferExecutor::transfer_file(const std::filesystem::path& source,
                                                const std::filesystem::path& destination) {
  std::vector<std::string> command;
  command.push_back(config_.transfer_tool);
  for(auto& opt : base_transfer_options()) command.push_back(std::move(opt));
  command.push_back(source.string());
  command.push_back(destination.string());
  return execute(std::move(command), source.filename().string());
}

TransferOutcome TransferExecutor::execute(std::vector<std::string> command, const std::string& label) {
  TransferOutcome outcome;
  last_command_ = command;

  ItemizeCounts counts;
  auto on_line = [this, &counts](const std::string& line, bool from_stderr) {
    if(from_stderr) {
      log_warn(logger_.get(), "{}", line);
      return;
    }
    count_itemized_line(line, counts);
    log_debug(logger_.get(), "{}", line);
  };

  auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.per_element_timeout);
  auto result = runner_.run(command, timeout, on_line);

  outcome.files_changed = counts.created + counts.updated;
  outcome.files_deleted = counts.deleted;

  if(result.spawn_failed) {
    outcome.error = make_error(ErrorKind::TransferFailure, ErrorCode::TransferFailed,
                               "could not start " + config_.transfer_tool + ": " + result.error);
  } else if(result.interrupted) {
    outcome.interrupted = true;
    outcome.error = make_error(ErrorKind::TransferFailure, ErrorCode::Interrupted,
                               "transfer of " + label + " interrupted");
  } else if(result.timed_out) {
    outcome.error = make_error(ErrorKind::TransferFailure, ErrorCode::Timeout,
                               "transfer of " + label + " timed out after " +
                               std::to_string(config_.per_element_timeout.count()) + "s");
  } else if(result.exit_code != 0) {
    outcome.error = make_error(ErrorKind::TransferFailure, ErrorCode::TransferFailed,
                               "transfer of " + label + " failed with exit code " +
                               std::to_string(result.exit_code));
  }

  if(outcome.error) {
    log_error(logger_.get(), "{}", outcome.error->message);
  } else {
    log_success(logger_.get(), "{}: {} transferred, {} deleted",
                label, outcome.files_changed, outcome.files_deleted);
  }
  return outcome;
}
