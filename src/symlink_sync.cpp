#include "symlink_sync.hpp"

#include <algorithm>

#include "utils.hpp"

namespace fs = std::filesystem;

SymlinkSynchronizer::SymlinkSynchronizer(const RunConfig& config,
                                         TransferExecutor& executor,
                                         std::shared_ptr<Logger> logger)
  : config_(config), executor_(executor), logger_(std::move(logger)) {}

fs::path SymlinkSynchronizer::remote_manifest_path() const {
  return config_.remote_root / config_.manifest_name;
}

fs::path SymlinkSynchronizer::local_manifest_path() const {
  return config_.local_root / config_.manifest_name;
}

void SymlinkSynchronizer::collect(const fs::path& path,
                                  std::vector<SymlinkRecord>& records,
                                  std::vector<std::string>& seen) const {
  std::error_code ec;
  auto relative = path.lexically_normal().lexically_relative(config_.local_root.lexically_normal()).generic_string();
  if(std::find(seen.begin(), seen.end(), relative) != seen.end()) return;
  auto raw = fs::read_symlink(path, ec);
  if(ec) {
    log_warn(logger_.get(), "Unable to read link {}: {}", path.string(), ec.message());
    return;
  }
  seen.push_back(relative);
  SymlinkRecord record;
  record.link_path = relative;
  record.target = normalize_link_target(raw.string(), config_.local_root);
  log_debug(logger_.get(), "Link {} -> {}", record.link_path, record.target);
  records.push_back(std::move(record));
}

std::vector<SymlinkRecord> SymlinkSynchronizer::scan(const std::vector<std::string>& elements) const {
  std::vector<SymlinkRecord> records;
  std::vector<std::string> seen;
  for(const auto& element : elements) {
    if(stop_requested()) return records;
    std::string relative = element;
    while(relative.size() > 1 && relative.back() == '/') relative.pop_back();
    auto path = config_.local_root / relative;

    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if(ec || !fs::exists(status)) continue;
    if(fs::is_symlink(status)) {
      collect(path, records, seen);
      continue;
    }
    if(!fs::is_directory(status)) continue;

    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if(ec) {
      log_warn(logger_.get(), "Unable to scan {}: {}", path.string(), ec.message());
      continue;
    }
    for(fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
      if(ec) {
        log_warn(logger_.get(), "Scan error under {}: {}", path.string(), ec.message());
        break;
      }
      if(it->is_symlink(ec)) {
        if(stop_requested()) return records;
        collect(it->path(), records, seen);
      }
    }
  }
  return records;
}

std::optional<SyncError> SymlinkSynchronizer::generate_manifest(const std::vector<std::string>& elements,
                                                                RunStats& stats) {
  auto records = scan(elements);
  // A partial scan must never replace the remote manifest.
  if(stop_requested()) {
    return make_error(ErrorKind::TransferFailure, ErrorCode::Interrupted, "link scan interrupted");
  }
  stats.links_detected += records.size();
  if(records.empty()) {
    log_info(logger_.get(), "No symbolic links found");
    return std::nullopt;
  }

  const auto content = serialize_manifest(records);
  const auto destination = remote_manifest_path();
  log_info(logger_.get(), "Detected {} symbolic links", records.size());

  if(config_.dry_run) {
    log_info(logger_.get(), "[dry-run] Would write link manifest to {}", destination.string());
    return std::nullopt;
  }

  if(auto existing = sha256_file_hex(destination)) {
    if(*existing == sha256_hex(content)) {
      log_info(logger_.get(), "Link manifest at {} is already up to date", destination.string());
      return std::nullopt;
    }
  }

  TempFile staging("syncb_manifest_");
  if(!staging.valid() || !staging.write(content)) {
    auto error = make_error(ErrorKind::TransferFailure, ErrorCode::ManifestTransfer,
                            "unable to stage link manifest");
    log_error(logger_.get(), "{}", error.message);
    return error;
  }

  auto outcome = executor_.transfer_file(staging.path(), destination);
  if(outcome.error) {
    return make_error(ErrorKind::TransferFailure, ErrorCode::ManifestTransfer,
                      "link manifest transfer failed: " + outcome.error->message);
  }
  log_success(logger_.get(), "Link manifest sent to {}", destination.string());
  return std::nullopt;
}

std::optional<SyncError> SymlinkSynchronizer::restore_from_manifest(RunStats& stats) {
  const auto remote = remote_manifest_path();
  std::error_code ec;
  if(!fs::is_regular_file(remote, ec)) {
    log_info(logger_.get(), "No link manifest at {}", remote.string());
    return std::nullopt;
  }

  std::string content;
  if(config_.dry_run) {
    if(!read_text_file(remote, content)) {
      return make_error(ErrorKind::TransferFailure, ErrorCode::ManifestTransfer,
                        "unable to read " + remote.string());
    }
  } else {
    const auto local = local_manifest_path();
    auto outcome = executor_.transfer_file(remote, local);
    if(outcome.error) {
      return make_error(ErrorKind::TransferFailure, ErrorCode::ManifestTransfer,
                        "link manifest transfer failed: " + outcome.error->message);
    }
    bool read_ok = read_text_file(local, content);
    fs::remove(local, ec);
    if(ec) log_warn(logger_.get(), "Unable to remove {}: {}", local.string(), ec.message());
    if(!read_ok) {
      return make_error(ErrorKind::TransferFailure, ErrorCode::ManifestTransfer,
                        "unable to read " + local.string());
    }
  }

  const auto lines = parse_manifest(content);
  for(std::size_t i = 0; i < lines.size(); ++i) {
    if(stop_requested()) {
      log_warn(logger_.get(), "Link restore stopped, {} manifest lines left", lines.size() - i);
      return make_error(ErrorKind::TransferFailure, ErrorCode::Interrupted, "link restore interrupted");
    }
    const auto& line = lines[i];
    if(!line.record) {
      log_warn(logger_.get(), "Manifest line {} skipped: {}", line.line_number, line.error);
      stats.links_failed++;
      continue;
    }
    stats.links_detected++;
    restore_record(*line.record, stats);
  }

  log_info(logger_.get(), "Links: {} created, {} existing, {} failed",
           stats.links_created, stats.links_existing, stats.links_failed);
  return std::nullopt;
}

bool SymlinkSynchronizer::target_allowed(const fs::path& effective) const {
  if(path_within(effective, config_.local_root)) return true;
  for(const auto& root : config_.allowed_link_roots) {
    if(path_within(effective, root)) return true;
  }
  return false;
}

bool SymlinkSynchronizer::parent_inside_root(const fs::path& parent) const {
  std::error_code ec;
  auto real_parent = fs::weakly_canonical(parent, ec);
  if(ec) return false;
  auto real_root = fs::weakly_canonical(config_.local_root, ec);
  if(ec) return false;
  return path_within(real_parent, real_root);
}

SymlinkSynchronizer::LinkAction SymlinkSynchronizer::restore_record(const SymlinkRecord& record,
                                                                    RunStats& stats) {
  auto fail = [&](const std::string& message) {
    log_error(logger_.get(), "Link {}: {}", record.link_path, message);
    stats.links_failed++;
    return LinkAction::Failed;
  };

  if(!is_safe_link_path(record.link_path)) {
    return fail("link path escapes the local root");
  }

  const auto link = config_.local_root / record.link_path;
  const auto resolved = resolve_link_target(record.target, config_.local_root, current_user_name());
  fs::path effective(resolved);
  if(effective.is_relative()) effective = link.parent_path() / effective;
  effective = effective.lexically_normal();
  if(!target_allowed(effective)) {
    return fail("target " + resolved + " is outside the permitted roots");
  }

  std::error_code ec;
  const auto parent = link.parent_path();
  if(!fs::exists(parent, ec)) {
    if(config_.dry_run) {
      log_info(logger_.get(), "[dry-run] Would create directory {}", parent.string());
    } else {
      fs::create_directories(parent, ec);
      if(ec) return fail("cannot create " + parent.string() + ": " + ec.message());
    }
  }
  if(fs::exists(parent, ec) && !parent_inside_root(parent)) {
    return fail("parent directory resolves outside the local root");
  }

  auto status = fs::symlink_status(link, ec);
  if(!ec && fs::is_symlink(status)) {
    auto current = fs::read_symlink(link, ec);
    if(!ec && current.string() == resolved) {
      log_debug(logger_.get(), "Link {} already points to {}", record.link_path, resolved);
      stats.links_existing++;
      return LinkAction::Existing;
    }
    if(config_.dry_run) {
      log_info(logger_.get(), "[dry-run] Would replace link {} ({} -> {})",
               record.link_path, current.string(), resolved);
    } else {
      fs::remove(link, ec);
      if(ec) return fail("cannot remove old link: " + ec.message());
    }
  } else if(!ec && fs::exists(status)) {
    return fail("a non-link entry already exists at that path");
  }

  if(config_.dry_run) {
    log_info(logger_.get(), "[dry-run] Would create link {} -> {}", record.link_path, resolved);
    stats.links_created++;
    return LinkAction::Created;
  }

  fs::create_symlink(resolved, link, ec);
  if(ec) return fail("cannot create link: " + ec.message());
  log_debug(logger_.get(), "Created link {} -> {}", record.link_path, resolved);
  stats.links_created++;
  return LinkAction::Created;
}
