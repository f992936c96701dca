#include "preconditions.hpp"

#include <fcntl.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "process_runner.hpp"

namespace fs = std::filesystem;

namespace {

SyncError fatal(ErrorCode code, std::string message) {
  return make_error(ErrorKind::FatalPrecondition, code, std::move(message));
}

} // namespace

std::optional<SyncError> check_transfer_tool(const RunConfig& config, Logger* logger) {
  auto tool = ProcessRunner::find_executable(config.transfer_tool);
  if(!tool) {
    return fatal(ErrorCode::ToolMissing, config.transfer_tool + " is not installed or not executable");
  }
  log_debug(logger, "Transfer tool: {}", tool->string());
  return std::nullopt;
}

std::optional<SyncError> check_mount_point(const RunConfig& config, Logger* logger) {
  if(config.mount_point.empty()) return std::nullopt;
  std::error_code ec;
  if(!fs::is_directory(config.mount_point, ec)) {
    return fatal(ErrorCode::DestinationUnreachable,
                 "cloud mount point " + config.mount_point.string() + " does not exist");
  }
  fs::directory_iterator it(config.mount_point, ec);
  if(ec) {
    return fatal(ErrorCode::DestinationUnreachable,
                 "cannot read " + config.mount_point.string() + ": " + ec.message());
  }
  if(it == fs::directory_iterator()) {
    return fatal(ErrorCode::DestinationUnreachable,
                 "cloud mount point " + config.mount_point.string() + " is empty; is the drive mounted?");
  }
  log_debug(logger, "Mount point {} is available", config.mount_point.string());
  return std::nullopt;
}

std::optional<SyncError> check_remote_root(const RunConfig& config, Logger* logger) {
  std::error_code ec;
  if(!fs::is_directory(config.remote_root, ec)) {
    return fatal(ErrorCode::DestinationUnreachable,
                 "remote directory " + config.remote_root.string() + " is not accessible");
  }
  if(config.direction != Direction::Upload || config.dry_run ||
     config.backup_area_mode != BackupAreaMode::Shared) {
    return std::nullopt;
  }

  auto probe = config.remote_root / (".syncb_write_test_" + std::to_string(::getpid()));
  int fd = ::open(probe.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if(fd < 0) {
    return fatal(ErrorCode::DestinationUnreachable,
                 "cannot write to " + config.remote_root.string() + ": " + std::strerror(errno));
  }
  ::close(fd);
  fs::remove(probe, ec);
  if(ec) log_warn(logger, "Unable to remove probe file {}: {}", probe.string(), ec.message());
  return std::nullopt;
}

std::optional<SyncError> check_local_root(const RunConfig& config, Logger* logger) {
  std::error_code ec;
  if(fs::is_directory(config.local_root, ec)) return std::nullopt;
  if(config.direction == Direction::Upload) {
    return fatal(ErrorCode::DestinationUnreachable,
                 "local directory " + config.local_root.string() + " does not exist");
  }
  if(config.dry_run) {
    log_info(logger, "[dry-run] Would create local directory {}", config.local_root.string());
    return std::nullopt;
  }
  fs::create_directories(config.local_root, ec);
  if(ec) {
    return fatal(ErrorCode::DestinationUnreachable,
                 "cannot create " + config.local_root.string() + ": " + ec.message());
  }
  log_info(logger, "Created local directory {}", config.local_root.string());
  return std::nullopt;
}

std::optional<std::uint64_t> available_megabytes(const fs::path& path) {
  struct statvfs info{};
  if(::statvfs(path.c_str(), &info) != 0) return std::nullopt;
  auto bytes = static_cast<std::uint64_t>(info.f_bavail) * static_cast<std::uint64_t>(info.f_frsize);
  return bytes / (1024 * 1024);
}

std::optional<SyncError> check_free_space(const RunConfig& config, Logger* logger) {
  if(config.dry_run || config.required_free_mb == 0) return std::nullopt;
  const auto& destination = config.destination_root();
  auto available = available_megabytes(destination);
  if(!available) {
    log_warn(logger, "Unable to query free space on {}", destination.string());
    return std::nullopt;
  }
  if(*available < config.required_free_mb) {
    return fatal(ErrorCode::InsufficientSpace,
                 "only " + std::to_string(*available) + " MB free on " + destination.string() +
                 ", " + std::to_string(config.required_free_mb) + " MB required");
  }
  log_info(logger, "Free space on {}: {} MB", destination.string(), *available);
  return std::nullopt;
}

std::optional<SyncError> check_preconditions(const RunConfig& config, Logger* logger) {
  using Check = std::optional<SyncError> (*)(const RunConfig&, Logger*);
  const Check checks[] = {
    check_transfer_tool,
    check_mount_point,
    check_remote_root,
    check_local_root,
    check_free_space
  };
  for(auto check : checks) {
    if(auto error = check(config, logger)) {
      log_error(logger, "{}", error->message);
      return error;
    }
  }
  return std::nullopt;
}
