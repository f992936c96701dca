#include "lock_manager.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "utils.hpp"

namespace {

std::string iso_timestamp() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

bool write_all(int fd, const std::string& data) {
  const char* cursor = data.data();
  std::size_t remaining = data.size();
  while(remaining > 0) {
    ssize_t written = ::write(fd, cursor, remaining);
    if(written < 0) {
      if(errno == EINTR) continue;
      return false;
    }
    cursor += written;
    remaining -= static_cast<std::size_t>(written);
  }
  return true;
}

std::filesystem::path guard_path_for(const std::filesystem::path& lock_path) {
  auto guard = lock_path;
  guard += ".guard";
  return guard;
}

// Exclusive flock on a sidecar file. Every inspection or replacement of the
// lock file happens while this is held. The sidecar itself is never removed.
class GuardFile {
public:
  explicit GuardFile(const std::filesystem::path& lock_path) {
    std::error_code ec;
    if(lock_path.has_parent_path()) {
      std::filesystem::create_directories(lock_path.parent_path(), ec);
    }
    const auto path = guard_path_for(lock_path);
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if(fd_ < 0) {
      error_ = "cannot open " + path.string() + ": " + std::strerror(errno);
      return;
    }
    while(::flock(fd_, LOCK_EX) != 0) {
      if(errno == EINTR) continue;
      error_ = "cannot lock " + path.string() + ": " + std::strerror(errno);
      ::close(fd_);
      fd_ = -1;
      return;
    }
  }

  ~GuardFile() {
    if(fd_ >= 0) {
      ::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }

  GuardFile(const GuardFile&) = delete;
  GuardFile& operator=(const GuardFile&) = delete;

  bool held() const { return fd_ >= 0; }
  const std::string& error() const { return error_; }

private:
  int fd_ = -1;
  std::string error_;
};

} // namespace

std::string LockRecord::serialize() const {
  std::ostringstream oss;
  oss << pid << "\n";
  oss << "timestamp: " << timestamp << "\n";
  oss << "direction: " << to_string(direction) << "\n";
  oss << "user: " << user << "\n";
  oss << "host: " << host << "\n";
  return oss.str();
}

LockHandle::LockHandle(std::filesystem::path path, pid_t pid, std::shared_ptr<Logger> logger)
  : path_(std::move(path)), pid_(pid), owned_(true), logger_(std::move(logger)) {}

LockHandle::~LockHandle() {
  release();
}

LockHandle::LockHandle(LockHandle&& other) noexcept
  : path_(std::move(other.path_)),
    pid_(other.pid_),
    owned_(other.owned_),
    logger_(std::move(other.logger_)) {
  other.owned_ = false;
}

LockHandle& LockHandle::operator=(LockHandle&& other) noexcept {
  if(this != &other) {
    release();
    path_ = std::move(other.path_);
    pid_ = other.pid_;
    owned_ = other.owned_;
    logger_ = std::move(other.logger_);
    other.owned_ = false;
  }
  return *this;
}

bool LockHandle::release() {
  if(!owned_) return true;
  owned_ = false;
  return LockManager::release_if_owner(path_, pid_, logger_.get());
}

LockManager::LockManager(std::filesystem::path lock_path, std::shared_ptr<Logger> logger)
  : lock_path_(std::move(lock_path)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("lock")) {}

LockRecord LockManager::make_record(Direction direction) const {
  LockRecord record;
  record.pid = ::getpid();
  record.timestamp = iso_timestamp();
  record.direction = direction;
  record.user = current_user_name();
  record.host = local_hostname();
  return record;
}

LockManager::CreateStatus LockManager::try_create(const LockRecord& record, std::string& error) {
  std::error_code ec;
  if(lock_path_.has_parent_path()) {
    std::filesystem::create_directories(lock_path_.parent_path(), ec);
  }

  // The record is written to a private file first and hard-linked into
  // place, so a reader never observes a half-written lock.
  auto staging = lock_path_;
  staging += "." + std::to_string(record.pid) + ".tmp";
  int fd = ::open(staging.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if(fd < 0) {
    error = "cannot create " + staging.string() + ": " + std::strerror(errno);
    return CreateStatus::Failed;
  }
  const auto payload = record.serialize();
  bool written = write_all(fd, payload);
  ::close(fd);
  if(!written) {
    error = "cannot write " + staging.string() + ": " + std::strerror(errno);
    std::filesystem::remove(staging, ec);
    return CreateStatus::Failed;
  }

  int rc = ::link(staging.c_str(), lock_path_.c_str());
  int link_errno = errno;
  std::filesystem::remove(staging, ec);
  if(rc == 0) return CreateStatus::Created;
  if(link_errno == EEXIST) return CreateStatus::Exists;

  if(link_errno != EPERM && link_errno != EOPNOTSUPP && link_errno != ENOSYS) {
    error = "cannot create " + lock_path_.string() + ": " + std::strerror(link_errno);
    return CreateStatus::Failed;
  }

  // No hard links on this filesystem.
  fd = ::open(lock_path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if(fd < 0) {
    if(errno == EEXIST) return CreateStatus::Exists;
    error = "cannot create " + lock_path_.string() + ": " + std::strerror(errno);
    return CreateStatus::Failed;
  }
  written = write_all(fd, payload);
  ::close(fd);
  if(!written) {
    error = "cannot write " + lock_path_.string();
    std::filesystem::remove(lock_path_, ec);
    return CreateStatus::Failed;
  }
  return CreateStatus::Created;
}

LockManager::AcquireResult LockManager::acquire(Direction direction) {
  AcquireResult result;
  const auto record = make_record(direction);

  GuardFile guard(lock_path_);
  if(!guard.held()) {
    logger_->error("Unable to create lock: {}", guard.error());
    result.error = make_error(ErrorKind::FatalPrecondition, ErrorCode::LockIo, guard.error());
    return result;
  }

  for(int attempt = 0; attempt < 2; ++attempt) {
    std::string error;
    auto status = try_create(record, error);
    if(status == CreateStatus::Created) {
      logger_->info("Lock acquired: {} (pid {})", lock_path_.string(), record.pid);
      result.handle = LockHandle(lock_path_, record.pid, logger_);
      return result;
    }
    if(status == CreateStatus::Failed) {
      logger_->error("Unable to create lock: {}", error);
      result.error = make_error(ErrorKind::FatalPrecondition, ErrorCode::LockIo, error);
      return result;
    }

    auto owner = read_owner_pid(lock_path_);
    if(owner && process_alive(*owner)) {
      result.holder_pid = *owner;
      result.error = make_error(ErrorKind::FatalPrecondition, ErrorCode::AlreadyRunning,
                                "another run is in progress (pid " + std::to_string(*owner) + ")");
      logger_->error("Another synchronization is already running (pid {}, lock {})",
                     *owner, lock_path_.string());
      return result;
    }
    if(attempt > 0) break;

    if(owner) {
      logger_->warn("Removing stale lock {} left by pid {}", lock_path_.string(), *owner);
    } else {
      logger_->warn("Removing unreadable lock {}", lock_path_.string());
    }
    std::error_code ec;
    std::filesystem::remove(lock_path_, ec);
    if(ec) {
      logger_->error("Unable to remove stale lock {}: {}", lock_path_.string(), ec.message());
      result.error = make_error(ErrorKind::FatalPrecondition, ErrorCode::LockIo, ec.message());
      return result;
    }
  }

  // Only reachable when a non-cooperating writer recreated the file.
  auto owner = read_owner_pid(lock_path_);
  result.holder_pid = owner.value_or(0);
  result.error = make_error(ErrorKind::FatalPrecondition, ErrorCode::AlreadyRunning,
                            "lock " + lock_path_.string() + " was taken by another run");
  logger_->error("Lock {} was taken by another run", lock_path_.string());
  return result;
}

std::optional<pid_t> LockManager::read_owner_pid(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return std::nullopt;
  std::string line;
  if(!std::getline(in, line)) return std::nullopt;
  line = line.substr(0, line.find_last_not_of(" \t\r") + 1);
  if(line.empty()) return std::nullopt;
  for(char ch : line) {
    if(ch < '0' || ch > '9') return std::nullopt;
  }
  try {
    long value = std::stol(line);
    if(value <= 0) return std::nullopt;
    return static_cast<pid_t>(value);
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

bool LockManager::process_alive(pid_t pid) {
  if(pid <= 0) return false;
  if(::kill(pid, 0) == 0) return true;
  // EPERM: the process exists but belongs to someone else.
  return errno == EPERM;
}

bool LockManager::release_if_owner(const std::filesystem::path& path, pid_t owner, Logger* logger) {
  GuardFile guard(path);
  if(!guard.held()) {
    log_error(logger, "Unable to release lock {}: {}", path.string(), guard.error());
    return false;
  }
  auto recorded = read_owner_pid(path);
  if(!recorded) {
    std::error_code ec;
    if(!std::filesystem::exists(path, ec)) {
      log_debug(logger, "Lock {} already gone", path.string());
      return true;
    }
    log_warn(logger, "Lock {} is unreadable, leaving it in place", path.string());
    return false;
  }
  if(*recorded != owner) {
    log_warn(logger, "Lock {} now belongs to pid {}, not removing it", path.string(), *recorded);
    return false;
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if(ec) {
    log_error(logger, "Unable to remove lock {}: {}", path.string(), ec.message());
    return false;
  }
  log_info(logger, "Lock released: {}", path.string());
  return true;
}

bool LockManager::force_release(const std::filesystem::path& path, Logger* logger) {
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) {
    log_info(logger, "No active lock at {}", path.string());
    return true;
  }
  auto owner = read_owner_pid(path);
  std::filesystem::remove(path, ec);
  if(ec) {
    log_error(logger, "Unable to remove lock {}: {}", path.string(), ec.message());
    return false;
  }
  if(owner) {
    log_warn(logger, "Lock {} held by pid {} removed by force", path.string(), *owner);
  } else {
    log_warn(logger, "Lock {} removed by force", path.string());
  }
  return true;
}
