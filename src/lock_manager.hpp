#pragma once

#include <sys/types.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "run_config.hpp"
#include "sync_error.hpp"

// Line 1 of the lock file is the owner pid; the rest is for humans.
struct LockRecord {
  pid_t pid = 0;
  std::string timestamp;
  Direction direction = Direction::Upload;
  std::string user;
  std::string host;

  std::string serialize() const;
};

// Owns an acquired lock file and removes it on destruction, but only while the
// file still names this process.
class LockHandle {
public:
  LockHandle() = default;
  ~LockHandle();

  LockHandle(LockHandle&& other) noexcept;
  LockHandle& operator=(LockHandle&& other) noexcept;
  LockHandle(const LockHandle&) = delete;
  LockHandle& operator=(const LockHandle&) = delete;

  bool owned() const { return owned_; }
  const std::filesystem::path& path() const { return path_; }
  pid_t pid() const { return pid_; }

  bool release();

private:
  friend class LockManager;
  LockHandle(std::filesystem::path path, pid_t pid, std::shared_ptr<Logger> logger);

  std::filesystem::path path_;
  pid_t pid_ = 0;
  bool owned_ = false;
  std::shared_ptr<Logger> logger_;
};

class LockManager {
public:
  struct AcquireResult {
    std::optional<LockHandle> handle;
    std::optional<SyncError> error;
    pid_t holder_pid = 0;
  };

  LockManager(std::filesystem::path lock_path, std::shared_ptr<Logger> logger);

  AcquireResult acquire(Direction direction);

  const std::filesystem::path& lock_path() const { return lock_path_; }

  static std::optional<pid_t> read_owner_pid(const std::filesystem::path& path);
  static bool process_alive(pid_t pid);
  static bool release_if_owner(const std::filesystem::path& path, pid_t owner, Logger* logger);
  static bool force_release(const std::filesystem::path& path, Logger* logger);

private:
  enum class CreateStatus { Created, Exists, Failed };

  CreateStatus try_create(const LockRecord& record, std::string& error);
  LockRecord make_record(Direction direction) const;

  std::filesystem::path lock_path_;
  std::shared_ptr<Logger> logger_;
};
