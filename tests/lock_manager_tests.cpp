#include "lock_manager.hpp"
#include "test_runner_utils.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

namespace syncb::test {
namespace {

pid_t dead_pid() {
  pid_t child = ::fork();
  if(child == 0) ::_exit(0);
  int status = 0;
  ::waitpid(child, &status, 0);
  return child;
}

bool test_acquire_writes_record(TestContext& ctx) {
  TempWorkspace ws("lock_record");
  LockManager locks(ws.lock_path(), ctx.logger());
  auto acquired = locks.acquire(Direction::Download);
  if(!acquired.handle || acquired.error) return false;
  auto lines = read_lines(ws.lock_path());
  if(lines.size() < 5) return false;
  if(lines[0] != std::to_string(::getpid())) return false;
  bool has_direction = std::find(lines.begin(), lines.end(), "direction: download") != lines.end();
  bool has_host = std::any_of(lines.begin(), lines.end(),
    [](const std::string& line){ return line.rfind("host: ", 0) == 0; });
  return has_direction && has_host;
}

// A second process holding the lock keeps this one out until it exits.
bool test_live_holder_blocks(TestContext& ctx) {
  TempWorkspace ws("lock_live_holder");
  int ready[2];
  int release[2];
  if(::pipe(ready) != 0 || ::pipe(release) != 0) return false;

  pid_t holder = ::fork();
  if(holder == 0) {
    ::close(ready[0]);
    ::close(release[1]);
    set_log_passthrough(false);
    LockManager child_locks(ws.lock_path(), nullptr);
    auto acquired = child_locks.acquire(Direction::Upload);
    char flag = acquired.handle ? '1' : '0';
    if(::write(ready[1], &flag, 1) != 1) ::_exit(2);
    char ignored;
    while(::read(release[0], &ignored, 1) > 0) {}
    if(acquired.handle) acquired.handle->release();
    ::_exit(0);
  }
  ::close(ready[1]);
  ::close(release[0]);

  char flag = '0';
  bool child_ready = ::read(ready[0], &flag, 1) == 1 && flag == '1';

  LockManager locks(ws.lock_path(), ctx.logger());
  auto blocked = locks.acquire(Direction::Upload);
  bool refused = !blocked.handle && blocked.error &&
                 blocked.error->code == ErrorCode::AlreadyRunning &&
                 blocked.holder_pid == holder;

  ::close(release[1]);
  ::close(ready[0]);
  int status = 0;
  ::waitpid(holder, &status, 0);

  auto after = locks.acquire(Direction::Upload);
  return child_ready && refused && after.handle.has_value();
}

bool test_stale_lock_is_replaced(TestContext& ctx) {
  TempWorkspace ws("lock_stale");
  write_file(ws.lock_path(), std::to_string(dead_pid()) + "\ntimestamp: old\n");
  LockManager locks(ws.lock_path(), ctx.logger());
  auto acquired = locks.acquire(Direction::Upload);
  if(!acquired.handle) return false;
  auto lines = read_lines(ws.lock_path());
  return !lines.empty() && lines[0] == std::to_string(::getpid()) &&
         ctx.logs.contains("Removing stale lock");
}

// Exit codes of a racing acquirer.
constexpr int kLockRefused = 1;
constexpr int kLockHeldThroughout = 0;
constexpr int kLockLostWhileHeld = 3;

// Several processes take over the same stale lock at once. Each one that
// succeeds must still be named on line 1 for as long as it holds the lock.
bool test_concurrent_stale_takeover(TestContext&) {
  constexpr int kTrials = 12;
  constexpr int kRacers = 8;
  TempWorkspace ws("lock_stale_race");

  for(int trial = 0; trial < kTrials; ++trial) {
    write_file(ws.lock_path(), std::to_string(dead_pid()) + "\ntimestamp: old\n");

    int start[2];
    if(::pipe(start) != 0) return false;
    std::vector<pid_t> racers;
    for(int i = 0; i < kRacers; ++i) {
      pid_t child = ::fork();
      if(child < 0) return false;
      if(child == 0) {
        ::close(start[1]);
        set_log_passthrough(false);
        char ignored;
        while(::read(start[0], &ignored, 1) > 0) {}
        LockManager child_locks(ws.lock_path(), nullptr);
        auto acquired = child_locks.acquire(Direction::Upload);
        if(!acquired.handle) ::_exit(kLockRefused);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        bool still_mine = LockManager::read_owner_pid(ws.lock_path()) == ::getpid();
        acquired.handle->release();
        ::_exit(still_mine ? kLockHeldThroughout : kLockLostWhileHeld);
      }
      racers.push_back(child);
    }
    ::close(start[0]);
    // Closing the write end releases every racer at once.
    ::close(start[1]);

    int owners = 0;
    bool lost = false;
    for(pid_t racer : racers) {
      int status = 0;
      ::waitpid(racer, &status, 0);
      if(!WIFEXITED(status)) return false;
      if(WEXITSTATUS(status) == kLockHeldThroughout) ++owners;
      if(WEXITSTATUS(status) == kLockLostWhileHeld) lost = true;
    }
    if(lost || owners == 0) return false;
    if(std::filesystem::exists(ws.lock_path())) return false;
  }
  return true;
}

bool test_corrupt_lock_is_replaced(TestContext& ctx) {
  TempWorkspace ws("lock_corrupt");
  write_file(ws.lock_path(), "PID: not-a-number\n");
  LockManager locks(ws.lock_path(), ctx.logger());
  auto acquired = locks.acquire(Direction::Upload);
  return acquired.handle.has_value() && ctx.logs.contains("unreadable lock");
}

bool test_release_checks_owner(TestContext& ctx) {
  TempWorkspace ws("lock_owner");
  LockManager locks(ws.lock_path(), ctx.logger());
  auto acquired = locks.acquire(Direction::Upload);
  if(!acquired.handle) return false;
  // Another run took over the file meanwhile.
  write_file(ws.lock_path(), "1\n");
  bool released = acquired.handle->release();
  bool still_there = std::filesystem::exists(ws.lock_path());
  return !released && still_there && LockManager::read_owner_pid(ws.lock_path()) == pid_t(1);
}

bool test_handle_releases_on_scope_exit(TestContext& ctx) {
  TempWorkspace ws("lock_scope");
  {
    LockManager locks(ws.lock_path(), ctx.logger());
    auto acquired = locks.acquire(Direction::Upload);
    if(!acquired.handle) return false;
    LockHandle moved = std::move(*acquired.handle);
    if(!moved.owned() || acquired.handle->owned()) return false;
    if(!std::filesystem::exists(ws.lock_path())) return false;
  }
  return !std::filesystem::exists(ws.lock_path());
}

bool test_force_release(TestContext& ctx) {
  TempWorkspace ws("lock_force");
  write_file(ws.lock_path(), "1\nuser: someone\n");
  auto logger = ctx.logger();
  bool removed = LockManager::force_release(ws.lock_path(), logger.get());
  bool again = LockManager::force_release(ws.lock_path(), logger.get());
  return removed && again && !std::filesystem::exists(ws.lock_path()) &&
         ctx.logs.contains("removed by force") && ctx.logs.contains("No active lock");
}

bool test_process_alive(TestContext&) {
  return LockManager::process_alive(::getpid()) &&
         !LockManager::process_alive(dead_pid()) &&
         !LockManager::process_alive(0);
}

} // namespace

std::vector<TestCase> lock_manager_tests() {
  return {
    {"lock_acquire_writes_record", test_acquire_writes_record},
    {"lock_live_holder_blocks", test_live_holder_blocks},
    {"lock_stale_lock_is_replaced", test_stale_lock_is_replaced},
    {"lock_concurrent_stale_takeover", test_concurrent_stale_takeover},
    {"lock_corrupt_lock_is_replaced", test_corrupt_lock_is_replaced},
    {"lock_release_checks_owner", test_release_checks_owner},
    {"lock_handle_releases_on_scope_exit", test_handle_releases_on_scope_exit},
    {"lock_force_release", test_force_release},
    {"lock_process_alive", test_process_alive}
  };
}

} // namespace syncb::test
