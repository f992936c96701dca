#pragma once

#include <asio.hpp>

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"

struct ProcessResult {
  int exit_code = -1;
  bool timed_out = false;
  bool interrupted = false;
  bool spawn_failed = false;
  std::string stdout_text;
  std::string stderr_text;
  std::string error;

  bool succeeded() const {
    return !spawn_failed && !timed_out && !interrupted && exit_code == 0;
  }
};

// Runs one child at a time on the caller's io_context. The child gets its own
// process group so a timeout or cancel() takes down anything it spawned.
class ProcessRunner {
public:
  using LineCallback = std::function<void(const std::string& line, bool from_stderr)>;

  ProcessRunner(asio::io_context& io, std::shared_ptr<Logger> logger = nullptr);
  ~ProcessRunner();

  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;

  // Blocks until the child exits, driving the io_context meanwhile. A zero
  // timeout means no limit.
  ProcessResult run(const std::vector<std::string>& argv,
                    std::chrono::milliseconds timeout,
                    LineCallback on_line = {});

  // Safe to call from a handler running on the same io_context.
  void cancel();
  bool running() const { return static_cast<bool>(active_); }

  void set_kill_grace(std::chrono::milliseconds grace) { kill_grace_ = grace; }

  static std::optional<std::filesystem::path> find_executable(const std::string& name);

private:
  struct State;

  void start_read(const std::shared_ptr<State>& state, bool from_stderr);
  void deliver(const std::shared_ptr<State>& state, bool from_stderr, const char* data, std::size_t size);
  void on_stream_closed(const std::shared_ptr<State>& state);
  void poll_exit(const std::shared_ptr<State>& state);
  void terminate(const std::shared_ptr<State>& state);

  asio::io_context& io_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<State> active_;
  std::chrono::milliseconds kill_grace_{std::chrono::seconds(5)};
};
