#include "process_runner.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace {

constexpr auto kExitPollInterval = std::chrono::milliseconds(20);

struct PipePair {
  int read_fd = -1;
  int write_fd = -1;

  ~PipePair() { close_both(); }

  bool open() {
    int fds[2];
    if(::pipe2(fds, O_CLOEXEC) != 0) return false;
    read_fd = fds[0];
    write_fd = fds[1];
    return true;
  }

  void close_read() {
    if(read_fd >= 0) ::close(read_fd);
    read_fd = -1;
  }

  void close_write() {
    if(write_fd >= 0) ::close(write_fd);
    write_fd = -1;
  }

  void close_both() {
    close_read();
    close_write();
  }

  int release_read() {
    int fd = read_fd;
    read_fd = -1;
    return fd;
  }
};

int decode_status(int status) {
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

struct ProcessRunner::State {
  State(asio::io_context& io)
    : out(io), err(io), timeout_timer(io), kill_timer(io), exit_timer(io) {}

  pid_t pid = -1;
  asio::posix::stream_descriptor out;
  asio::posix::stream_descriptor err;
  asio::steady_timer timeout_timer;
  asio::steady_timer kill_timer;
  asio::steady_timer exit_timer;
  std::array<char, 4096> out_buf{};
  std::array<char, 4096> err_buf{};
  std::string out_partial;
  std::string err_partial;
  LineCallback on_line;
  ProcessResult result;
  int open_streams = 2;
  bool terminating = false;
  bool finished = false;
};

ProcessRunner::ProcessRunner(asio::io_context& io, std::shared_ptr<Logger> logger)
  : io_(io), logger_(std::move(logger)) {}

ProcessRunner::~ProcessRunner() {
  if(active_ && active_->pid > 0 && !active_->finished) {
    ::kill(-active_->pid, SIGKILL);
    int status = 0;
    ::waitpid(active_->pid, &status, 0);
  }
}

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout,
                                 LineCallback on_line) {
  ProcessResult failed;
  failed.spawn_failed = true;
  if(argv.empty()) {
    failed.error = "empty command";
    return failed;
  }
  if(active_) {
    failed.error = "another process is already running";
    return failed;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for(const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
  args.push_back(nullptr);

  PipePair out_pipe, err_pipe, exec_pipe;
  if(!out_pipe.open() || !err_pipe.open() || !exec_pipe.open()) {
    failed.error = std::string("pipe: ") + std::strerror(errno);
    return failed;
  }

  pid_t pid = ::fork();
  if(pid < 0) {
    failed.error = std::string("fork: ") + std::strerror(errno);
    return failed;
  }
  if(pid == 0) {
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if(devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe.write_fd, STDOUT_FILENO);
    ::dup2(err_pipe.write_fd, STDERR_FILENO);
    ::execvp(args[0], args.data());
    int code = errno;
    ssize_t ignored = ::write(exec_pipe.write_fd, &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  out_pipe.close_write();
  err_pipe.close_write();
  exec_pipe.close_write();

  // The exec pipe closes on a successful exec; otherwise it carries errno.
  int exec_errno = 0;
  ssize_t got;
  do {
    got = ::read(exec_pipe.read_fd, &exec_errno, sizeof(exec_errno));
  } while(got < 0 && errno == EINTR);
  if(got == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    failed.error = "cannot execute " + argv[0] + ": " + std::strerror(exec_errno);
    log_debug(logger_.get(), "{}", failed.error);
    return failed;
  }

  auto state = std::make_shared<State>(io_);
  state->pid = pid;
  state->on_line = std::move(on_line);
  state->out.assign(out_pipe.release_read());
  state->err.assign(err_pipe.release_read());
  active_ = state;

  log_debug(logger_.get(), "Started {} (pid {})", argv[0], pid);

  if(timeout.count() > 0) {
    state->timeout_timer.expires_after(timeout);
    state->timeout_timer.async_wait([this, state](const std::error_code& ec){
      if(ec || state->finished) return;
      state->result.timed_out = true;
      log_warn(logger_.get(), "Process {} exceeded its time limit, terminating", state->pid);
      terminate(state);
    });
  }

  start_read(state, false);
  start_read(state, true);

  io_.restart();
  while(!state->finished) {
    if(io_.run_one() == 0) {
      // Nothing left to wait on; only reachable if the io_context was stopped.
      io_.restart();
      poll_exit(state);
    }
  }

  active_.reset();
  return state->result;
}

void ProcessRunner::start_read(const std::shared_ptr<State>& state, bool from_stderr) {
  auto& stream = from_stderr ? state->err : state->out;
  auto& buffer = from_stderr ? state->err_buf : state->out_buf;
  stream.async_read_some(asio::buffer(buffer),
    [this, state, from_stderr](const std::error_code& ec, std::size_t bytes){
      auto& buf = from_stderr ? state->err_buf : state->out_buf;
      if(bytes > 0) deliver(state, from_stderr, buf.data(), bytes);
      if(ec) {
        auto& partial = from_stderr ? state->err_partial : state->out_partial;
        if(!partial.empty() && state->on_line) state->on_line(partial, from_stderr);
        partial.clear();
        std::error_code ignored;
        (from_stderr ? state->err : state->out).close(ignored);
        on_stream_closed(state);
        return;
      }
      start_read(state, from_stderr);
    });
}

void ProcessRunner::deliver(const std::shared_ptr<State>& state,
                            bool from_stderr,
                            const char* data,
                            std::size_t size) {
  auto& text = from_stderr ? state->result.stderr_text : state->result.stdout_text;
  auto& partial = from_stderr ? state->err_partial : state->out_partial;
  text.append(data, size);
  for(std::size_t i = 0; i < size; ++i) {
    char ch = data[i];
    if(ch == '\n' || ch == '\r') {
      if(!partial.empty() && state->on_line) state->on_line(partial, from_stderr);
      partial.clear();
    } else {
      partial.push_back(ch);
    }
  }
}

void ProcessRunner::on_stream_closed(const std::shared_ptr<State>& state) {
  if(--state->open_streams > 0) return;
  poll_exit(state);
}

void ProcessRunner::poll_exit(const std::shared_ptr<State>& state) {
  if(state->finished) return;
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(state->pid, &status, WNOHANG);
  } while(rc < 0 && errno == EINTR);

  if(rc == state->pid || rc < 0) {
    state->result.exit_code = rc < 0 ? -1 : decode_status(status);
    state->finished = true;
    std::error_code ignored;
    state->timeout_timer.cancel(ignored);
    state->kill_timer.cancel(ignored);
    state->exit_timer.cancel(ignored);
    log_debug(logger_.get(), "Process {} exited with {}", state->pid, state->result.exit_code);
    return;
  }

  state->exit_timer.expires_after(kExitPollInterval);
  state->exit_timer.async_wait([this, state](const std::error_code& ec){
    if(ec) return;
    poll_exit(state);
  });
}

void ProcessRunner::terminate(const std::shared_ptr<State>& state) {
  if(state->finished || state->terminating) return;
  state->terminating = true;
  ::kill(-state->pid, SIGTERM);
  state->kill_timer.expires_after(kill_grace_);
  state->kill_timer.async_wait([this, state](const std::error_code& ec){
    if(ec || state->finished) return;
    log_warn(logger_.get(), "Process {} ignored SIGTERM, killing it", state->pid);
    ::kill(-state->pid, SIGKILL);
  });
}

void ProcessRunner::cancel() {
  if(!active_ || active_->finished) return;
  active_->result.interrupted = true;
  terminate(active_);
}

std::optional<std::filesystem::path> ProcessRunner::find_executable(const std::string& name) {
  if(name.empty()) return std::nullopt;
  auto usable = [](const std::filesystem::path& candidate) {
    struct stat st{};
    return ::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(candidate.c_str(), X_OK) == 0;
  };
  if(name.find('/') != std::string::npos) {
    if(usable(name)) return std::filesystem::path(name);
    return std::nullopt;
  }
  const char* env = std::getenv("PATH");
  std::string search = env && *env ? env : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while(start <= search.size()) {
    auto end = search.find(':', start);
    if(end == std::string::npos) end = search.size();
    std::string dir = search.substr(start, end - start);
    if(dir.empty()) dir = ".";
    auto candidate = std::filesystem::path(dir) / name;
    if(usable(candidate)) return candidate;
    start = end + 1;
  }
  return std::nullopt;
}
