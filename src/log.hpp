#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Console output is configured once per process; loggers below only tag and
// route records into it.
void init(bool verbose = false);
bool attach_log_file(const std::filesystem::path& path);
void set_log_passthrough(bool enabled);

enum class LogChannel { Info, Warn, Error, Debug, Success, Print, PrintErr };

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_for(LogChannel channel);

struct LogRecord {
  std::string source;
  LogChannel channel = LogChannel::Info;
  std::string message;

  // "source:channel", or just the channel for unnamed sources.
  std::string label() const;
};

using LogListenerHandle = std::size_t;

class Logger {
public:
  // A listener returning true consumes the record and keeps it off the console.
  using Listener = std::function<bool(const LogRecord& record)>;

  explicit Logger(std::string name = std::string());

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void log(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    publish(LogRecord{name_, channel, fmt::format(fmt, std::forward<Args>(args)...)});
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  // Completed operations; info level, own channel.
  template<typename... Args>
  void success(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Success, fmt, std::forward<Args>(args)...);
  }

  // Undecorated output for banners and summaries.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

private:
  void publish(const LogRecord& record);

  std::string name_;
  std::mutex listener_mutex_;
  std::vector<std::pair<LogListenerHandle, Listener>> listeners_;
  LogListenerHandle next_listener_id_ = 1;
};

namespace detail {
void write_console(const LogRecord& record);

// Helpers below accept a null logger; the record then goes straight to the console.
template<typename... Args>
void route(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->log(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  write_console(LogRecord{std::string(), channel, fmt::format(fmt, std::forward<Args>(args)...)});
}
} // namespace detail

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_success(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Success, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
