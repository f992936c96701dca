#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <initializer_list>

namespace {

// Decorated records go to stdout (stderr for errors); Print channels bypass the pattern.
struct ConsoleLoggers {
  std::shared_ptr<spdlog::logger> status;
  std::shared_ptr<spdlog::logger> alerts;
  std::shared_ptr<spdlog::logger> plain;
  std::shared_ptr<spdlog::logger> plain_err;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
};

std::once_flag g_console_once;
std::mutex g_file_mutex;
ConsoleLoggers g_console;
std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_console(const std::string& name, spdlog::sink_ptr sink, const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

ConsoleLoggers& console() {
  std::call_once(g_console_once, [](){
    const char* decorated = "[%H:%M:%S] [%^%l%$] %v";
    g_console.status = make_console("syncb.status", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), decorated);
    g_console.alerts = make_console("syncb.alerts", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), decorated);
    g_console.plain = make_console("syncb.plain", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
    g_console.plain_err = make_console("syncb.plain_err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v");
    g_console.status->flush_on(spdlog::level::warn);
    g_console.alerts->flush_on(spdlog::level::err);
    g_console.plain->flush_on(spdlog::level::info);
    g_console.plain_err->flush_on(spdlog::level::err);
  });
  return g_console;
}

spdlog::logger* console_for(LogChannel channel) {
  auto& loggers = console();
  switch(channel) {
    case LogChannel::Print: return loggers.plain.get();
    case LogChannel::PrintErr: return loggers.plain_err.get();
    case LogChannel::Error: return loggers.alerts.get();
    default: return loggers.status.get();
  }
}

} // namespace

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Success: return "success";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

std::string LogRecord::label() const {
  if(source.empty()) return to_string(channel);
  return source + ":" + to_string(channel);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

void init(bool verbose) {
  auto& loggers = console();
  loggers.status->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  loggers.alerts->set_level(spdlog::level::info);
  loggers.plain->set_level(spdlog::level::info);
  loggers.plain_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(loggers.status);
}

bool attach_log_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  auto& loggers = console();
  std::lock_guard<std::mutex> lock(g_file_mutex);
  if(loggers.file_sink) return true;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  try {
    loggers.file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
  } catch(const spdlog::spdlog_ex& e) {
    detail::write_console(LogRecord{"log", LogChannel::Error,
                                    fmt::format("Unable to open log file {}: {}", path.string(), e.what())});
    return false;
  }
  loggers.file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
  for(auto* logger : {loggers.status.get(), loggers.alerts.get(), loggers.plain.get(), loggers.plain_err.get()}) {
    logger->sinks().push_back(loggers.file_sink);
  }
  return true;
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [handle](const auto& entry){ return entry.first == handle; }),
                   listeners_.end());
}

void Logger::publish(const LogRecord& record) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool consumed = false;
  for(const auto& listener : snapshot) {
    try {
      consumed = listener(record) || consumed;
    } catch(const std::exception& e) {
      detail::write_console(LogRecord{"log", LogChannel::Error,
                                      fmt::format("log listener failed: {}", e.what())});
    }
  }
  if(!consumed) detail::write_console(record);
}

namespace detail {

void write_console(const LogRecord& record) {
  auto* sink = console_for(record.channel);
  if(!g_passthrough.load(std::memory_order_acquire)) return;
  const auto level = level_for(record.channel);
  const bool plain = record.channel == LogChannel::Print || record.channel == LogChannel::PrintErr;
  if(plain || record.source.empty()) {
    sink->log(level, record.message);
  } else {
    sink->log(level, fmt::format("[{}] {}", record.label(), record.message));
  }
}

} // namespace detail
