#include "notifier.hpp"

LogNotifier::LogNotifier(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("notify")) {}

void LogNotifier::notify(const std::string& title, const std::string& message, NotifySeverity severity) {
  switch(severity) {
    case NotifySeverity::Info:
      logger_->info("[{}] {}", title, message);
      break;
    case NotifySeverity::Success:
      logger_->success("[{}] {}", title, message);
      break;
    case NotifySeverity::Warning:
      logger_->warn("[{}] {}", title, message);
      break;
    case NotifySeverity::Error:
      logger_->error("[{}] {}", title, message);
      break;
  }
}
