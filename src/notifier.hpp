#pragma once

#include <memory>
#include <string>

#include "log.hpp"

enum class NotifySeverity { Info, Success, Warning, Error };

class Notifier {
public:
  virtual ~Notifier() = default;
  virtual void notify(const std::string& title, const std::string& message, NotifySeverity severity) = 0;
};

// Renders notifications as log lines on the given logger.
class LogNotifier : public Notifier {
public:
  explicit LogNotifier(std::shared_ptr<Logger> logger);

  void notify(const std::string& title, const std::string& message, NotifySeverity severity) override;

private:
  std::shared_ptr<Logger> logger_;
};
