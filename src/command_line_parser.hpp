#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  // Bare arguments are routed to `positional_key`, which is normally a list
  // setting so every one of them is kept.
  CommandLineParser(std::string process_name = "syncb",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    std::string positional_key = "item");

  // Returns false and fills `error` on the first bad token; settings keep
  // whatever was applied before it.
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::string positional_key_;
};
