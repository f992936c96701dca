#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     std::string positional_key)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_key_(std::move(positional_key)) {
  SettingsManager probe(settings_spec_);
  if(!positional_key_.empty() && !probe.resolve_key(positional_key_)) {
    throw std::runtime_error("Positional argument mapped to unknown setting '" + positional_key_ + "'");
  }
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  error.clear();
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // Returns 1 when handled, 0 when the short token is not an option, -1 on error.
    auto handle_option = [&](std::string key_token, bool long_form) -> int {
      std::string inline_value;
      bool has_inline_value = false;
      auto eq = key_token.find('=');
      if(long_form && eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token = key_token.substr(0, eq);
        has_inline_value = true;
      }
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          error = "Unknown option --" + key_token;
          return -1;
        }
        return 0;
      }
      bool is_bool = settings.is_bool_setting(*resolved);
      std::string value;
      if(has_inline_value) {
        value = inline_value;
      } else if(is_bool) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          error = "Missing value for option '" + key_token + "'";
          return -1;
        }
        value = args[++i];
      }
      std::string set_error;
      if(!settings.set_from_string(*resolved, value, set_error)) {
        error = "Invalid value for option '" + key_token + "': " + set_error;
        return -1;
      }
      return 1;
    };

    if(!options_done && token == "--") {
      options_done = true;
      continue;
    }

    if(!options_done && token.rfind("--", 0) == 0) {
      if(handle_option(token.substr(2), true) < 0) return false;
      continue;
    }

    if(!options_done && token.size() > 1 && token[0] == '-') {
      int handled = handle_option(token.substr(1), false);
      if(handled < 0) return false;
      if(handled > 0) continue;
      error = "Unknown option " + token;
      return false;
    }

    if(positional_key_.empty()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    std::string set_error;
    if(!settings.set_from_string(positional_key_, token, set_error)) {
      error = "Invalid value for " + positional_key_ + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::string error;
  if(!parse(args, settings, error)) {
    print_err(nullptr, "{}", error);
    usage();
    std::exit(1);
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - bidirectional sync between a local tree and a cloud mount", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} (--upload | --download) [options] [item...]", process_name_);
  print_out(nullptr, "  {} --force-unlock", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();

    // Short aliases first, then the long forms, e.g. "-n, --dry_run, --dry-run".
    std::vector<std::string> forms;
    std::vector<std::string> long_forms{"--" + key};
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        auto name = alias.get<std::string>();
        if(name.size() == 1) {
          forms.push_back("-" + name);
        } else {
          long_forms.push_back("--" + name);
        }
      }
    }
    forms.insert(forms.end(), long_forms.begin(), long_forms.end());
    std::string joined;
    for(const auto& form : forms) {
      if(!joined.empty()) joined += ", ";
      joined += form;
    }
    if(type == "int") joined += " <n>";
    else if(type == "string") joined += " <path>";
    else if(type == "list") joined += " <value>";

    std::string line = fmt::format("  {:<34} {}", joined, entry.value("description", ""));
    const auto& fallback = entry.at("default");
    if(type == "int" && fallback.get<int>() != 0) {
      line += fmt::format(" (default {})", fallback.get<int>());
    }
    print_out(nullptr, "{}", line);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Bare arguments are taken as items relative to the local root.");
}
