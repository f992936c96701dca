#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace {

SettingType parse_type(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "string") return SettingType::String;
  if(name == "list") return SettingType::List;
  throw std::runtime_error("Unsupported setting type '" + name + "'");
}

std::optional<bool> parse_bool(const std::string& text) {
  auto v = SettingsManager::to_lower(text);
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

} // namespace

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    Setting setting;
    setting.key = entry.at("key").get<std::string>();
    setting.names.push_back(to_lower(setting.key));
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        setting.names.push_back(to_lower(alias.get<std::string>()));
      }
    }
    setting.type = parse_type(entry.at("type").get<std::string>());
    setting.default_value = entry.at("default");
    setting.persistent = entry.value("persistent", true);
    values_[setting.key] = setting.default_value;
    settings_.push_back(std::move(setting));
  }
}

const SettingsManager::Setting* SettingsManager::find(const std::string& token) const {
  const auto lowered = to_lower(token);
  for(const auto& setting : settings_) {
    if(std::find(setting.names.begin(), setting.names.end(), lowered) != setting.names.end()) {
      return &setting;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* setting = find(token)) return setting->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* setting = find(key);
  return setting && setting->type == SettingType::Bool;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return home_directory() / ".config" / "syncb" / "settings.json";
}

bool SettingsManager::store(const Setting& setting, const nlohmann::json& value, std::string& error) {
  switch(setting.type) {
    case SettingType::Bool:
      if(value.is_boolean()) {
        values_[setting.key] = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        values_[setting.key] = value.get<int>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case SettingType::Int:
      if(value.is_number_integer()) {
        values_[setting.key] = value.get<int>();
        return true;
      }
      error = "expected integer";
      return false;
    case SettingType::String:
      if(value.is_string()) {
        values_[setting.key] = value.get<std::string>();
        return true;
      }
      error = "expected string";
      return false;
    case SettingType::List:
      if(value.is_string()) {
        auto& list = values_[setting.key];
        if(!list.is_array()) list = nlohmann::json::array();
        list.push_back(value.get<std::string>());
        return true;
      }
      if(value.is_array() && std::all_of(value.begin(), value.end(),
                                         [](const nlohmann::json& item){ return item.is_string(); })) {
        values_[setting.key] = value;
        return true;
      }
      error = "expected string or list of strings";
      return false;
  }
  error = "unknown type";
  return false;
}

std::optional<nlohmann::json> SettingsManager::from_text(const Setting& setting,
                                                         const std::string& text,
                                                         std::string& error) {
  // Patterns and paths keep their surrounding whitespace.
  if(setting.type == SettingType::List) {
    if(text.empty()) {
      error = "empty value";
      return std::nullopt;
    }
    return nlohmann::json(text);
  }
  const auto clean = trim_copy(text);
  switch(setting.type) {
    case SettingType::Bool:
      if(auto parsed = parse_bool(clean)) return nlohmann::json(*parsed);
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    case SettingType::Int:
      try {
        std::size_t consumed = 0;
        int parsed = std::stoi(clean, &consumed);
        if(consumed != clean.size()) {
          error = "trailing characters";
          return std::nullopt;
        }
        return nlohmann::json(parsed);
      } catch(const std::exception& e) {
        error = e.what();
        return std::nullopt;
      }
    default:
      return nlohmann::json(clean);
  }
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  auto parsed = from_text(*setting, value, error);
  return parsed && store(*setting, *parsed, error);
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  return store(*setting, value, error);
}

nlohmann::json SettingsManager::persistent_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& setting : settings_) {
    if(setting.persistent) doc[setting.key] = values_.at(setting.key);
  }
  return doc;
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) return false;
  // Only persistent keys are honoured.
  for(const auto& item : doc.items()) {
    const auto* setting = find(item.key());
    if(!setting || !setting->persistent) continue;
    std::string error;
    if(!store(*setting, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_json().dump(2);
  return static_cast<bool>(out);
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}
