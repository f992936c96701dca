#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Command line options. Persistent entries survive in the settings file
// between invocations; the rest only ever come from the command line.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","upload"},        {"aliases", {"subir","up","u"}},      {"type","bool"},   {"default",false}, {"description","Synchronize from the local tree to the cloud mount"}, {"persistent", false}},
  {{"key","download"},      {"aliases", {"bajar","down","d"}},    {"type","bool"},   {"default",false}, {"description","Synchronize from the cloud mount to the local tree"}, {"persistent", false}},
  {{"key","delete"},        {"aliases", {"del"}},                 {"type","bool"},   {"default",false}, {"description","Delete destination files missing from the source"}, {"persistent", false}},
  {{"key","dry_run"},       {"aliases", {"dry-run","n"}},         {"type","bool"},   {"default",false}, {"description","Simulate the run without changing anything"}, {"persistent", false}},
  {{"key","item"},          {"aliases", {"i"}},                   {"type","list"},   {"default",nlohmann::json::array()}, {"description","Synchronize only this element (repeatable)"}, {"persistent", false}},
  {{"key","exclude"},       {"aliases", {"x"}},                   {"type","list"},   {"default",nlohmann::json::array()}, {"description","Exclude paths matching this pattern (repeatable)"}, {"persistent", false}},
  {{"key","yes"},           {"aliases", {"y"}},                   {"type","bool"},   {"default",false}, {"description","Do not ask for confirmation"}, {"persistent", false}},
  {{"key","backup_dir"},    {"aliases", {"backup-dir","b"}},      {"type","bool"},   {"default",false}, {"description","Use the read-only backup area instead of the shared one"}, {"persistent", false}},
  {{"key","overwrite"},     {"aliases", {"o"}},                   {"type","bool"},   {"default",false}, {"description","Overwrite destination files even when newer"}, {"persistent", false}},
  {{"key","checksum"},      {"aliases", {"c"}},                   {"type","bool"},   {"default",false}, {"description","Compare files by checksum instead of size and time"}, {"persistent", true}},
  {{"key","bwlimit"},       {"aliases", {"bw"}},                  {"type","int"},    {"default",0},     {"description","Bandwidth limit in KB/s (0 = unlimited)"}, {"persistent", true}},
  {{"key","timeout"},       {"aliases", {"t"}},                   {"type","int"},    {"default",0},     {"description","Per-element timeout in minutes (0 = profile default)"}, {"persistent", true}},
  {{"key","force_unlock"},  {"aliases", {"force-unlock"}},        {"type","bool"},   {"default",false}, {"description","Remove the lock file and exit"}, {"persistent", false}},
  {{"key","verbose"},       {"aliases", {"v"}},                   {"type","bool"},   {"default",false}, {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","config"},        {"aliases", {"profile"}},             {"type","string"}, {"default",""},    {"description","Path to the JSON sync profile"}, {"persistent", false}},
  {{"key","help"},          {"aliases", {"h","?"}},               {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},          {"aliases", {"persist"}},             {"type","bool"},   {"default",false}, {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, String, List };

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return values_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  // List settings append on every string assignment; a JSON array replaces them.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const { return save_to_file(settings_path()); }
  bool load() { return load_from_file(settings_path()); }
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  nlohmann::json persistent_json() const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct Setting {
    std::string key;
    std::vector<std::string> names;
    SettingType type = SettingType::String;
    nlohmann::json default_value;
    bool persistent = true;
  };

  const Setting* find(const std::string& token) const;
  bool store(const Setting& setting, const nlohmann::json& value, std::string& error);
  static std::optional<nlohmann::json> from_text(const Setting& setting, const std::string& text, std::string& error);

  std::vector<Setting> settings_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};
