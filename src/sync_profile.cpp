#include "sync_profile.hpp"

#include <fstream>
#include <stdexcept>

#include "utils.hpp"

namespace {

std::filesystem::path path_value(const nlohmann::json& section,
                                 const char* key,
                                 const std::filesystem::path& fallback) {
  if(!section.contains(key)) return fallback;
  return expand_home(section.at(key).get<std::string>());
}

std::vector<std::string> string_list(const nlohmann::json& value, const std::string& what) {
  if(!value.is_array()) {
    throw std::runtime_error(what + " must be an array of strings");
  }
  return value.get<std::vector<std::string>>();
}

void parse_permission_map(const nlohmann::json& section,
                          bool directory,
                          std::vector<PermissionRule>& out) {
  if(!section.is_object()) {
    throw std::runtime_error("permissions entries must be objects of pattern -> mode");
  }
  for(const auto& item : section.items()) {
    const auto mode_text = item.value().get<std::string>();
    std::size_t consumed = 0;
    unsigned long mode = std::stoul(mode_text, &consumed, 8);
    if(consumed != mode_text.size() || mode > 07777) {
      throw std::runtime_error("invalid octal mode '" + mode_text + "' for " + item.key());
    }
    PermissionRule rule;
    rule.pattern = item.key();
    rule.mode = static_cast<unsigned>(mode);
    rule.directory = directory;
    out.push_back(std::move(rule));
  }
}

} // namespace

std::vector<std::filesystem::path> profile_search_paths(const std::string& explicit_path) {
  if(!explicit_path.empty()) {
    return {expand_home(explicit_path)};
  }
  return {
    home_directory() / ".config" / "syncb" / "config.json",
    std::filesystem::current_path() / "syncb_config.json",
    "/etc/syncb/config.json"
  };
}

std::optional<SyncProfile> parse_sync_profile(const nlohmann::json& doc, std::string& error) {
  if(!doc.is_object()) {
    error = "profile root must be an object";
    return std::nullopt;
  }
  const auto home = home_directory();
  try {
    SyncProfile profile;
    const auto general = doc.value("general", nlohmann::json::object());
    profile.local_dir = path_value(general, "local_dir", home);
    profile.mount_point = path_value(general, "mount_point", home / "pCloudDrive");
    profile.backup_shared_dir = path_value(general, "backup_shared_dir", profile.mount_point / "Backups" / "Backup_Comun");
    profile.backup_readonly_dir = path_value(general, "backup_readonly_dir", home / "pCloud Backup");
    profile.log_file = path_value(general, "log_file", home / ".config" / "syncb" / "syncb.log");
    profile.lock_file = path_value(general, "lock_file", home / ".config" / "syncb" / "syncb.lock");
    profile.symlinks_file = general.value("symlinks_file", profile.symlinks_file);
    profile.default_timeout_minutes = general.value("default_timeout_minutes", profile.default_timeout_minutes);
    profile.required_free_mb = general.value("required_free_mb", profile.required_free_mb);
    profile.transfer_tool = general.value("transfer_tool", profile.transfer_tool);

    if(profile.symlinks_file.empty() ||
       profile.symlinks_file.find('/') != std::string::npos ||
       profile.symlinks_file == "." || profile.symlinks_file == "..") {
      error = "general.symlinks_file must be a plain file name";
      return std::nullopt;
    }

    if(doc.contains("directories")) {
      const auto& dirs = doc.at("directories");
      if(!dirs.is_object()) {
        error = "directories must map host names to element lists";
        return std::nullopt;
      }
      for(const auto& item : dirs.items()) {
        profile.directories[item.key()] = string_list(item.value(), "directories." + item.key());
      }
    }

    if(doc.contains("exclusions")) {
      profile.exclusions = string_list(doc.at("exclusions"), "exclusions");
    }

    if(doc.contains("allowed_link_roots")) {
      for(const auto& raw : string_list(doc.at("allowed_link_roots"), "allowed_link_roots")) {
        auto root = expand_home(raw);
        if(!root.is_absolute()) {
          error = "allowed_link_roots entries must be absolute: " + raw;
          return std::nullopt;
        }
        profile.allowed_link_roots.push_back(root);
      }
    }

    if(doc.contains("permissions")) {
      const auto& perms = doc.at("permissions");
      if(perms.contains("files")) parse_permission_map(perms.at("files"), false, profile.permission_rules);
      if(perms.contains("directories")) parse_permission_map(perms.at("directories"), true, profile.permission_rules);
    }

    return profile;
  } catch(const std::exception& e) {
    error = e.what();
    return std::nullopt;
  }
}

std::optional<SyncProfile> load_sync_profile(const std::vector<std::filesystem::path>& candidates,
                                             std::string& error) {
  for(const auto& candidate : candidates) {
    std::error_code ec;
    if(!std::filesystem::is_regular_file(candidate, ec)) continue;
    std::ifstream in(candidate);
    if(!in) {
      error = "Unable to read profile " + candidate.string();
      return std::nullopt;
    }
    nlohmann::json doc;
    try {
      in >> doc;
    } catch(const std::exception& e) {
      error = "Failed to parse " + candidate.string() + ": " + e.what();
      return std::nullopt;
    }
    std::string parse_error;
    auto profile = parse_sync_profile(doc, parse_error);
    if(!profile) {
      error = candidate.string() + ": " + parse_error;
      return std::nullopt;
    }
    profile->source_file = candidate;
    return profile;
  }
  error = "No configuration file found (searched";
  for(const auto& candidate : candidates) {
    error += " " + candidate.string();
  }
  error += ")";
  return std::nullopt;
}
