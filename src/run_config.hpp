#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class Direction { Upload, Download };
enum class BackupAreaMode { Shared, ReadOnly };

inline const char* to_string(Direction direction) {
  switch(direction) {
    case Direction::Upload: return "upload";
    case Direction::Download: return "download";
  }
  return "unknown";
}

inline const char* to_string(BackupAreaMode mode) {
  switch(mode) {
    case BackupAreaMode::Shared: return "shared";
    case BackupAreaMode::ReadOnly: return "read-only";
  }
  return "unknown";
}

struct PermissionRule {
  std::string pattern;
  unsigned mode = 0;
  bool directory = false;
};

// Built once per invocation and only ever handed out by const reference.
struct RunConfig {
  Direction direction = Direction::Upload;
  bool dry_run = false;
  bool delete_extraneous = false;
  bool overwrite_always = false;
  bool use_checksum_compare = false;
  std::optional<unsigned> bandwidth_limit_kbps;
  std::chrono::seconds per_element_timeout{30 * 60};
  BackupAreaMode backup_area_mode = BackupAreaMode::Shared;
  std::vector<std::string> explicit_elements;
  std::vector<std::string> cli_exclusion_patterns;
  std::filesystem::path local_root;
  std::filesystem::path remote_root;

  std::vector<std::string> config_exclusion_patterns;
  std::vector<std::filesystem::path> allowed_link_roots;
  std::vector<PermissionRule> permission_rules;
  std::filesystem::path mount_point;
  std::filesystem::path lock_path;
  std::string manifest_name = ".syncb_symlinks.meta";
  std::string transfer_tool = "rsync";
  std::uint64_t required_free_mb = 0;
  bool assume_yes = false;

  const std::filesystem::path& source_root() const {
    return direction == Direction::Upload ? local_root : remote_root;
  }

  const std::filesystem::path& destination_root() const {
    return direction == Direction::Upload ? remote_root : local_root;
  }
};

struct HostContext {
  std::string host;
  std::optional<std::vector<std::string>> default_elements;
  std::map<std::string, std::vector<std::string>> host_elements;
};

class SettingsManager;
struct SyncProfile;

struct RunConfigResult {
  std::optional<RunConfig> config;
  HostContext host_context;
  std::string error;
};

RunConfigResult build_run_config(const SettingsManager& settings,
                                 const SyncProfile& profile,
                                 const std::string& host);
