#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "run_config.hpp"

// On-disk description of the two trees, the per-host element lists and the
// policies that do not change between invocations.
struct SyncProfile {
  std::filesystem::path source_file;

  std::filesystem::path local_dir;
  std::filesystem::path mount_point;
  std::filesystem::path backup_shared_dir;
  std::filesystem::path backup_readonly_dir;
  std::filesystem::path log_file;
  std::filesystem::path lock_file;
  std::string symlinks_file = ".syncb_symlinks.meta";
  unsigned default_timeout_minutes = 30;
  std::uint64_t required_free_mb = 500;
  std::string transfer_tool = "rsync";

  std::map<std::string, std::vector<std::string>> directories;
  std::vector<std::string> exclusions;
  std::vector<std::filesystem::path> allowed_link_roots;
  std::vector<PermissionRule> permission_rules;
};

std::vector<std::filesystem::path> profile_search_paths(const std::string& explicit_path);

// Reads the first existing candidate. Returns nullopt with `error` set when
// none exists or the document is invalid.
std::optional<SyncProfile> load_sync_profile(const std::vector<std::filesystem::path>& candidates,
                                             std::string& error);

std::optional<SyncProfile> parse_sync_profile(const nlohmann::json& doc, std::string& error);
