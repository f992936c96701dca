#include "run_config.hpp"

#include "settings_manager.hpp"
#include "sync_profile.hpp"

RunConfigResult build_run_config(const SettingsManager& settings,
                                 const SyncProfile& profile,
                                 const std::string& host) {
  RunConfigResult result;

  const bool upload = settings.get<bool>("upload");
  const bool download = settings.get<bool>("download");
  if(upload && download) {
    result.error = "--upload and --download cannot be combined";
    return result;
  }

  const int bwlimit = settings.get<int>("bwlimit");
  if(bwlimit < 0) {
    result.error = "--bwlimit must not be negative";
    return result;
  }
  const int timeout_minutes = settings.get<int>("timeout");
  if(timeout_minutes < 0) {
    result.error = "--timeout must not be negative";
    return result;
  }

  RunConfig config;
  config.direction = download ? Direction::Download : Direction::Upload;
  config.dry_run = settings.get<bool>("dry_run");
  config.delete_extraneous = settings.get<bool>("delete");
  config.overwrite_always = settings.get<bool>("overwrite");
  config.use_checksum_compare = settings.get<bool>("checksum");
  if(bwlimit > 0) {
    config.bandwidth_limit_kbps = static_cast<unsigned>(bwlimit);
  }
  const unsigned minutes = timeout_minutes > 0
    ? static_cast<unsigned>(timeout_minutes)
    : profile.default_timeout_minutes;
  config.per_element_timeout = std::chrono::minutes(minutes);
  config.backup_area_mode = settings.get<bool>("backup_dir")
    ? BackupAreaMode::ReadOnly
    : BackupAreaMode::Shared;
  config.explicit_elements = settings.get<std::vector<std::string>>("item");
  config.cli_exclusion_patterns = settings.get<std::vector<std::string>>("exclude");
  config.local_root = profile.local_dir;
  config.remote_root = config.backup_area_mode == BackupAreaMode::Shared
    ? profile.backup_shared_dir
    : profile.backup_readonly_dir;

  config.config_exclusion_patterns = profile.exclusions;
  config.allowed_link_roots = profile.allowed_link_roots;
  config.permission_rules = profile.permission_rules;
  config.mount_point = profile.mount_point;
  config.lock_path = profile.lock_file;
  config.manifest_name = profile.symlinks_file;
  config.transfer_tool = profile.transfer_tool;
  config.required_free_mb = profile.required_free_mb;
  config.assume_yes = settings.get<bool>("yes");

  if(!config.local_root.is_absolute() || !config.remote_root.is_absolute()) {
    result.error = "local and remote roots must be absolute paths";
    return result;
  }

  result.host_context.host = host;
  for(const auto& entry : profile.directories) {
    if(entry.first == "default") {
      result.host_context.default_elements = entry.second;
    } else {
      result.host_context.host_elements[entry.first] = entry.second;
    }
  }
  result.config = std::move(config);
  return result;
}
