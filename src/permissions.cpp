#include "permissions.hpp"

#include <fnmatch.h>

#include <vector>

namespace fs = std::filesystem;

namespace {

bool apply_one(const fs::path& path, unsigned mode, bool dry_run, Logger* logger, PermissionResult& result) {
  if(dry_run) {
    log_info(logger, "[dry-run] Would chmod {:o} {}", mode, path.string());
    result.applied++;
    return true;
  }
  std::error_code ec;
  fs::permissions(path, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
  if(ec) {
    log_warn(logger, "Unable to chmod {}: {}", path.string(), ec.message());
    result.failed++;
    return false;
  }
  log_debug(logger, "chmod {:o} {}", mode, path.string());
  result.applied++;
  return true;
}

bool kind_matches(const fs::file_status& status, bool directory) {
  if(fs::is_symlink(status)) return false;
  return directory ? fs::is_directory(status) : fs::is_regular_file(status);
}

} // namespace

bool is_glob_pattern(const std::string& pattern) {
  return pattern.find_first_of("*?[") != std::string::npos;
}

bool permission_pattern_matches(const std::string& pattern, const fs::path& relative) {
  if(pattern.find('/') == std::string::npos) {
    return ::fnmatch(pattern.c_str(), relative.filename().c_str(), 0) == 0;
  }
  return ::fnmatch(pattern.c_str(), relative.generic_string().c_str(), FNM_PATHNAME) == 0;
}

PermissionResult apply_permissions(const RunConfig& config, Logger* logger) {
  PermissionResult result;
  if(config.permission_rules.empty()) return result;
  log_info(logger, "Applying permissions");

  std::vector<const PermissionRule*> globs;
  for(const auto& rule : config.permission_rules) {
    if(is_glob_pattern(rule.pattern)) {
      globs.push_back(&rule);
      continue;
    }
    auto path = config.local_root / rule.pattern;
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if(ec || !kind_matches(status, rule.directory)) {
      log_debug(logger, "Permission rule {} matches nothing", rule.pattern);
      continue;
    }
    apply_one(path, rule.mode, config.dry_run, logger, result);
  }
  if(globs.empty()) return result;

  std::error_code ec;
  fs::recursive_directory_iterator it(config.local_root, fs::directory_options::skip_permission_denied, ec);
  if(ec) {
    log_warn(logger, "Unable to walk {}: {}", config.local_root.string(), ec.message());
    return result;
  }
  for(fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if(ec) {
      log_warn(logger, "Permission walk stopped: {}", ec.message());
      break;
    }
    auto status = it->symlink_status(ec);
    if(ec) continue;
    auto relative = it->path().lexically_relative(config.local_root);
    for(const auto* rule : globs) {
      if(kind_matches(status, rule->directory) && permission_pattern_matches(rule->pattern, relative)) {
        apply_one(it->path(), rule->mode, config.dry_run, logger, result);
        break;
      }
    }
  }
  return result;
}
