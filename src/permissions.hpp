#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "log.hpp"
#include "run_config.hpp"

struct PermissionResult {
  std::size_t applied = 0;
  std::size_t failed = 0;
};

bool is_glob_pattern(const std::string& pattern);

// True when `relative` (generic form) is selected by `pattern`. A pattern
// without '/' is matched against the last component only.
bool permission_pattern_matches(const std::string& pattern, const std::filesystem::path& relative);

// Applies config.permission_rules below the local root. Symlinks are skipped;
// in dry-run nothing changes and each intended chmod is logged.
PermissionResult apply_permissions(const RunConfig& config, Logger* logger);
