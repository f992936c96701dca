#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "log.hpp"
#include "run_config.hpp"
#include "sync_error.hpp"

std::optional<SyncError> check_transfer_tool(const RunConfig& config, Logger* logger);
std::optional<SyncError> check_mount_point(const RunConfig& config, Logger* logger);
std::optional<SyncError> check_remote_root(const RunConfig& config, Logger* logger);
std::optional<SyncError> check_local_root(const RunConfig& config, Logger* logger);
std::optional<SyncError> check_free_space(const RunConfig& config, Logger* logger);

// Free megabytes on the filesystem holding `path`, if it can be queried.
std::optional<std::uint64_t> available_megabytes(const std::filesystem::path& path);

// Runs every check in order and stops at the first failure.
std::optional<SyncError> check_preconditions(const RunConfig& config, Logger* logger);
