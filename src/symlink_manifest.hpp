#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Stands in for "this machine's home tree" inside stored link targets.
inline const std::string kHomePlaceholder = "/home/$USERNAME";
inline const std::string kUserPlaceholder = "$USERNAME";

struct SymlinkRecord {
  std::string link_path;   // relative to the local root, '/' separated
  std::string target;      // raw link text, possibly with the placeholder
};

// Backslash, TAB, LF and CR are escaped so one record is always one line
// with exactly one field separator.
std::string escape_manifest_field(const std::string& value);
std::optional<std::string> unescape_manifest_field(const std::string& value);

std::string format_manifest_record(const SymlinkRecord& record);
std::optional<SymlinkRecord> parse_manifest_record(const std::string& line, std::string& error);

std::string serialize_manifest(const std::vector<SymlinkRecord>& records);

struct ManifestLine {
  std::size_t line_number = 0;
  std::optional<SymlinkRecord> record;
  std::string error;
};

// Blank lines are dropped; malformed ones come back with `error` set.
std::vector<ManifestLine> parse_manifest(const std::string& content);

// Rewrites a target under `local_root` or under /home/<user>/ so it starts
// with the home placeholder. Anything else is returned untouched.
std::string normalize_link_target(const std::string& raw, const std::filesystem::path& local_root);

// Inverse of normalize_link_target on the receiving machine: the placeholder
// prefix becomes `local_root`, any leftover $USERNAME becomes `user`.
std::string resolve_link_target(const std::string& stored,
                                const std::filesystem::path& local_root,
                                const std::string& user);

// A relative, '..'-free path that names something below the root.
bool is_safe_link_path(const std::string& link_path);
