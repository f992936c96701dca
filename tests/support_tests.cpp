#include "notifier.hpp"
#include "permissions.hpp"
#include "preconditions.hpp"
#include "run_reporter.hpp"
#include "utils.hpp"
#include "test_runner_utils.hpp"

#include <limits>

namespace syncb::test {
namespace {

namespace fs = std::filesystem;

unsigned mode_of(const fs::path& path) {
  return static_cast<unsigned>(fs::status(path).permissions() & fs::perms::mask);
}

bool test_summary_lists_every_counter(TestContext& ctx) {
  RunStats stats;
  stats.elements_processed = 3;
  stats.files_transferred = 7;
  stats.links_failed = 1;
  RunConfig cfg;
  cfg.direction = Direction::Download;
  cfg.dry_run = true;
  auto lines = render_summary(stats, cfg);
  auto has = [&](const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  };
  auto logger = ctx.logger();
  report_summary(stats, cfg, logger.get());
  return has("SUMMARY (download, dry-run)") &&
         has("Elements processed: 3") && has("Files transferred:  7") &&
         has("Files deleted:      0") && has("Links detected:     0") &&
         has("Links created:      0") && has("Links existing:     0") &&
         has("Links failed:       1") && has("Sync errors:        0") &&
         has("Elapsed:") && has("Average rate:") &&
         ctx.logs.contains("Elements processed: 3");
}

bool test_rate_and_elapsed(TestContext&) {
  RunStats instant;
  instant.files_transferred = 5;
  RunStats longer;
  longer.files_transferred = 120;
  longer.elapsed = std::chrono::seconds(3725);
  return transfer_rate(instant) == 5.0 &&
         format_elapsed(instant) == "0s" &&
         format_elapsed(longer) == "1h 2m 5s" &&
         transfer_rate(longer) > 0.032 && transfer_rate(longer) < 0.033;
}

bool test_permission_patterns(TestContext&) {
  return is_glob_pattern("*.sh") && is_glob_pattern("file?.txt") && !is_glob_pattern("bin") &&
         permission_pattern_matches("*.sh", "tools/deep/run.sh") &&
         !permission_pattern_matches("*.sh", "tools/run.shx") &&
         permission_pattern_matches("tools/*.sh", "tools/run.sh") &&
         !permission_pattern_matches("tools/*.sh", "tools/deep/run.sh");
}

bool test_permissions_applied(TestContext& ctx) {
  TempWorkspace ws("support_permissions");
  write_file(ws.local() / "tools" / "run.sh", "#!/bin/sh\n");
  write_file(ws.local() / "tools" / "readme.txt", "r");
  write_file(ws.local() / "secret.key", "k");
  make_link("tools/run.sh", ws.local() / "linked.sh");
  ::chmod((ws.local() / "tools" / "readme.txt").c_str(), 0644);

  RunConfig cfg = ws.config(Direction::Download, "sh");
  cfg.permission_rules = {
    {"*.sh", 0700, false},
    {"secret.key", 0600, false},
    {"tools", 0750, true},
    {"missing.txt", 0600, false}
  };
  auto logger = ctx.logger();
  auto result = apply_permissions(cfg, logger.get());
  return result.applied == 3 && result.failed == 0 &&
         mode_of(ws.local() / "tools" / "run.sh") == 0700 &&
         mode_of(ws.local() / "secret.key") == 0600 &&
         mode_of(ws.local() / "tools") == 0750 &&
         mode_of(ws.local() / "tools" / "readme.txt") == 0644 &&
         fs::is_symlink(ws.local() / "linked.sh");
}

bool test_permissions_dry_run(TestContext& ctx) {
  TempWorkspace ws("support_permissions_dry");
  write_file(ws.local() / "run.sh", "#!/bin/sh\n");
  ::chmod((ws.local() / "run.sh").c_str(), 0644);
  RunConfig cfg = ws.config(Direction::Download, "sh");
  cfg.dry_run = true;
  cfg.permission_rules = {{"*.sh", 0700, false}};
  auto logger = ctx.logger();
  auto result = apply_permissions(cfg, logger.get());
  return result.applied == 1 && mode_of(ws.local() / "run.sh") == 0644 &&
         ctx.logs.contains("[dry-run] Would chmod 700");
}

bool test_remote_root_checks(TestContext& ctx) {
  TempWorkspace ws("support_remote_root");
  auto logger = ctx.logger();
  RunConfig cfg = ws.config(Direction::Upload, "sh");
  auto ok = check_remote_root(cfg, logger.get());
  bool probe_removed = std::distance(fs::directory_iterator(ws.remote()), fs::directory_iterator()) == 0;

  cfg.remote_root = ws.root() / "absent";
  auto missing = check_remote_root(cfg, logger.get());
  return !ok && probe_removed &&
         missing && missing->code == ErrorCode::DestinationUnreachable && missing->fatal();
}

bool test_mount_point_checks(TestContext& ctx) {
  TempWorkspace ws("support_mount_point");
  auto logger = ctx.logger();
  RunConfig cfg = ws.config(Direction::Upload, "sh");
  auto unconfigured = check_mount_point(cfg, logger.get());

  cfg.mount_point = ws.root() / "mnt";
  fs::create_directories(cfg.mount_point);
  auto empty = check_mount_point(cfg, logger.get());

  write_file(cfg.mount_point / "marker", "m");
  auto mounted = check_mount_point(cfg, logger.get());
  return !unconfigured && !mounted &&
         empty && empty->code == ErrorCode::DestinationUnreachable &&
         empty->message.find("is empty") != std::string::npos;
}

bool test_local_root_checks(TestContext& ctx) {
  TempWorkspace ws("support_local_root");
  auto logger = ctx.logger();
  RunConfig cfg = ws.config(Direction::Download, "sh");
  cfg.local_root = ws.root() / "fresh" / "home";

  cfg.dry_run = true;
  auto simulated = check_local_root(cfg, logger.get());
  bool untouched = !fs::exists(cfg.local_root);

  cfg.dry_run = false;
  auto created = check_local_root(cfg, logger.get());
  bool exists = fs::is_directory(cfg.local_root);

  RunConfig upload = ws.config(Direction::Upload, "sh");
  upload.local_root = ws.root() / "nowhere";
  auto refused = check_local_root(upload, logger.get());
  return !simulated && untouched && !created && exists &&
         refused && refused->code == ErrorCode::DestinationUnreachable;
}

bool test_free_space_and_tool(TestContext& ctx) {
  TempWorkspace ws("support_free_space");
  auto logger = ctx.logger();
  RunConfig cfg = ws.config(Direction::Upload, "sh");
  auto tool_ok = check_transfer_tool(cfg, logger.get());
  cfg.transfer_tool = "syncb-no-such-transfer-tool";
  auto tool_missing = check_transfer_tool(cfg, logger.get());

  cfg.required_free_mb = std::numeric_limits<std::uint64_t>::max();
  auto too_little = check_free_space(cfg, logger.get());
  cfg.dry_run = true;
  auto skipped = check_free_space(cfg, logger.get());
  return !tool_ok && tool_missing && tool_missing->code == ErrorCode::ToolMissing &&
         available_megabytes(ws.remote()).has_value() &&
         too_little && too_little->code == ErrorCode::InsufficientSpace &&
         !skipped;
}

bool test_log_notifier_levels(TestContext& ctx) {
  auto logger = ctx.logger("notify");
  LogNotifier notifier(logger);
  notifier.notify("syncb", "all good", NotifySeverity::Success);
  notifier.notify("syncb", "careful", NotifySeverity::Warning);
  notifier.notify("syncb", "broken", NotifySeverity::Error);
  return ctx.logs.contains("notify:success: [syncb] all good") &&
         ctx.logs.contains("notify:warn: [syncb] careful") &&
         ctx.logs.contains("notify:error: [syncb] broken");
}

bool test_path_helpers(TestContext&) {
  TempWorkspace ws("support_paths");
  auto file = ws.root() / "data.txt";
  write_file(file, "abc");
  auto digest = sha256_file_hex(file);
  return path_within("/srv/home/bob/docs", "/srv/home/bob") &&
         !path_within("/srv/home/bobby", "/srv/home/bob") &&
         !path_within("/srv/home/bob/../alice", "/srv/home/bob") &&
         sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" &&
         digest && *digest == sha256_hex("abc") &&
         !sha256_file_hex(ws.root() / "absent").has_value() &&
         expand_home("~/x") == home_directory() / "x" &&
         expand_home("/abs") == "/abs";
}

bool test_temp_file_lifetime(TestContext&) {
  fs::path kept;
  {
    TempFile temp("syncb_test_");
    if(!temp.valid() || !temp.write("payload")) return false;
    kept = temp.path();
    if(read_file(kept) != "payload") return false;
  }
  return !fs::exists(kept);
}

} // namespace

std::vector<TestCase> support_tests() {
  return {
    {"report_summary_lists_every_counter", test_summary_lists_every_counter},
    {"report_rate_and_elapsed", test_rate_and_elapsed},
    {"permissions_patterns", test_permission_patterns},
    {"permissions_applied", test_permissions_applied},
    {"permissions_dry_run", test_permissions_dry_run},
    {"preconditions_remote_root", test_remote_root_checks},
    {"preconditions_mount_point", test_mount_point_checks},
    {"preconditions_local_root", test_local_root_checks},
    {"preconditions_free_space_and_tool", test_free_space_and_tool},
    {"notifier_log_levels", test_log_notifier_levels},
    {"utils_path_helpers", test_path_helpers},
    {"utils_temp_file_lifetime", test_temp_file_lifetime}
  };
}

} // namespace syncb::test
