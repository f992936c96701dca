#include "process_runner.hpp"
#include "symlink_manifest.hpp"
#include "symlink_sync.hpp"
#include "transfer_executor.hpp"
#include "utils.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

namespace syncb::test {
namespace {

namespace fs = std::filesystem;

// Executor and synchronizer bound to one config, as the engine wires them.
struct LinkHarness {
  LinkHarness(const RunConfig& cfg, std::shared_ptr<Logger> logger)
    : config(cfg),
      runner(io, logger),
      executor(config, runner, logger),
      links(config, executor, logger) {}

  RunConfig config;
  asio::io_context io;
  ProcessRunner runner;
  TransferExecutor executor;
  SymlinkSynchronizer links;
  RunStats stats;
};

bool test_field_escaping(TestContext&) {
  const std::string tricky = "dir\\with\ttab\nand\rreturn";
  auto escaped = escape_manifest_field(tricky);
  auto back = unescape_manifest_field(escaped);
  return escaped == "dir\\\\with\\ttab\\nand\\rreturn" &&
         escaped.find('\t') == std::string::npos &&
         back && *back == tricky &&
         !unescape_manifest_field("bad\\q") &&
         !unescape_manifest_field("dangling\\");
}

bool test_record_format(TestContext&) {
  SymlinkRecord record{"sub dir/link\t1", "/home/$USERNAME/Crypto"};
  auto line = format_manifest_record(record);
  std::string error;
  auto parsed = parse_manifest_record(line, error);
  return line == "sub dir/link\\t1\t/home/$USERNAME/Crypto" &&
         parsed && parsed->link_path == record.link_path && parsed->target == record.target;
}

bool test_malformed_lines(TestContext&) {
  const std::string content =
    "good/link\t../target\n"
    "no-separator\n"
    "a\tb\tc\n"
    "empty-target\t\n"
    "\tempty-path\n"
    "bad\\qescape\tx\n"
    "\n"
    "other/link\t/opt/x\n";
  auto lines = parse_manifest(content);
  std::size_t ok = 0, bad = 0;
  for(const auto& line : lines) {
    if(line.record) ok++; else bad++;
  }
  return lines.size() == 7 && ok == 2 && bad == 5 && lines[1].line_number == 2;
}

bool test_target_normalization(TestContext&) {
  const fs::path root = "/home/bob";
  return normalize_link_target("/home/bob/Crypto", root) == "/home/$USERNAME/Crypto" &&
         normalize_link_target("/home/bob", root) == "/home/$USERNAME" &&
         normalize_link_target("/home/alice/Music/a.mp3", root) == "/home/$USERNAME/Music/a.mp3" &&
         normalize_link_target("/home/$USERNAME/x", root) == "/home/$USERNAME/x" &&
         normalize_link_target("../relative/path", root) == "../relative/path" &&
         normalize_link_target("/opt/tools/bin", root) == "/opt/tools/bin" &&
         normalize_link_target("/home/bobby/x", root) == "/home/$USERNAME/x" &&
         normalize_link_target("/data/me/y", "/data/me") == "/home/$USERNAME/y";
}

bool test_placeholder_resolution(TestContext&) {
  // A link written on alice's machine restored for bob.
  return resolve_link_target("/home/alice/Crypto", "/home/bob", "bob") == "/home/bob/Crypto" &&
         resolve_link_target("/home/$USERNAME/Crypto", "/home/bob", "bob") == "/home/bob/Crypto" &&
         resolve_link_target("/home/$USERNAME", "/home/bob", "bob") == "/home/bob" &&
         resolve_link_target("/mnt/$USERNAME/share", "/home/bob", "bob") == "/mnt/bob/share" &&
         resolve_link_target("../x", "/home/bob", "bob") == "../x";
}

bool test_foreign_home_restored_under_local_root(TestContext& ctx) {
  TempWorkspace ws("links_foreign_home");
  auto cfg = ws.config(Direction::Download, ws.copying_tool());
  write_file(ws.remote() / cfg.manifest_name, "subdir/link1\t/home/alice/Crypto\n");
  LinkHarness h(cfg, ctx.logger());
  auto error = h.links.restore_from_manifest(h.stats);
  auto link = ws.local() / "subdir" / "link1";
  std::error_code ec;
  return !error && fs::is_symlink(link, ec) &&
         fs::read_symlink(link, ec) == ws.local() / "Crypto" &&
         h.stats.links_created == 1 && h.stats.links_failed == 0 &&
         !fs::exists(ws.local() / cfg.manifest_name);
}

void build_link_tree(const TempWorkspace& ws) {
  write_file(ws.local() / "docs" / "real.txt", "real");
  write_file(ws.local() / "Crypto" / "vault", "v");
  make_link((ws.local() / "Crypto").string(), ws.local() / "docs" / "crypto");
  make_link("real.txt", ws.local() / "docs" / "relative");
  make_link("missing-target", ws.local() / "docs" / "sub" / "broken");
  make_link("docs/real.txt", ws.local() / "top-link");
}

bool test_round_trip(TestContext& ctx) {
  TempWorkspace ws("links_round_trip");
  build_link_tree(ws);
  auto before = tree_snapshot(ws.local());

  auto up = ws.config(Direction::Upload, ws.copying_tool());
  LinkHarness upload(up, ctx.logger());
  std::vector<std::string> elements = {"docs/", "top-link"};
  if(upload.links.generate_manifest(elements, upload.stats)) return false;
  if(upload.stats.links_detected != 4) return false;
  if(!fs::exists(ws.remote() / up.manifest_name)) return false;

  for(const auto& name : {"docs/crypto", "docs/relative", "docs/sub/broken", "top-link"}) {
    fs::remove(ws.local() / name);
  }

  auto down = ws.config(Direction::Download, ws.copying_tool());
  LinkHarness download(down, ctx.logger());
  if(download.links.restore_from_manifest(download.stats)) return false;
  return download.stats.links_created == 4 && download.stats.links_failed == 0 &&
         tree_snapshot(ws.local()) == before;
}

bool test_restore_is_idempotent(TestContext& ctx) {
  TempWorkspace ws("links_idempotent");
  auto cfg = ws.config(Direction::Download, ws.copying_tool());
  write_file(ws.remote() / cfg.manifest_name,
             "a/one\t../b\n"
             "a/two\t/home/$USERNAME/docs\n"
             "three\trelative-target\n");
  LinkHarness first(cfg, ctx.logger());
  if(first.links.restore_from_manifest(first.stats)) return false;
  LinkHarness second(cfg, ctx.logger());
  if(second.links.restore_from_manifest(second.stats)) return false;
  return first.stats.links_created == 3 &&
         second.stats.links_created == 0 && second.stats.links_existing == 3;
}

bool test_changed_target_is_replaced(TestContext& ctx) {
  TempWorkspace ws("links_replace");
  auto cfg = ws.config(Direction::Download, ws.copying_tool());
  make_link("old-target", ws.local() / "link");
  write_file(ws.remote() / cfg.manifest_name, "link\tnew-target\n");
  LinkHarness h(cfg, ctx.logger());
  if(h.links.restore_from_manifest(h.stats)) return false;
  return fs::read_symlink(ws.local() / "link") == "new-target" && h.stats.links_created == 1;
}

bool test_unsafe_targets_rejected(TestContext& ctx) {
  TempWorkspace ws("links_unsafe");
  auto cfg = ws.config(Direction::Download, ws.copying_tool());
  fs::create_directories(ws.root() / "shared");
  cfg.allowed_link_roots = {ws.root() / "shared"};
  write_file(ws.remote() / cfg.manifest_name,
             "evil\t/etc/passwd\n"
             "climb\t../../../../etc/shadow\n"
             "../escape\tok\n"
             "allowed\t" + (ws.root() / "shared" / "data").string() + "\n");
  LinkHarness h(cfg, ctx.logger());
  if(h.links.restore_from_manifest(h.stats)) return false;
  std::error_code ec;
  return h.stats.links_failed == 3 && h.stats.links_created == 1 &&
         !fs::is_symlink(ws.local() / "evil", ec) &&
         !fs::is_symlink(ws.local() / "climb", ec) &&
         !fs::is_symlink(ws.root() / "escape", ec) &&
         fs::is_symlink(ws.local() / "allowed", ec);
}

bool test_existing_file_blocks_link(TestContext& ctx) {
  TempWorkspace ws("links_occupied");
  auto cfg = ws.config(Direction::Download, ws.copying_tool());
  write_file(ws.local() / "occupied", "regular file");
  write_file(ws.remote() / cfg.manifest_name, "occupied\ttarget\n");
  LinkHarness h(cfg, ctx.logger());
  if(h.links.restore_from_manifest(h.stats)) return false;
  return h.stats.links_failed == 1 && read_file(ws.local() / "occupied") == "regular file";
}

bool test_dry_run_restore_changes_nothing(TestContext& ctx) {
  TempWorkspace ws("links_dry_run");
  auto cfg = ws.config(Direction::Download, ws.recording_tool());
  cfg.dry_run = true;
  make_link("stale", ws.local() / "kept");
  write_file(ws.remote() / cfg.manifest_name, "kept\tfresh\nnew/dir/link\ttarget\n");
  auto before = tree_snapshot(ws.local());
  LinkHarness h(cfg, ctx.logger());
  if(h.links.restore_from_manifest(h.stats)) return false;
  return tree_snapshot(ws.local()) == before && ws.tool_invocations() == 0 &&
         h.stats.links_created == 2;
}

bool test_no_links_no_manifest(TestContext& ctx) {
  TempWorkspace ws("links_none");
  write_file(ws.local() / "docs" / "plain.txt", "p");
  auto cfg = ws.config(Direction::Upload, ws.recording_tool());
  LinkHarness h(cfg, ctx.logger());
  auto error = h.links.generate_manifest({"docs/"}, h.stats);
  return !error && h.stats.links_detected == 0 && ws.tool_invocations() == 0 &&
         ctx.logs.contains("No symbolic links found");
}

bool test_unchanged_manifest_not_resent(TestContext& ctx) {
  TempWorkspace ws("links_unchanged");
  build_link_tree(ws);
  auto cfg = ws.config(Direction::Upload, ws.copying_tool());
  LinkHarness first(cfg, ctx.logger());
  if(first.links.generate_manifest({"docs/"}, first.stats)) return false;
  auto after_first = ws.tool_invocations();
  LinkHarness second(cfg, ctx.logger());
  if(second.links.generate_manifest({"docs/"}, second.stats)) return false;
  auto shipped = read_file(ws.remote() / cfg.manifest_name);
  return after_first == 1 && ws.tool_invocations() == 1 &&
         sha256_hex(shipped) == sha256_hex(serialize_manifest(second.links.scan({"docs/"})));
}

bool test_manifest_transfer_failure(TestContext& ctx) {
  TempWorkspace ws("links_transfer_failure");
  build_link_tree(ws);
  auto cfg = ws.config(Direction::Upload, ws.write_tool("fail.sh", "exit 12\n"));
  LinkHarness h(cfg, ctx.logger());
  auto error = h.links.generate_manifest({"docs/"}, h.stats);
  return error && error->code == ErrorCode::ManifestTransfer;
}

} // namespace

std::vector<TestCase> symlink_tests() {
  return {
    {"manifest_field_escaping", test_field_escaping},
    {"manifest_record_format", test_record_format},
    {"manifest_malformed_lines", test_malformed_lines},
    {"manifest_target_normalization", test_target_normalization},
    {"manifest_placeholder_resolution", test_placeholder_resolution},
    {"links_foreign_home_restored_under_local_root", test_foreign_home_restored_under_local_root},
    {"links_round_trip", test_round_trip},
    {"links_restore_is_idempotent", test_restore_is_idempotent},
    {"links_changed_target_is_replaced", test_changed_target_is_replaced},
    {"links_unsafe_targets_rejected", test_unsafe_targets_rejected},
    {"links_existing_file_blocks_link", test_existing_file_blocks_link},
    {"links_dry_run_restore_changes_nothing", test_dry_run_restore_changes_nothing},
    {"links_no_links_no_manifest", test_no_links_no_manifest},
    {"links_unchanged_manifest_not_resent", test_unchanged_manifest_not_resent},
    {"links_manifest_transfer_failure", test_manifest_transfer_failure}
  };
}

} // namespace syncb::test
