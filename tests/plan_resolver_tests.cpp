#include "plan_resolver.hpp"
#include "test_runner_utils.hpp"

namespace syncb::test {
namespace {

RunConfig base_config() {
  RunConfig cfg;
  cfg.local_root = "/srv/home/bob";
  cfg.remote_root = "/mnt/cloud/backup";
  return cfg;
}

HostContext host_context(const std::string& host) {
  HostContext ctx;
  ctx.host = host;
  ctx.default_elements = std::vector<std::string>{"Documents/", "notes.txt"};
  ctx.host_elements["laptop"] = {"Projects/"};
  return ctx;
}

bool test_explicit_elements_verbatim(TestContext& ctx) {
  auto cfg = base_config();
  cfg.explicit_elements = {"b.txt", "a/", "b.txt"};
  auto logger = ctx.logger();
  auto plan = resolve_plan(cfg, host_context("laptop"), logger.get());
  return !plan.fatal && plan.from_command_line && plan.rejected.empty() &&
         plan.elements == std::vector<std::string>{"b.txt", "a/", "b.txt"};
}

bool test_host_override_then_default(TestContext& ctx) {
  auto cfg = base_config();
  auto logger = ctx.logger();
  auto laptop = resolve_plan(cfg, host_context("laptop"), logger.get());
  auto desktop = resolve_plan(cfg, host_context("desktop"), logger.get());
  return laptop.elements == std::vector<std::string>{"Projects/"} &&
         desktop.elements == std::vector<std::string>{"Documents/", "notes.txt"} &&
         !laptop.from_command_line;
}

bool test_no_list_is_fatal(TestContext& ctx) {
  auto cfg = base_config();
  HostContext host;
  host.host = "desktop";
  auto logger = ctx.logger();
  auto plan = resolve_plan(cfg, host, logger.get());
  return plan.fatal && plan.fatal->code == ErrorCode::NoSyncList && plan.fatal->fatal();
}

bool test_parent_traversal_rejected(TestContext& ctx) {
  auto cfg = base_config();
  cfg.explicit_elements = {"docs/", "../etc/passwd", "notes.txt"};
  auto logger = ctx.logger();
  auto plan = resolve_plan(cfg, host_context("desktop"), logger.get());
  return !plan.fatal &&
         plan.rejected.size() == 1 &&
         plan.rejected[0].element == "../etc/passwd" &&
         plan.rejected[0].error.code == ErrorCode::PathTraversal &&
         plan.rejected[0].error.kind == ErrorKind::ConfigurationError &&
         plan.elements == std::vector<std::string>{"docs/", "notes.txt"};
}

bool test_absolute_inside_root_is_relativized(TestContext& ctx) {
  auto cfg = base_config();
  cfg.explicit_elements = {"/srv/home/bob/Music/", "/srv/home/bob/todo.md"};
  auto logger = ctx.logger();
  auto plan = resolve_plan(cfg, host_context("desktop"), logger.get());
  return !plan.fatal && plan.elements == std::vector<std::string>{"Music/", "todo.md"};
}

bool test_absolute_outside_root_is_fatal(TestContext& ctx) {
  auto cfg = base_config();
  cfg.explicit_elements = {"docs/", "/etc/hosts"};
  auto logger = ctx.logger();
  auto plan = resolve_plan(cfg, host_context("desktop"), logger.get());
  return plan.fatal && plan.fatal->code == ErrorCode::OutsideRoot && plan.elements.empty();
}

bool test_traversal_detection(TestContext&) {
  return has_parent_traversal("..") &&
         has_parent_traversal("a/../b") &&
         has_parent_traversal("a/..") &&
         has_parent_traversal("../") &&
         !has_parent_traversal("..hidden") &&
         !has_parent_traversal("a/b..c/d") &&
         !has_parent_traversal("docs/");
}

} // namespace

std::vector<TestCase> plan_resolver_tests() {
  return {
    {"plan_explicit_elements_verbatim", test_explicit_elements_verbatim},
    {"plan_host_override_then_default", test_host_override_then_default},
    {"plan_no_list_is_fatal", test_no_list_is_fatal},
    {"plan_parent_traversal_rejected", test_parent_traversal_rejected},
    {"plan_absolute_inside_root_is_relativized", test_absolute_inside_root_is_relativized},
    {"plan_absolute_outside_root_is_fatal", test_absolute_outside_root_is_fatal},
    {"plan_traversal_detection", test_traversal_detection}
  };
}

} // namespace syncb::test
