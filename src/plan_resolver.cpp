#include "plan_resolver.hpp"

#include <filesystem>

#include "utils.hpp"

bool has_parent_traversal(const std::string& element) {
  std::size_t start = 0;
  while(start <= element.size()) {
    auto end = element.find('/', start);
    if(end == std::string::npos) end = element.size();
    if(element.compare(start, end - start, "..") == 0 && end - start == 2) return true;
    start = end + 1;
  }
  return false;
}

namespace {

const std::vector<std::string>* pick_list(const HostContext& host, Logger* logger) {
  auto it = host.host_elements.find(host.host);
  if(it != host.host_elements.end()) {
    log_debug(logger, "Using element list configured for host '{}'", host.host);
    return &it->second;
  }
  if(host.default_elements) {
    log_debug(logger, "Using default element list");
    return &*host.default_elements;
  }
  return nullptr;
}

} // namespace

SyncPlan resolve_plan(const RunConfig& config, const HostContext& host, Logger* logger) {
  SyncPlan plan;
  const std::vector<std::string>* source = nullptr;
  if(!config.explicit_elements.empty()) {
    source = &config.explicit_elements;
    plan.from_command_line = true;
  } else {
    source = pick_list(host, logger);
  }
  if(!source || source->empty()) {
    plan.fatal = make_error(ErrorKind::FatalPrecondition, ErrorCode::NoSyncList,
                            "no elements configured for host '" + host.host + "' and no default list");
    log_error(logger, "{}", plan.fatal->message);
    return plan;
  }

  for(const auto& raw : *source) {
    if(raw.empty()) {
      log_warn(logger, "Ignoring empty element");
      continue;
    }
    if(has_parent_traversal(raw)) {
      auto error = make_error(ErrorKind::ConfigurationError, ErrorCode::PathTraversal,
                              "element '" + raw + "' contains a parent directory reference");
      log_error(logger, "{}", error.message);
      plan.rejected.push_back({raw, std::move(error)});
      continue;
    }

    std::filesystem::path element(raw);
    if(element.is_absolute()) {
      if(!path_within(element, config.local_root)) {
        plan.fatal = make_error(ErrorKind::FatalPrecondition, ErrorCode::OutsideRoot,
                                "element '" + raw + "' is outside " + config.local_root.string());
        log_error(logger, "{}", plan.fatal->message);
        plan.elements.clear();
        return plan;
      }
      auto root = config.local_root.lexically_normal();
      auto relative = element.lexically_normal().lexically_relative(root).generic_string();
      // A trailing separator marks a directory element; keep it.
      if(raw.back() == '/' && !relative.empty() && relative.back() != '/') relative += '/';
      if(relative.empty() || relative == "." || relative == "./") {
        auto error = make_error(ErrorKind::ConfigurationError, ErrorCode::OutsideRoot,
                                "element '" + raw + "' names the root itself");
        log_error(logger, "{}", error.message);
        plan.rejected.push_back({raw, std::move(error)});
        continue;
      }
      log_debug(logger, "Element {} re-anchored as {}", raw, relative);
      plan.elements.push_back(std::move(relative));
      continue;
    }

    plan.elements.push_back(raw);
  }
  return plan;
}
