#pragma once

#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "run_config.hpp"
#include "sync_error.hpp"

struct RejectedElement {
  std::string element;
  SyncError error;
};

struct SyncPlan {
  std::vector<std::string> elements;
  std::vector<RejectedElement> rejected;
  // Set when the whole invocation must stop (no list, element outside root).
  std::optional<SyncError> fatal;
  bool from_command_line = false;
};

// Picks the elements for this run: explicit ones verbatim, otherwise the
// host override, otherwise the default list. Each element is validated; a
// rejected element is reported but never stops the others.
SyncPlan resolve_plan(const RunConfig& config, const HostContext& host, Logger* logger = nullptr);

bool has_parent_traversal(const std::string& element);
