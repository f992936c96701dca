#include "run_reporter.hpp"

#include <algorithm>
#include <chrono>

double transfer_rate(const RunStats& stats) {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(stats.elapsed).count();
  return static_cast<double>(stats.files_transferred) / static_cast<double>(std::max<long long>(seconds, 1));
}

std::string format_elapsed(const RunStats& stats) {
  auto total = std::chrono::duration_cast<std::chrono::seconds>(stats.elapsed).count();
  auto hours = total / 3600;
  auto minutes = (total % 3600) / 60;
  auto seconds = total % 60;
  if(hours > 0) return fmt::format("{}h {}m {}s", hours, minutes, seconds);
  if(minutes > 0) return fmt::format("{}m {}s", minutes, seconds);
  return fmt::format("{}s", seconds);
}

std::vector<std::string> render_summary(const RunStats& stats, const RunConfig& config) {
  std::vector<std::string> lines;
  const std::string rule(50, '=');
  lines.push_back(rule);
  lines.push_back(fmt::format("SUMMARY ({}{})", to_string(config.direction), config.dry_run ? ", dry-run" : ""));
  lines.push_back(rule);
  lines.push_back(fmt::format("Elements processed: {}", stats.elements_processed));
  lines.push_back(fmt::format("Files transferred:  {}", stats.files_transferred));
  lines.push_back(fmt::format("Files deleted:      {}", stats.files_deleted));
  lines.push_back(fmt::format("Links detected:     {}", stats.links_detected));
  lines.push_back(fmt::format("Links created:      {}", stats.links_created));
  lines.push_back(fmt::format("Links existing:     {}", stats.links_existing));
  lines.push_back(fmt::format("Links failed:       {}", stats.links_failed));
  lines.push_back(fmt::format("Sync errors:        {}", stats.sync_errors));
  lines.push_back(fmt::format("Elapsed:            {}", format_elapsed(stats)));
  lines.push_back(fmt::format("Average rate:       {:.2f} files/s", transfer_rate(stats)));
  lines.push_back(rule);
  return lines;
}

void report_summary(const RunStats& stats, const RunConfig& config, Logger* logger) {
  for(const auto& line : render_summary(stats, config)) {
    print_out(logger, "{}", line);
  }
}
