#pragma once

#include <string>
#include <vector>

#include "log.hpp"
#include "run_config.hpp"
#include "run_stats.hpp"

// Average rate in files per second; runs shorter than a second count as one.
double transfer_rate(const RunStats& stats);

std::string format_elapsed(const RunStats& stats);

// Summary lines. Every counter is always present, zero or not.
std::vector<std::string> render_summary(const RunStats& stats, const RunConfig& config);

void report_summary(const RunStats& stats, const RunConfig& config, Logger* logger);
