#pragma once

#include <chrono>
#include <cstddef>

struct RunStats {
  std::size_t elements_processed = 0;
  std::size_t files_transferred = 0;
  std::size_t files_deleted = 0;
  std::size_t links_detected = 0;
  std::size_t links_created = 0;
  std::size_t links_existing = 0;
  std::size_t links_failed = 0;
  std::size_t sync_errors = 0;
  std::chrono::steady_clock::duration elapsed{};

  std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();

  void finish() { elapsed = std::chrono::steady_clock::now() - started_at; }
};
