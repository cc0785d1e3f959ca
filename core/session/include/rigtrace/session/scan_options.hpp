#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>

namespace rigtrace::session {

struct ScanOptions {
  // Worker threads for classification and decoding; 0 uses the hardware concurrency.
  std::size_t workers = 0;
  bool align_time_bases = true;
  // Look beside the root when nothing inside it matches.
  bool probe_adjacent = true;
  // Run every classifier on every file to report ambiguous matches; otherwise first match wins.
  bool detect_ambiguity = true;
  bool follow_symlinks = true;
  int max_depth = -1;
  std::string log_level = "info";
  // Set by another thread to abandon the scan. The result is then flagged partial.
  const std::atomic<bool>* cancel = nullptr;
};

// Reads a YAML scan configuration. Unknown keys are ignored; throws std::runtime_error on a
// document that cannot be read or a value of the wrong type.
ScanOptions LoadScanOptions(const std::filesystem::path& path);

std::size_t ResolveWorkerCount(const ScanOptions& options);

}  // namespace rigtrace::session
