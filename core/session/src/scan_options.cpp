#include "rigtrace/session/scan_options.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace rigtrace::session {
namespace {

YAML::Node LoadDocument(const std::filesystem::path& path) {
  try {
    return YAML::LoadFile(path.string());
  } catch (const YAML::Exception& ex) {
    throw std::runtime_error(fmt::format("Could not read scan options {}: {}", path.string(), ex.what()));
  }
}

}  // namespace

ScanOptions LoadScanOptions(const std::filesystem::path& path) {
  const YAML::Node root = LoadDocument(path);

  ScanOptions options;
  if (root.IsNull()) {
    return options;
  }
  if (!root.IsMap()) {
    throw std::runtime_error(fmt::format("Scan options {} must be a mapping", path.string()));
  }

  try {
    if (const YAML::Node workers = root["workers"]) {
      const int count = workers.as<int>();
      if (count < 0) {
        throw std::runtime_error(fmt::format("workers must not be negative, got {}", count));
      }
      options.workers = static_cast<std::size_t>(count);
    }
    if (const YAML::Node align = root["align_time_bases"]) {
      options.align_time_bases = align.as<bool>();
    }
    if (const YAML::Node adjacent = root["probe_adjacent"]) {
      options.probe_adjacent = adjacent.as<bool>();
    }
    if (const YAML::Node ambiguity = root["detect_ambiguity"]) {
      options.detect_ambiguity = ambiguity.as<bool>();
    }
    if (const YAML::Node symlinks = root["follow_symlinks"]) {
      options.follow_symlinks = symlinks.as<bool>();
    }
    if (const YAML::Node depth = root["max_depth"]) {
      options.max_depth = depth.as<int>();
    }
    if (const YAML::Node level = root["log_level"]) {
      options.log_level = level.as<std::string>();
    }
  } catch (const YAML::Exception& ex) {
    throw std::runtime_error(fmt::format("Invalid scan options in {}: {}", path.string(), ex.what()));
  }

  return options;
}

std::size_t ResolveWorkerCount(const ScanOptions& options) {
  if (options.workers > 0) {
    return options.workers;
  }
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

}  // namespace rigtrace::session
