#include <atomic>
#include <csignal>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "rigtrace/common/version.hpp"
#include "rigtrace/interp/errors.hpp"
#include "rigtrace/interp/log_types.hpp"
#include "rigtrace/interp/type_registry.hpp"
#include "rigtrace/session/experiment.hpp"
#include "rigtrace/session/scan_options.hpp"

namespace {

std::atomic<bool> g_cancel{false};

void HandleInterrupt(int) {
  g_cancel = true;
}

void PrintInterpreter(const rigtrace::interp::Interpreter& interpreter) {
  using rigtrace::interp::Facet;
  spdlog::info("  [{}] {} ({} records)", interpreter.tag(), interpreter.source_path().string(), interpreter.size());
  if (interpreter.Has(Facet::kTimeBase)) {
    const auto& time_base = interpreter.time_base();
    if (interpreter.alignment_epoch_ns().has_value()) {
      spdlog::info("    time base: {:.3f} s, starts {:.3f} s after epoch",
                   time_base.duration_ns() * 1e-9,
                   interpreter.alignment_offset_ns() * 1e-9);
    } else {
      spdlog::info("    time base: {:.3f} s", time_base.duration_ns() * 1e-9);
    }
  }
  if (interpreter.Has(Facet::kConfigProvenance)) {
    const auto& config = interpreter.config_provenance();
    spdlog::info("    config: {} ({} nodes)", config.config_file.string(), config.nodes.size());
  }
  if (interpreter.Has(Facet::kVersionProvenance)) {
    const auto& version = interpreter.version_provenance();
    spdlog::info("    commit: {}", version.commit().value_or("unknown"));
    for (const auto& warning : version.warnings) {
      spdlog::warn("    {}", warning);
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"rigtrace experiment log scanner"};
  std::string root_path;
  std::string config_path;
  std::size_t workers = 0;
  bool no_align = false;
  std::string log_level;
  app.add_option("--root", root_path, "Experiment directory to scan")->required();
  app.add_option("--config", config_path, "YAML scan configuration");
  app.add_option("--workers", workers, "Worker threads (0 = hardware concurrency)");
  app.add_flag("--no-align", no_align, "Keep raw timestamps instead of aligning time bases");
  app.add_option("--log-level", log_level, "trace, debug, info, warn, error");

  CLI11_PARSE(app, argc, argv);

  rigtrace::session::ScanOptions options;
  try {
    if (!config_path.empty()) {
      options = rigtrace::session::LoadScanOptions(config_path);
    }
  } catch (const std::exception& ex) {
    spdlog::error("{}", ex.what());
    return 2;
  }
  if (app.count("--workers") > 0) {
    options.workers = workers;
  }
  if (no_align) {
    options.align_time_bases = false;
  }
  if (!log_level.empty()) {
    options.log_level = log_level;
  }
  spdlog::set_level(spdlog::level::from_str(options.log_level));

  spdlog::info("rigtrace version: {}", rigtrace::common::version());

  auto registry = std::make_shared<rigtrace::interp::TypeRegistry>();
  rigtrace::interp::RegisterBuiltinLogTypes(*registry);

  std::signal(SIGINT, HandleInterrupt);
  options.cancel = &g_cancel;

  try {
    const auto experiment = rigtrace::session::Experiment::Scan(root_path, registry, options);

    for (const auto& [session, interpreters] : experiment.sessions()) {
      spdlog::info("Session {}: {} logs", session, interpreters.size());
      for (const auto* interpreter : interpreters) {
        PrintInterpreter(*interpreter);
      }
    }
    for (const auto& diagnostic : experiment.ambiguous()) {
      spdlog::warn("Ambiguous: {} matches {}", diagnostic.path.string(), fmt::join(diagnostic.candidates, ", "));
    }
    for (const auto& diagnostic : experiment.errored()) {
      spdlog::warn("Errored: {}: {}", diagnostic.path.string(), diagnostic.reason);
    }
    spdlog::info("{} files scanned, {} unclassified", experiment.scanned_file_count(), experiment.unclassified().size());

    if (experiment.is_partial()) {
      spdlog::warn("Scan interrupted; results are partial");
      return 130;
    }
  } catch (const rigtrace::interp::RegistryError& ex) {
    spdlog::error("{}", ex.what());
    return 3;
  } catch (const std::exception& ex) {
    spdlog::error("{}", ex.what());
    return 1;
  }

  return 0;
}
