#include "rigtrace/session/experiment.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <limits>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "rigtrace/interp/errors.hpp"
#include "rigtrace/interp/provenance.hpp"
#include "rigtrace/io/errors.hpp"
#include "rigtrace/io/log_file.hpp"
#include "rigtrace/session/directory_walk.hpp"

namespace rigtrace::session {
namespace {

struct FileOutcome {
  bool processed = false;
  std::unique_ptr<interp::Interpreter> interpreter;
  std::optional<FileDiagnostic> diagnostic;
};

FileDiagnostic Diagnostic(const std::filesystem::path& path,
                          DiagnosticKind kind,
                          std::string reason,
                          std::vector<interp::TypeTag> candidates = {}) {
  return FileDiagnostic{path, kind, std::move(reason), std::move(candidates)};
}

// Every matching tag when ambiguity is detected, otherwise the first match only.
std::set<interp::TypeTag> CandidateTags(io::LogFile& file,
                                        const interp::TypeRegistry& registry,
                                        const ScanOptions& options,
                                        std::vector<std::string>* rejections) {
  std::set<interp::TypeTag> tags;
  if (options.detect_ambiguity) {
    tags = registry.ClassifyAll(file, rejections);
  } else if (auto tag = registry.Classify(file)) {
    tags.insert(std::move(*tag));
  }
  return tags;
}

// Classify, decode and compose one file. Touches no shared state besides the companion store.
FileOutcome ProcessFile(const WalkedFile& walked,
                        const interp::TypeRegistry& registry,
                        const ScanOptions& options,
                        interp::CompanionStore& store) {
  FileOutcome outcome;
  outcome.processed = true;

  io::LogFile file(walked.path, walked.size_bytes);
  std::vector<std::string> rejections;
  const std::set<interp::TypeTag> tags = CandidateTags(file, registry, options, &rejections);

  if (tags.empty()) {
    const std::string reason =
        rejections.empty() ? "no registered log type matched" : fmt::format("{}", fmt::join(rejections, "; "));
    outcome.diagnostic = Diagnostic(walked.path, DiagnosticKind::kUnclassifiedFile, reason);
    return outcome;
  }
  if (tags.size() > 1) {
    outcome.diagnostic = Diagnostic(walked.path,
                                    DiagnosticKind::kAmbiguousMatch,
                                    fmt::format("matched {} log types", tags.size()),
                                    std::vector<interp::TypeTag>(tags.begin(), tags.end()));
    return outcome;
  }

  const interp::TypeTag& tag = *tags.begin();
  try {
    outcome.interpreter = interp::Interpreter::Build(registry.at(tag), walked.path, store);
  } catch (const io::CorruptLogError& ex) {
    outcome.diagnostic = Diagnostic(walked.path, DiagnosticKind::kCorruptLog, ex.what(), {tag});
  } catch (const std::exception& ex) {
    // Decoders are pluggable; anything they throw is a failure of this file only.
    outcome.diagnostic = Diagnostic(
        walked.path, DiagnosticKind::kCorruptLog, fmt::format("decoder failed: {}", ex.what()), {tag});
  }
  return outcome;
}

bool Cancelled(const ScanOptions& options) {
  return options.cancel != nullptr && options.cancel->load();
}

// Outcomes come back in the order of files. Slots left unprocessed mean the scan was cancelled.
std::vector<FileOutcome> ProcessFiles(const std::vector<WalkedFile>& files,
                                      const interp::TypeRegistry& registry,
                                      const ScanOptions& options,
                                      interp::CompanionStore& store) {
  std::vector<FileOutcome> outcomes(files.size());
  if (files.empty()) {
    return outcomes;
  }

  std::atomic<std::size_t> next_index{0};
  std::exception_ptr failure;
  std::mutex failure_mutex;

  auto worker = [&]() {
    try {
      while (!Cancelled(options)) {
        const std::size_t index = next_index.fetch_add(1);
        if (index >= files.size()) {
          return;
        }
        outcomes[index] = ProcessFile(files[index], registry, options, store);
      }
    } catch (...) {
      std::lock_guard<std::mutex> lock(failure_mutex);
      if (!failure) {
        failure = std::current_exception();
      }
      next_index = files.size();
    }
  };

  const std::size_t worker_count = std::min(ResolveWorkerCount(options), files.size());
  std::vector<std::thread> threads;
  threads.reserve(worker_count - 1);
  try {
    for (std::size_t i = 1; i < worker_count; ++i) {
      threads.emplace_back(worker);
    }
  } catch (...) {
    next_index = files.size();
    for (std::thread& thread : threads) {
      thread.join();
    }
    throw;
  }
  worker();
  for (std::thread& thread : threads) {
    thread.join();
  }

  if (failure) {
    std::rethrow_exception(failure);
  }
  return outcomes;
}

std::string SessionKey(const std::filesystem::path& file, const std::filesystem::path& base) {
  const std::filesystem::path relative = file.parent_path().lexically_relative(base);
  if (relative.empty() || relative == ".") {
    return ".";
  }
  return relative.begin()->string();
}

std::filesystem::path ResolveRoot(const std::filesystem::path& root) {
  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) {
    throw std::runtime_error(fmt::format("Experiment root does not exist: {}", root.string()));
  }
  std::filesystem::path resolved = std::filesystem::canonical(root, ec);
  if (ec) {
    throw std::runtime_error(fmt::format("Could not resolve experiment root {}: {}", root.string(), ec.message()));
  }
  if (std::filesystem::is_regular_file(resolved, ec)) {
    return resolved.parent_path();
  }
  return resolved;
}

// Common window of the time-based logs among files, read without decoding. Files count only when
// exactly one log type claims them, as in a scan.
std::optional<io::TimeSpan> ProbeFileSpans(const std::vector<WalkedFile>& files,
                                           const interp::TypeRegistry& registry,
                                           const ScanOptions& options,
                                           bool* any_match) {
  std::optional<io::TimeSpan> span;
  for (const WalkedFile& walked : files) {
    io::LogFile file(walked.path, walked.size_bytes);
    const std::set<interp::TypeTag> tags = CandidateTags(file, registry, options, nullptr);
    if (tags.size() != 1) {
      continue;
    }
    *any_match = true;

    const auto type = registry.at(*tags.begin());
    if (!type->traits.facets.contains(interp::Facet::kTimeBase)) {
      continue;
    }

    std::optional<io::TimeSpan> file_span;
    try {
      file_span = type->decoder->ProbeTimeSpan(walked.path);
    } catch (const std::exception& ex) {
      spdlog::warn("Could not probe the time span of {}: {}", walked.path.string(), ex.what());
      continue;
    }
    if (!file_span.has_value()) {
      continue;
    }

    if (!span.has_value()) {
      span = file_span;
    } else {
      span->start_ns = std::max(span->start_ns, file_span->start_ns);
      span->end_ns = std::min(span->end_ns, file_span->end_ns);
    }
  }
  return span;
}

}  // namespace

std::string_view DiagnosticKindName(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::kUnclassifiedFile:
      return "unclassified";
    case DiagnosticKind::kAmbiguousMatch:
      return "ambiguous";
    case DiagnosticKind::kCorruptLog:
      return "errored";
  }
  return "unknown";
}

Experiment::Experiment(std::filesystem::path root,
                       std::shared_ptr<const interp::TypeRegistry> registry,
                       ScanOptions options)
    : root_(std::move(root)), registry_(std::move(registry)), options_(std::move(options)) {}

Experiment Experiment::Scan(const std::filesystem::path& root,
                            std::shared_ptr<const interp::TypeRegistry> registry,
                            const ScanOptions& options) {
  if (registry == nullptr || registry->empty()) {
    throw interp::RegistryError("Cannot scan an experiment without registered log types");
  }

  Experiment experiment(ResolveRoot(root), std::move(registry), options);
  // Rescans must not inherit a token that belongs to this call.
  experiment.options_.cancel = nullptr;

  WalkOptions walk_options;
  walk_options.follow_symlinks = options.follow_symlinks;
  walk_options.max_depth = options.max_depth;
  const std::vector<WalkedFile> files = WalkDirectory(experiment.root_, walk_options);
  spdlog::info("Scanning {} ({} files)", experiment.root_.string(), files.size());

  interp::CompanionStore store;
  std::vector<FileOutcome> outcomes = ProcessFiles(files, *experiment.registry_, options, store);
  std::vector<WalkedFile> scanned = files;

  const bool any_match = std::any_of(outcomes.begin(), outcomes.end(), [](const FileOutcome& outcome) {
    return outcome.interpreter != nullptr;
  });
  if (!any_match && options.probe_adjacent && Cancelled(options)) {
    // The adjacent files were never looked at.
    experiment.partial_ = true;
  } else if (!any_match && options.probe_adjacent) {
    std::set<std::filesystem::path> seen;
    for (const WalkedFile& file : files) {
      seen.insert(file.path);
    }
    std::vector<WalkedFile> adjacent;
    for (WalkedFile& file : ListAdjacentFiles(experiment.root_)) {
      if (seen.insert(file.path).second) {
        adjacent.push_back(std::move(file));
      }
    }
    spdlog::info("No logs inside {}; probing {} adjacent files", experiment.root_.string(), adjacent.size());

    std::vector<FileOutcome> adjacent_outcomes = ProcessFiles(adjacent, *experiment.registry_, options, store);
    for (std::size_t i = 0; i < adjacent.size(); ++i) {
      scanned.push_back(std::move(adjacent[i]));
      outcomes.push_back(std::move(adjacent_outcomes[i]));
    }
    experiment.probed_adjacent_ = true;
  }

  const std::filesystem::path session_base =
      experiment.probed_adjacent_ ? experiment.root_.parent_path() : experiment.root_;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    FileOutcome& outcome = outcomes[i];
    if (!outcome.processed) {
      experiment.partial_ = true;
      continue;
    }
    ++experiment.scanned_file_count_;

    if (outcome.interpreter != nullptr) {
      experiment.Insert(std::move(outcome.interpreter), SessionKey(scanned[i].path, session_base));
      continue;
    }

    FileDiagnostic& diagnostic = *outcome.diagnostic;
    if (diagnostic.kind == DiagnosticKind::kUnclassifiedFile) {
      spdlog::debug("Unclassified {}: {}", diagnostic.path.string(), diagnostic.reason);
    } else {
      spdlog::warn("{} {}: {}", DiagnosticKindName(diagnostic.kind), diagnostic.path.string(), diagnostic.reason);
    }
    experiment.diagnostics_.push_back(std::move(diagnostic));
  }

  if (experiment.partial_) {
    spdlog::warn("Scan of {} was cancelled; the experiment is partial", experiment.root_.string());
  }

  if (options.align_time_bases) {
    experiment.AlignTimeBases();
  }

  spdlog::info("Experiment {}: {} logs, {} unclassified, {} ambiguous, {} errored",
               experiment.root_.string(),
               experiment.interpreters_.size(),
               experiment.DiagnosticsOfKind(DiagnosticKind::kUnclassifiedFile).size(),
               experiment.DiagnosticsOfKind(DiagnosticKind::kAmbiguousMatch).size(),
               experiment.DiagnosticsOfKind(DiagnosticKind::kCorruptLog).size());
  return experiment;
}

std::optional<io::TimeSpan> Experiment::ProbeTimeSpan(const std::filesystem::path& root,
                                                      const interp::TypeRegistry& registry,
                                                      const ScanOptions& options) {
  WalkOptions walk_options;
  walk_options.follow_symlinks = options.follow_symlinks;
  walk_options.max_depth = options.max_depth;

  const std::filesystem::path resolved = ResolveRoot(root);
  bool any_match = false;
  std::optional<io::TimeSpan> span =
      ProbeFileSpans(WalkDirectory(resolved, walk_options), registry, options, &any_match);
  if (!any_match && options.probe_adjacent) {
    span = ProbeFileSpans(ListAdjacentFiles(resolved), registry, options, &any_match);
  }
  return span;
}

Experiment Experiment::Rescan() const {
  return Scan(root_, registry_, options_);
}

Experiment Experiment::Rescan(const ScanOptions& options) const {
  return Scan(root_, registry_, options);
}

void Experiment::Insert(std::unique_ptr<interp::Interpreter> interpreter, const std::string& session) {
  const interp::Interpreter* view = interpreter.get();
  owned_.push_back(std::move(interpreter));
  interpreters_.push_back(view);
  by_tag_[view->tag()].push_back(view);
  sessions_[session].push_back(view);
}

void Experiment::AlignTimeBases() {
  std::vector<interp::Interpreter*> timed;
  for (const auto& interpreter : owned_) {
    if (interpreter->Has(interp::Facet::kTimeBase)) {
      timed.push_back(interpreter.get());
    }
  }
  if (timed.empty()) {
    return;
  }

  std::sort(timed.begin(), timed.end(), [](const interp::Interpreter* lhs, const interp::Interpreter* rhs) {
    return lhs->source_path() < rhs->source_path();
  });

  std::int64_t epoch_ns = std::numeric_limits<std::int64_t>::max();
  for (const interp::Interpreter* interpreter : timed) {
    epoch_ns = std::min(epoch_ns, interpreter->time_base().start_ns);
  }
  for (interp::Interpreter* interpreter : timed) {
    interpreter->SetAlignmentEpoch(epoch_ns);
  }

  alignment_epoch_ns_ = epoch_ns;
  spdlog::debug("Aligned {} logs to epoch {} ns", timed.size(), epoch_ns);
}

const std::filesystem::path& Experiment::root() const {
  return root_;
}

const Experiment::InterpreterList& Experiment::interpreters() const {
  return interpreters_;
}

const Experiment::InterpreterList& Experiment::ForTag(std::string_view tag) const {
  static const InterpreterList kEmpty;
  const auto it = by_tag_.find(tag);
  return it == by_tag_.end() ? kEmpty : it->second;
}

const interp::Interpreter* Experiment::First(std::string_view tag) const {
  const InterpreterList& list = ForTag(tag);
  return list.empty() ? nullptr : list.front();
}

std::vector<interp::TypeTag> Experiment::tags() const {
  std::vector<interp::TypeTag> tags;
  tags.reserve(by_tag_.size());
  for (const auto& [tag, list] : by_tag_) {
    tags.push_back(tag);
  }
  return tags;
}

const std::map<std::string, Experiment::InterpreterList>& Experiment::sessions() const {
  return sessions_;
}

const std::vector<FileDiagnostic>& Experiment::diagnostics() const {
  return diagnostics_;
}

std::vector<FileDiagnostic> Experiment::DiagnosticsOfKind(DiagnosticKind kind) const {
  std::vector<FileDiagnostic> matching;
  std::copy_if(diagnostics_.begin(), diagnostics_.end(), std::back_inserter(matching), [kind](const FileDiagnostic& d) {
    return d.kind == kind;
  });
  return matching;
}

std::vector<FileDiagnostic> Experiment::unclassified() const {
  return DiagnosticsOfKind(DiagnosticKind::kUnclassifiedFile);
}

std::vector<FileDiagnostic> Experiment::ambiguous() const {
  return DiagnosticsOfKind(DiagnosticKind::kAmbiguousMatch);
}

std::vector<FileDiagnostic> Experiment::errored() const {
  return DiagnosticsOfKind(DiagnosticKind::kCorruptLog);
}

std::optional<std::int64_t> Experiment::alignment_epoch_ns() const {
  return alignment_epoch_ns_;
}

bool Experiment::is_partial() const {
  return partial_;
}

bool Experiment::probed_adjacent() const {
  return probed_adjacent_;
}

std::size_t Experiment::scanned_file_count() const {
  return scanned_file_count_;
}

}  // namespace rigtrace::session
