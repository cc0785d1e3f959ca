#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rigtrace/interp/interpreter.hpp"
#include "rigtrace/interp/type_registry.hpp"
#include "rigtrace/io/log_record.hpp"
#include "rigtrace/session/scan_options.hpp"

namespace rigtrace::session {

enum class DiagnosticKind {
  kUnclassifiedFile,
  kAmbiguousMatch,
  kCorruptLog,
};

std::string_view DiagnosticKindName(DiagnosticKind kind);

struct FileDiagnostic {
  std::filesystem::path path;
  DiagnosticKind kind = DiagnosticKind::kUnclassifiedFile;
  std::string reason;
  std::vector<interp::TypeTag> candidates;
};

// Every log of one recording session found under a directory.
class Experiment {
 public:
  using InterpreterList = std::vector<const interp::Interpreter*>;

  // Throws interp::RegistryError for a missing or empty registry and std::runtime_error for a
  // root that does not exist. Per-file failures never throw; they end up in diagnostics().
  static Experiment Scan(const std::filesystem::path& root,
                         std::shared_ptr<const interp::TypeRegistry> registry,
                         const ScanOptions& options = {});

  // Latest start and earliest end over the time-based logs under root, read from the first and
  // last rows only. Files are classified and adjacent files probed the way Scan does it.
  // std::nullopt when no such log is found.
  static std::optional<io::TimeSpan> ProbeTimeSpan(const std::filesystem::path& root,
                                                   const interp::TypeRegistry& registry,
                                                   const ScanOptions& options = {});

  Experiment(Experiment&&) noexcept = default;
  Experiment& operator=(Experiment&&) noexcept = default;
  Experiment(const Experiment&) = delete;
  Experiment& operator=(const Experiment&) = delete;

  // A fresh scan of the same root with the same registry.
  Experiment Rescan() const;
  Experiment Rescan(const ScanOptions& options) const;

  const std::filesystem::path& root() const;

  // Discovery order.
  const InterpreterList& interpreters() const;
  const InterpreterList& ForTag(std::string_view tag) const;
  const interp::Interpreter* First(std::string_view tag) const;
  std::vector<interp::TypeTag> tags() const;
  // Keyed by the first directory below the root holding the file ("." for the root itself).
  const std::map<std::string, InterpreterList>& sessions() const;

  const std::vector<FileDiagnostic>& diagnostics() const;
  std::vector<FileDiagnostic> unclassified() const;
  std::vector<FileDiagnostic> ambiguous() const;
  std::vector<FileDiagnostic> errored() const;

  std::optional<std::int64_t> alignment_epoch_ns() const;
  bool is_partial() const;
  bool probed_adjacent() const;
  std::size_t scanned_file_count() const;

 private:
  Experiment(std::filesystem::path root, std::shared_ptr<const interp::TypeRegistry> registry, ScanOptions options);

  void Insert(std::unique_ptr<interp::Interpreter> interpreter, const std::string& session);
  void AlignTimeBases();
  std::vector<FileDiagnostic> DiagnosticsOfKind(DiagnosticKind kind) const;

  std::filesystem::path root_;
  std::shared_ptr<const interp::TypeRegistry> registry_;
  ScanOptions options_;

  std::vector<std::unique_ptr<interp::Interpreter>> owned_;
  InterpreterList interpreters_;
  std::map<interp::TypeTag, InterpreterList, std::less<>> by_tag_;
  std::map<std::string, InterpreterList> sessions_;
  std::vector<FileDiagnostic> diagnostics_;

  std::optional<std::int64_t> alignment_epoch_ns_;
  bool partial_ = false;
  bool probed_adjacent_ = false;
  std::size_t scanned_file_count_ = 0;
};

}  // namespace rigtrace::session
