#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rigtrace/interp/facets.hpp"
#include "rigtrace/interp/provenance.hpp"
#include "rigtrace/interp/type_registry.hpp"
#include "rigtrace/io/log_handle.hpp"

namespace rigtrace::interp {

// Typed view over one decoded log file. Owns its LogHandle; facets are shared and read-only.
class Interpreter {
 public:
  Interpreter(std::shared_ptr<const RegisteredLogType> type,
              std::unique_ptr<const io::LogHandle> log,
              std::shared_ptr<const ConfigProvenance> config,
              std::shared_ptr<const VersionProvenance> version,
              std::optional<TimeBase> time_base);

  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  // Decodes source with the type's decoder and attaches the facets the type declares.
  // Throws io::CorruptLogError when decoding fails.
  static std::unique_ptr<Interpreter> Build(std::shared_ptr<const RegisteredLogType> type,
                                            const std::filesystem::path& source,
                                            CompanionStore& store);

  const TypeTag& tag() const;
  const std::filesystem::path& source_path() const;
  const InterpreterTraits& traits() const;

  const io::LogHandle& log() const;
  const std::vector<io::LogRecord>& records() const;
  const std::vector<std::string>& field_names() const;
  std::size_t size() const;
  std::vector<std::int64_t> Timestamps() const;
  std::vector<double> NumericColumn(std::string_view field) const;

  bool Has(Facet facet) const;
  const ConfigProvenance& config_provenance() const;
  const VersionProvenance& version_provenance() const;
  const TimeBase& time_base() const;

  bool HasSignal(std::string_view name) const;
  std::vector<std::string> SignalNames() const;
  // Throws std::out_of_range for a signal the log type does not define.
  std::vector<double> Signal(std::string_view name) const;

  void SetAlignmentEpoch(std::int64_t epoch_ns);
  std::optional<std::int64_t> alignment_epoch_ns() const;
  // Start of this log relative to the shared epoch. Requires a time base and an epoch.
  std::int64_t alignment_offset_ns() const;
  // Timestamps relative to the shared epoch; raw timestamps while unaligned.
  std::vector<std::int64_t> AlignedTimestamps() const;

 private:
  std::shared_ptr<const RegisteredLogType> type_;
  std::unique_ptr<const io::LogHandle> log_;
  std::shared_ptr<const ConfigProvenance> config_;
  std::shared_ptr<const VersionProvenance> version_;
  std::optional<TimeBase> time_base_;
  std::optional<std::int64_t> alignment_epoch_ns_;
};

}  // namespace rigtrace::interp
