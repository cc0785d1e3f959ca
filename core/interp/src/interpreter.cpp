#include "rigtrace/interp/interpreter.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "rigtrace/interp/errors.hpp"

namespace rigtrace::interp {

Interpreter::Interpreter(std::shared_ptr<const RegisteredLogType> type,
                         std::unique_ptr<const io::LogHandle> log,
                         std::shared_ptr<const ConfigProvenance> config,
                         std::shared_ptr<const VersionProvenance> version,
                         std::optional<TimeBase> time_base)
    : type_(std::move(type)),
      log_(std::move(log)),
      config_(std::move(config)),
      version_(std::move(version)),
      time_base_(time_base) {
  if (type_ == nullptr || log_ == nullptr) {
    throw std::invalid_argument("Interpreter requires a log type and a log");
  }
}

std::unique_ptr<Interpreter> Interpreter::Build(std::shared_ptr<const RegisteredLogType> type,
                                                const std::filesystem::path& source,
                                                CompanionStore& store) {
  if (type == nullptr) {
    throw std::invalid_argument("Interpreter::Build requires a log type");
  }

  auto log = std::make_unique<const io::LogHandle>(source, type->decoder->Parse(source));

  const InterpreterTraits& traits = type->traits;
  std::shared_ptr<const ConfigProvenance> config;
  if (traits.facets.contains(Facet::kConfigProvenance)) {
    config = ExtractConfigProvenance(source, traits.config_selector, traits.companions, store);
  }
  std::shared_ptr<const VersionProvenance> version;
  if (traits.facets.contains(Facet::kVersionProvenance)) {
    version = ExtractVersionProvenance(source, traits.validated_versions, traits.companions, store);
  }
  std::optional<TimeBase> time_base;
  if (traits.facets.contains(Facet::kTimeBase)) {
    time_base = ExtractTimeBase(*log);
  }

  return std::make_unique<Interpreter>(
      std::move(type), std::move(log), std::move(config), std::move(version), time_base);
}

const TypeTag& Interpreter::tag() const {
  return type_->tag;
}

const std::filesystem::path& Interpreter::source_path() const {
  return log_->source();
}

const InterpreterTraits& Interpreter::traits() const {
  return type_->traits;
}

const io::LogHandle& Interpreter::log() const {
  return *log_;
}

const std::vector<io::LogRecord>& Interpreter::records() const {
  return log_->records();
}

const std::vector<std::string>& Interpreter::field_names() const {
  return log_->field_names();
}

std::size_t Interpreter::size() const {
  return log_->size();
}

std::vector<std::int64_t> Interpreter::Timestamps() const {
  return log_->Timestamps();
}

std::vector<double> Interpreter::NumericColumn(std::string_view field) const {
  return log_->NumericColumn(field);
}

bool Interpreter::Has(Facet facet) const {
  switch (facet) {
    case Facet::kConfigProvenance:
      return config_ != nullptr;
    case Facet::kVersionProvenance:
      return version_ != nullptr;
    case Facet::kTimeBase:
      return time_base_.has_value();
  }
  return false;
}

const ConfigProvenance& Interpreter::config_provenance() const {
  if (config_ == nullptr) {
    throw FacetUnavailableError(fmt::format("{} has no config provenance", source_path().string()));
  }
  return *config_;
}

const VersionProvenance& Interpreter::version_provenance() const {
  if (version_ == nullptr) {
    throw FacetUnavailableError(fmt::format("{} has no version provenance", source_path().string()));
  }
  return *version_;
}

const TimeBase& Interpreter::time_base() const {
  if (!time_base_.has_value()) {
    throw FacetUnavailableError(fmt::format("{} has no time base", source_path().string()));
  }
  return *time_base_;
}

bool Interpreter::HasSignal(std::string_view name) const {
  return type_->traits.signals.find(name) != type_->traits.signals.end();
}

std::vector<std::string> Interpreter::SignalNames() const {
  std::vector<std::string> names;
  names.reserve(type_->traits.signals.size());
  for (const auto& [name, signal] : type_->traits.signals) {
    names.push_back(name);
  }
  return names;
}

std::vector<double> Interpreter::Signal(std::string_view name) const {
  const auto it = type_->traits.signals.find(name);
  if (it == type_->traits.signals.end()) {
    throw std::out_of_range(fmt::format("Log type '{}' has no signal '{}'", tag(), name));
  }
  return it->second(*this);
}

void Interpreter::SetAlignmentEpoch(std::int64_t epoch_ns) {
  alignment_epoch_ns_ = epoch_ns;
}

std::optional<std::int64_t> Interpreter::alignment_epoch_ns() const {
  return alignment_epoch_ns_;
}

std::int64_t Interpreter::alignment_offset_ns() const {
  const TimeBase& base = time_base();
  if (!alignment_epoch_ns_.has_value()) {
    throw std::logic_error(fmt::format("{} has not been aligned", source_path().string()));
  }
  return base.start_ns - *alignment_epoch_ns_;
}

std::vector<std::int64_t> Interpreter::AlignedTimestamps() const {
  std::vector<std::int64_t> timestamps = log_->Timestamps();
  if (alignment_epoch_ns_.has_value()) {
    for (std::int64_t& timestamp : timestamps) {
      timestamp -= *alignment_epoch_ns_;
    }
  }
  return timestamps;
}

}  // namespace rigtrace::interp
