#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "rigtrace/interp/facets.hpp"
#include "rigtrace/io/classifier.hpp"
#include "rigtrace/io/decoder.hpp"
#include "rigtrace/io/log_file.hpp"

namespace rigtrace::interp {

using TypeTag = std::string;

class Interpreter;

// Derived signal computed from an interpreter's records, e.g. a unit-converted column.
using SignalFn = std::function<std::vector<double>(const Interpreter&)>;

// What an interpreter of one log type carries on top of its records.
struct InterpreterTraits {
  std::string description;
  FacetSet facets;
  ConfigSelector config_selector;
  std::vector<VersionRequirement> validated_versions;
  CompanionLocation companions = CompanionLocation::kSameDirectory;
  std::map<std::string, SignalFn, std::less<>> signals;
};

struct RegisteredLogType {
  TypeTag tag;
  std::shared_ptr<const io::LogClassifier> classifier;
  std::shared_ptr<const io::Decoder> decoder;
  InterpreterTraits traits;
  std::size_t registration_index = 0;
};

// Append-only table of log types. Populate it once at start-up, then share it read-only:
// classification does not lock.
class TypeRegistry {
 public:
  // Throws DuplicateTagError for a known tag and RegistryError for an empty tag or missing
  // classifier/decoder.
  void Register(TypeTag tag,
                std::shared_ptr<const io::LogClassifier> classifier,
                std::shared_ptr<const io::Decoder> decoder,
                InterpreterTraits traits = {});

  // First-match-wins in priority order (cheaper probes first, then registration order).
  std::optional<TypeTag> Classify(io::LogFile& file) const;
  std::optional<TypeTag> Classify(const std::filesystem::path& path) const;

  // Every tag whose classifier accepts the file. Rejection reasons go to *rejections as "tag: reason".
  std::set<TypeTag> ClassifyAll(io::LogFile& file, std::vector<std::string>* rejections = nullptr) const;
  std::set<TypeTag> ClassifyAll(const std::filesystem::path& path, std::vector<std::string>* rejections = nullptr) const;

  std::shared_ptr<const RegisteredLogType> Find(std::string_view tag) const;
  // Throws RegistryError for an unknown tag.
  std::shared_ptr<const RegisteredLogType> at(std::string_view tag) const;

  // Tags in priority order.
  std::vector<TypeTag> tags() const;
  std::size_t size() const;
  bool empty() const;

 private:
  io::ProbeVerdict Probe(const RegisteredLogType& type, io::LogFile& file) const;

  std::vector<std::shared_ptr<const RegisteredLogType>> entries_;
};

}  // namespace rigtrace::interp
