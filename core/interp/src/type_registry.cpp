#include "rigtrace/interp/type_registry.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "rigtrace/interp/errors.hpp"

namespace rigtrace::interp {

void TypeRegistry::Register(TypeTag tag,
                            std::shared_ptr<const io::LogClassifier> classifier,
                            std::shared_ptr<const io::Decoder> decoder,
                            InterpreterTraits traits) {
  if (tag.empty()) {
    throw RegistryError("Log type tag must not be empty");
  }
  if (Find(tag) != nullptr) {
    throw DuplicateTagError(tag);
  }
  if (classifier == nullptr) {
    throw RegistryError(fmt::format("Log type '{}' has no classifier", tag));
  }
  if (decoder == nullptr) {
    throw RegistryError(fmt::format("Log type '{}' has no decoder", tag));
  }

  auto entry = std::make_shared<RegisteredLogType>();
  entry->tag = std::move(tag);
  entry->classifier = std::move(classifier);
  entry->decoder = std::move(decoder);
  entry->traits = std::move(traits);
  entry->registration_index = entries_.size();

  // Stable within a cost class: equal costs keep registration order.
  const io::ProbeCost cost = entry->classifier->cost();
  const auto position = std::upper_bound(
      entries_.begin(), entries_.end(), cost, [](io::ProbeCost lhs, const std::shared_ptr<const RegisteredLogType>& rhs) {
        return lhs < rhs->classifier->cost();
      });

  spdlog::debug("Registered log type '{}' ({})", entry->tag, entry->classifier->name());
  entries_.insert(position, std::move(entry));
}

io::ProbeVerdict TypeRegistry::Probe(const RegisteredLogType& type, io::LogFile& file) const {
  if (auto cached = file.CachedVerdict(type.tag)) {
    return *cached;
  }
  io::ProbeVerdict verdict = type.classifier->Evaluate(file);
  file.RememberVerdict(type.tag, verdict);
  return verdict;
}

std::optional<TypeTag> TypeRegistry::Classify(io::LogFile& file) const {
  for (const auto& entry : entries_) {
    if (Probe(*entry, file).valid) {
      return entry->tag;
    }
  }
  return std::nullopt;
}

std::optional<TypeTag> TypeRegistry::Classify(const std::filesystem::path& path) const {
  io::LogFile file(path);
  return Classify(file);
}

std::set<TypeTag> TypeRegistry::ClassifyAll(io::LogFile& file, std::vector<std::string>* rejections) const {
  std::set<TypeTag> tags;
  for (const auto& entry : entries_) {
    const io::ProbeVerdict verdict = Probe(*entry, file);
    if (verdict.valid) {
      tags.insert(entry->tag);
    } else if (rejections != nullptr) {
      rejections->push_back(fmt::format("{}: {}", entry->tag, verdict.reason));
    }
  }
  return tags;
}

std::set<TypeTag> TypeRegistry::ClassifyAll(const std::filesystem::path& path,
                                            std::vector<std::string>* rejections) const {
  io::LogFile file(path);
  return ClassifyAll(file, rejections);
}

std::shared_ptr<const RegisteredLogType> TypeRegistry::Find(std::string_view tag) const {
  const auto it = std::find_if(entries_.begin(), entries_.end(), [tag](const auto& entry) { return entry->tag == tag; });
  return it == entries_.end() ? nullptr : *it;
}

std::shared_ptr<const RegisteredLogType> TypeRegistry::at(std::string_view tag) const {
  auto entry = Find(tag);
  if (entry == nullptr) {
    throw RegistryError(fmt::format("Log type '{}' is not registered", tag));
  }
  return entry;
}

std::vector<TypeTag> TypeRegistry::tags() const {
  std::vector<TypeTag> tags;
  tags.reserve(entries_.size());
  for (const auto& entry : entries_) {
    tags.push_back(entry->tag);
  }
  return tags;
}

std::size_t TypeRegistry::size() const {
  return entries_.size();
}

bool TypeRegistry::empty() const {
  return entries_.empty();
}

}  // namespace rigtrace::interp
