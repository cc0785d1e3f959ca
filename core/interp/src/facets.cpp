#include "rigtrace/interp/facets.hpp"

#include <algorithm>

namespace rigtrace::interp {
namespace {

std::uint8_t Bit(Facet facet) {
  return static_cast<std::uint8_t>(1U << static_cast<unsigned>(facet));
}

}  // namespace

std::string_view FacetName(Facet facet) {
  switch (facet) {
    case Facet::kConfigProvenance:
      return "config_provenance";
    case Facet::kVersionProvenance:
      return "version_provenance";
    case Facet::kTimeBase:
      return "time_base";
  }
  return "unknown";
}

FacetSet::FacetSet(std::initializer_list<Facet> facets) {
  for (const Facet facet : facets) {
    insert(facet);
  }
}

bool FacetSet::contains(Facet facet) const {
  return (bits_ & Bit(facet)) != 0;
}

void FacetSet::insert(Facet facet) {
  bits_ = static_cast<std::uint8_t>(bits_ | Bit(facet));
}

bool FacetSet::empty() const {
  return bits_ == 0;
}

bool ConfigSelector::Matches(const NodeConfig& node) const {
  if (executables_by_package.empty()) {
    return true;
  }
  const auto it = executables_by_package.find(node.package);
  if (it == executables_by_package.end()) {
    return false;
  }
  const auto& executables = it->second;
  return executables.empty() || std::find(executables.begin(), executables.end(), node.executable) != executables.end();
}

std::optional<std::string> ConfigProvenance::Parameter(std::string_view key) const {
  for (const NodeConfig& node : nodes) {
    const auto it = node.parameters.find(std::string(key));
    if (it != node.parameters.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

std::optional<std::string> VersionProvenance::commit() const {
  for (const GitState& entry : entries) {
    if (!entry.commit.empty()) {
      return entry.commit;
    }
    if (!entry.commit_hash.empty()) {
      return entry.commit_hash;
    }
  }
  return std::nullopt;
}

}  // namespace rigtrace::interp
