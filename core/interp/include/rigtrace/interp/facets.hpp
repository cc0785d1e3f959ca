#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigtrace::interp {

enum class Facet : std::uint8_t {
  kConfigProvenance = 0,
  kVersionProvenance = 1,
  kTimeBase = 2,
};

std::string_view FacetName(Facet facet);

class FacetSet {
 public:
  FacetSet() = default;
  FacetSet(std::initializer_list<Facet> facets);

  bool contains(Facet facet) const;
  void insert(Facet facet);
  bool empty() const;

 private:
  std::uint8_t bits_ = 0;
};

// Where a log type keeps its companion config/git-state documents relative to the data file.
enum class CompanionLocation : std::uint8_t {
  kSameDirectory,
  kParentDirectory,
};

struct NodeConfig {
  std::string node_name;
  std::string package;
  std::string executable;
  std::map<std::string, std::string> parameters;
};

// Packages and, per package, the executables whose nodes belong to a log type. Empty selects every node.
struct ConfigSelector {
  std::map<std::string, std::vector<std::string>> executables_by_package;

  bool Matches(const NodeConfig& node) const;
};

struct ConfigProvenance {
  std::filesystem::path config_file;
  std::vector<NodeConfig> nodes;

  // First value of the parameter across the matched nodes.
  std::optional<std::string> Parameter(std::string_view key) const;
};

struct GitState {
  std::string node_name;
  std::string repo_name;
  std::string branch;
  std::string package;
  std::string executable;
  std::string commit;
  std::string commit_hash;
  std::string commit_time;
};

// A producer version a log type has been checked against.
struct VersionRequirement {
  std::string repo_name;
  std::string branch;
  std::string package;
  std::vector<std::string> executables;
  std::string validated_commit_time;
  std::string commit_hash;
};

struct VersionProvenance {
  std::filesystem::path git_state_file;
  std::vector<GitState> entries;
  std::vector<std::string> warnings;

  bool compatible() const { return warnings.empty(); }
  std::optional<std::string> commit() const;
};

struct TimeBase {
  std::int64_t start_ns = 0;
  std::int64_t end_ns = 0;

  std::int64_t duration_ns() const { return end_ns - start_ns; }
};

}  // namespace rigtrace::interp
