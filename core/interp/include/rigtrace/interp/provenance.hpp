#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rigtrace/interp/facets.hpp"
#include "rigtrace/io/log_handle.hpp"

namespace rigtrace::interp {

struct ConfigDocument {
  std::filesystem::path file;
  std::vector<NodeConfig> nodes;
};

struct GitStateDocument {
  std::filesystem::path file;
  std::vector<GitState> entries;
};

// Parsed companion documents, shared by every interpreter that points at the same file.
// Thread-safe. A document that fails to parse is remembered as absent.
class CompanionStore {
 public:
  std::shared_ptr<const ConfigDocument> LoadConfig(const std::filesystem::path& file);
  std::shared_ptr<const GitStateDocument> LoadGitState(const std::filesystem::path& file);

  std::size_t cached_documents() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::filesystem::path, std::shared_ptr<const ConfigDocument>> configs_;
  std::map<std::filesystem::path, std::shared_ptr<const GitStateDocument>> git_states_;
};

std::optional<std::filesystem::path> FindConfigCompanion(const std::filesystem::path& log_path,
                                                         CompanionLocation location);
std::optional<std::filesystem::path> FindGitStateCompanion(const std::filesystem::path& log_path,
                                                           CompanionLocation location);

// Shared facet extraction. Missing or unusable companions give nullptr / std::nullopt, never an error.
std::shared_ptr<const ConfigProvenance> ExtractConfigProvenance(const std::filesystem::path& log_path,
                                                                const ConfigSelector& selector,
                                                                CompanionLocation location,
                                                                CompanionStore& store);
std::shared_ptr<const VersionProvenance> ExtractVersionProvenance(const std::filesystem::path& log_path,
                                                                  const std::vector<VersionRequirement>& requirements,
                                                                  CompanionLocation location,
                                                                  CompanionStore& store);
std::optional<TimeBase> ExtractTimeBase(const io::LogHandle& log);

// "YYYY-MM-DD HH:MM:SS+HH:MM" (the offset may also be written +HHMM or +H:MM), as UTC seconds.
std::optional<std::int64_t> ParseCommitTime(std::string_view text);

std::vector<std::string> CheckCompatibility(const GitState& state, const VersionRequirement& requirement);

}  // namespace rigtrace::interp
