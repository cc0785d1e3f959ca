#include "rigtrace/interp/provenance.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <locale>
#include <sstream>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "rigtrace/io/csv_fields.hpp"

namespace rigtrace::interp {
namespace {

template <typename Predicate>
std::vector<std::filesystem::path> CompanionCandidates(const std::filesystem::path& directory, Predicate predicate) {
  std::vector<std::filesystem::path> matches;
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    return matches;
  }

  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    // Resource-fork files written by macOS onto shared drives.
    if (name.starts_with("._")) {
      continue;
    }
    if (predicate(entry.path(), name)) {
      matches.push_back(entry.path());
    }
  }

  std::sort(matches.begin(), matches.end());
  return matches;
}

std::vector<std::filesystem::path> SearchDirectories(const std::filesystem::path& log_path, CompanionLocation location) {
  std::filesystem::path directory = log_path.parent_path();
  if (directory.empty()) {
    directory = ".";
  }
  if (location == CompanionLocation::kParentDirectory && directory.has_parent_path() &&
      directory.parent_path() != directory) {
    return {directory.parent_path(), directory};
  }
  return {directory};
}

std::string ScalarOr(const YAML::Node& node, const char* key) {
  const YAML::Node value = node[key];
  if (!value || !value.IsScalar()) {
    return {};
  }
  return value.Scalar();
}

void FlattenParameters(const YAML::Node& node, const std::string& prefix, std::map<std::string, std::string>* out) {
  for (const auto& item : node) {
    const std::string key = prefix.empty() ? item.first.as<std::string>()
                                           : fmt::format("{}.{}", prefix, item.first.as<std::string>());
    if (item.second.IsMap()) {
      FlattenParameters(item.second, key, out);
    } else if (item.second.IsScalar()) {
      (*out)[key] = item.second.Scalar();
    } else {
      YAML::Emitter emitter;
      emitter << YAML::Flow << item.second;
      (*out)[key] = emitter.c_str();
    }
  }
}

std::shared_ptr<const ConfigDocument> ParseConfigDocument(const std::filesystem::path& file) {
  const YAML::Node root = YAML::LoadFile(file.string());
  const YAML::Node compiled = root["compiled_config"];
  if (!compiled || !compiled.IsMap()) {
    throw std::runtime_error(fmt::format("{} has no compiled_config mapping", file.string()));
  }

  auto document = std::make_shared<ConfigDocument>();
  document->file = file;
  for (const auto& item : compiled) {
    const YAML::Node node = item.second;
    if (!node.IsMap() || !node["package"]) {
      continue;
    }

    NodeConfig config;
    config.node_name = item.first.as<std::string>();
    config.package = ScalarOr(node, "package");
    config.executable = ScalarOr(node, "executable");
    const YAML::Node parameters = node["parameters"];
    if (parameters && parameters.IsMap()) {
      FlattenParameters(parameters, "", &config.parameters);
    }
    document->nodes.push_back(std::move(config));
  }
  return document;
}

std::shared_ptr<const GitStateDocument> ParseGitStateDocument(const std::filesystem::path& file) {
  const YAML::Node root = YAML::LoadFile(file.string());
  if (!root.IsMap()) {
    throw std::runtime_error(fmt::format("{} is not a mapping of nodes", file.string()));
  }

  auto document = std::make_shared<GitStateDocument>();
  document->file = file;
  for (const auto& item : root) {
    const YAML::Node node = item.second;
    if (!node.IsMap() || !node["package"]) {
      continue;
    }

    GitState state;
    state.node_name = item.first.as<std::string>();
    state.repo_name = ScalarOr(node, "repo_name");
    state.branch = ScalarOr(node, "branch");
    state.package = ScalarOr(node, "package");
    state.executable = ScalarOr(node, "executable");
    state.commit = ScalarOr(node, "commit");
    state.commit_hash = ScalarOr(node, "commit_hash");
    state.commit_time = ScalarOr(node, "commit_time");
    document->entries.push_back(std::move(state));
  }
  return document;
}

template <typename Document, typename Parser>
std::shared_ptr<const Document> LoadCached(std::mutex& mutex,
                                           std::map<std::filesystem::path, std::shared_ptr<const Document>>& cache,
                                           const std::filesystem::path& file,
                                           Parser parse) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = cache.find(file);
    if (it != cache.end()) {
      return it->second;
    }
  }

  std::shared_ptr<const Document> document;
  try {
    document = parse(file);
  } catch (const std::exception& ex) {
    spdlog::warn("Failed to read companion file {}: {}", file.string(), ex.what());
  }

  std::lock_guard<std::mutex> lock(mutex);
  return cache.emplace(file, std::move(document)).first->second;
}

bool ParseNumber(std::string_view text, int* value) {
  const auto result = std::from_chars(text.data(), text.data() + text.size(), *value);
  return !text.empty() && result.ec == std::errc() && result.ptr == text.data() + text.size();
}

// "+04:00", "-5:00", "-0400" or "+04" as seconds east of UTC.
std::optional<int> ParseUtcOffset(std::string_view text) {
  if (text.empty()) {
    return 0;
  }
  if (text == "Z") {
    return 0;
  }
  if (text.front() != '+' && text.front() != '-') {
    return std::nullopt;
  }
  const int sign = text.front() == '-' ? -1 : 1;
  text.remove_prefix(1);

  std::string_view hours_text = text;
  std::string_view minutes_text;
  if (const auto colon = text.find(':'); colon != std::string_view::npos) {
    hours_text = text.substr(0, colon);
    minutes_text = text.substr(colon + 1);
  } else if (text.size() == 4) {
    hours_text = text.substr(0, 2);
    minutes_text = text.substr(2);
  }

  int hours = 0;
  int minutes = 0;
  if (!ParseNumber(hours_text, &hours) || (!minutes_text.empty() && !ParseNumber(minutes_text, &minutes))) {
    return std::nullopt;
  }
  if (hours > 14 || minutes >= 60) {
    return std::nullopt;
  }
  return sign * (hours * 3600 + minutes * 60);
}

}  // namespace

std::shared_ptr<const ConfigDocument> CompanionStore::LoadConfig(const std::filesystem::path& file) {
  return LoadCached(mutex_, configs_, file, ParseConfigDocument);
}

std::shared_ptr<const GitStateDocument> CompanionStore::LoadGitState(const std::filesystem::path& file) {
  return LoadCached(mutex_, git_states_, file, ParseGitStateDocument);
}

std::size_t CompanionStore::cached_documents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return configs_.size() + git_states_.size();
}

std::optional<std::filesystem::path> FindConfigCompanion(const std::filesystem::path& log_path,
                                                         CompanionLocation location) {
  for (const auto& directory : SearchDirectories(log_path, location)) {
    const auto matches = CompanionCandidates(directory, [](const std::filesystem::path&, const std::string& name) {
      return name.ends_with("config.yaml");
    });
    if (!matches.empty()) {
      return matches.front();
    }
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> FindGitStateCompanion(const std::filesystem::path& log_path,
                                                           CompanionLocation location) {
  for (const auto& directory : SearchDirectories(log_path, location)) {
    const auto matches = CompanionCandidates(directory, [](const std::filesystem::path& path, const std::string& name) {
      return name.find("_git_state") != std::string::npos && path.extension() == ".yaml";
    });
    if (matches.empty()) {
      continue;
    }
    if (matches.size() > 1) {
      spdlog::info("Multiple git state files found for {}; using {}", log_path.string(), matches.front().string());
    }
    return matches.front();
  }
  return std::nullopt;
}

std::shared_ptr<const ConfigProvenance> ExtractConfigProvenance(const std::filesystem::path& log_path,
                                                                const ConfigSelector& selector,
                                                                CompanionLocation location,
                                                                CompanionStore& store) {
  const auto file = FindConfigCompanion(log_path, location);
  if (!file.has_value()) {
    spdlog::debug("No config file found for {}", log_path.string());
    return nullptr;
  }

  const auto document = store.LoadConfig(*file);
  if (document == nullptr) {
    return nullptr;
  }

  auto provenance = std::make_shared<ConfigProvenance>();
  provenance->config_file = *file;
  for (const NodeConfig& node : document->nodes) {
    if (selector.Matches(node)) {
      provenance->nodes.push_back(node);
    }
  }

  if (provenance->nodes.empty()) {
    spdlog::info("Config file {} has no node for {}", file->string(), log_path.string());
    return nullptr;
  }
  return provenance;
}

std::shared_ptr<const VersionProvenance> ExtractVersionProvenance(const std::filesystem::path& log_path,
                                                                  const std::vector<VersionRequirement>& requirements,
                                                                  CompanionLocation location,
                                                                  CompanionStore& store) {
  const auto file = FindGitStateCompanion(log_path, location);
  if (!file.has_value()) {
    spdlog::debug("No git state file found for {}; producer version unknown", log_path.string());
    return nullptr;
  }

  const auto document = store.LoadGitState(*file);
  if (document == nullptr) {
    return nullptr;
  }

  auto provenance = std::make_shared<VersionProvenance>();
  provenance->git_state_file = *file;
  for (const GitState& entry : document->entries) {
    const auto requirement = std::find_if(requirements.begin(), requirements.end(), [&entry](const VersionRequirement& r) {
      return r.package == entry.package;
    });
    if (requirement == requirements.end()) {
      continue;
    }
    provenance->entries.push_back(entry);
    for (std::string& warning : CheckCompatibility(entry, *requirement)) {
      provenance->warnings.push_back(std::move(warning));
    }
  }

  if (provenance->entries.empty()) {
    spdlog::info("Git state {} has no package compatible with {}", file->string(), log_path.string());
    return nullptr;
  }
  if (!provenance->warnings.empty()) {
    spdlog::info("Incompatible git state for {}: {}", log_path.string(), fmt::join(provenance->warnings, "; "));
  }
  return provenance;
}

std::optional<TimeBase> ExtractTimeBase(const io::LogHandle& log) {
  if (log.empty()) {
    return std::nullopt;
  }
  return TimeBase{log.start_timestamp_ns(), log.end_timestamp_ns()};
}

std::optional<std::int64_t> ParseCommitTime(std::string_view text) {
  std::istringstream stream(io::Trim(text));
  stream.imbue(std::locale::classic());

  std::tm parts{};
  stream >> std::get_time(&parts, "%Y-%m-%d %H:%M:%S");
  if (stream.fail()) {
    return std::nullopt;
  }

  std::string offset_text;
  stream >> offset_text;
  const auto offset = ParseUtcOffset(offset_text);
  if (!offset.has_value()) {
    return std::nullopt;
  }

  const std::chrono::year_month_day date{std::chrono::year{parts.tm_year + 1900},
                                         std::chrono::month{static_cast<unsigned>(parts.tm_mon + 1)},
                                         std::chrono::day{static_cast<unsigned>(parts.tm_mday)}};
  if (!date.ok()) {
    return std::nullopt;
  }

  const auto days = std::chrono::sys_days{date}.time_since_epoch();
  const std::int64_t local_seconds = std::chrono::duration_cast<std::chrono::seconds>(days).count() +
                                     parts.tm_hour * 3600 + parts.tm_min * 60 + parts.tm_sec;
  return local_seconds - *offset;
}

std::vector<std::string> CheckCompatibility(const GitState& state, const VersionRequirement& requirement) {
  std::vector<std::string> warnings;

  if (!requirement.validated_commit_time.empty()) {
    const auto produced = ParseCommitTime(state.commit_time);
    const auto validated = ParseCommitTime(requirement.validated_commit_time);
    if (!produced.has_value()) {
      warnings.push_back(fmt::format("{}: commit time '{}' could not be parsed", state.node_name, state.commit_time));
    } else if (validated.has_value() && *produced > *validated) {
      warnings.push_back(fmt::format("{}: commit time {} is more recent than the validated {}",
                                     state.node_name,
                                     state.commit_time,
                                     requirement.validated_commit_time));
    }
  }

  const auto& executables = requirement.executables;
  if (!executables.empty() && std::find(executables.begin(), executables.end(), state.executable) == executables.end()) {
    warnings.push_back(fmt::format("{}: executable '{}' has not been validated for package {}",
                                   state.node_name,
                                   state.executable,
                                   requirement.package));
  }

  return warnings;
}

}  // namespace rigtrace::interp
