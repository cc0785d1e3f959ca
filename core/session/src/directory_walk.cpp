#include "rigtrace/session/directory_walk.hpp"

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace rigtrace::session {
namespace {

struct WalkState {
  std::set<std::filesystem::path> visited_directories;
  std::set<std::filesystem::path> visited_files;
  std::vector<WalkedFile> files;
};

std::vector<std::filesystem::directory_entry> SortedEntries(const std::filesystem::path& directory) {
  std::vector<std::filesystem::directory_entry> entries;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec) {
    spdlog::warn("Could not list {}: {}", directory.string(), ec.message());
  }
  std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) { return lhs.path() < rhs.path(); });
  return entries;
}

void Walk(const std::filesystem::path& directory, int depth, const WalkOptions& options, WalkState* state) {
  std::error_code ec;
  const std::filesystem::path real_directory = std::filesystem::canonical(directory, ec);
  if (ec) {
    spdlog::warn("Could not resolve {}: {}", directory.string(), ec.message());
    return;
  }
  if (!state->visited_directories.insert(real_directory).second) {
    spdlog::debug("Skipping {}: already visited as {}", directory.string(), real_directory.string());
    return;
  }

  for (const auto& entry : SortedEntries(directory)) {
    if (!options.follow_symlinks && entry.is_symlink(ec)) {
      continue;
    }

    if (entry.is_directory(ec)) {
      if (options.max_depth < 0 || depth < options.max_depth) {
        Walk(entry.path(), depth + 1, options, state);
      }
      continue;
    }
    if (!entry.is_regular_file(ec)) {
      continue;
    }

    const std::filesystem::path real_file = std::filesystem::canonical(entry.path(), ec);
    if (ec || !state->visited_files.insert(real_file).second) {
      continue;
    }

    const std::uintmax_t size = entry.file_size(ec);
    state->files.push_back(WalkedFile{entry.path(), ec ? 0 : size});
  }
}

}  // namespace

std::vector<WalkedFile> WalkDirectory(const std::filesystem::path& root, const WalkOptions& options) {
  WalkState state;
  Walk(root, 0, options, &state);
  std::sort(state.files.begin(), state.files.end(), [](const WalkedFile& lhs, const WalkedFile& rhs) {
    return lhs.path < rhs.path;
  });
  return state.files;
}

std::vector<WalkedFile> ListAdjacentFiles(const std::filesystem::path& root) {
  std::error_code ec;
  std::filesystem::path real_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    real_root = root;
  }
  const std::filesystem::path parent = real_root.parent_path();
  if (parent.empty() || parent == real_root) {
    return {};
  }

  WalkOptions direct_files_only;
  direct_files_only.max_depth = 0;

  std::vector<WalkedFile> files = WalkDirectory(parent, direct_files_only);
  for (const auto& entry : SortedEntries(parent)) {
    if (!entry.is_directory(ec) || std::filesystem::equivalent(entry.path(), real_root, ec)) {
      continue;
    }
    for (WalkedFile& file : WalkDirectory(entry.path(), direct_files_only)) {
      files.push_back(std::move(file));
    }
  }
  return files;
}

}  // namespace rigtrace::session
