#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace rigtrace::session {

struct WalkOptions {
  bool follow_symlinks = true;
  // Directory levels below the root to descend into; negative means unlimited.
  int max_depth = -1;
};

struct WalkedFile {
  std::filesystem::path path;
  std::uintmax_t size_bytes = 0;
};

// Regular files under root, sorted by path. Directories are entered at most once by real path,
// so symlink cycles terminate, and a file reachable through several links is listed once.
std::vector<WalkedFile> WalkDirectory(const std::filesystem::path& root, const WalkOptions& options = {});

// Files stored next to root rather than inside it: the direct files of root's parent, then the
// direct files of each sibling directory.
std::vector<WalkedFile> ListAdjacentFiles(const std::filesystem::path& root);

}  // namespace rigtrace::session
