#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rigtrace::io {

struct ProbeVerdict {
  bool valid = false;
  std::string reason;
};

// A candidate input discovered during a directory walk. Header bytes and classifier verdicts are
// read once and reused by every classifier probing the same file. Not thread-safe; one worker owns it.
class LogFile {
 public:
  static constexpr std::size_t kHeaderProbeBytes = 4096;

  explicit LogFile(std::filesystem::path path);
  LogFile(std::filesystem::path path, std::uintmax_t size_bytes);

  const std::filesystem::path& path() const;
  std::uintmax_t size_bytes() const;
  std::string filename() const;
  // Lower-cased, including the dot.
  std::string extension() const;

  // Up to kHeaderProbeBytes from the start of the file. Throws std::runtime_error if unreadable.
  const std::string& HeadBytes();
  // First line of the header bytes split as CSV.
  const std::vector<std::string>& HeaderColumns();

  std::optional<ProbeVerdict> CachedVerdict(const std::string& tag) const;
  void RememberVerdict(const std::string& tag, ProbeVerdict verdict);

 private:
  std::filesystem::path path_;
  std::uintmax_t size_bytes_ = 0;
  std::optional<std::string> head_bytes_;
  std::optional<std::vector<std::string>> header_columns_;
  std::map<std::string, ProbeVerdict> verdicts_;
};

}  // namespace rigtrace::io
