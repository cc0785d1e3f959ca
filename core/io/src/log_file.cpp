#include "rigtrace/io/log_file.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "rigtrace/io/csv_fields.hpp"

namespace rigtrace::io {
namespace {

std::uintmax_t FileSizeOrZero(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : size;
}

}  // namespace

LogFile::LogFile(std::filesystem::path path) : path_(std::move(path)), size_bytes_(FileSizeOrZero(path_)) {}

LogFile::LogFile(std::filesystem::path path, std::uintmax_t size_bytes)
    : path_(std::move(path)), size_bytes_(size_bytes) {}

const std::filesystem::path& LogFile::path() const {
  return path_;
}

std::uintmax_t LogFile::size_bytes() const {
  return size_bytes_;
}

std::string LogFile::filename() const {
  return path_.filename().string();
}

std::string LogFile::extension() const {
  std::string extension = path_.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return extension;
}

const std::string& LogFile::HeadBytes() {
  if (head_bytes_.has_value()) {
    return *head_bytes_;
  }

  std::ifstream stream(path_, std::ios::binary);
  if (!stream.is_open()) {
    throw std::runtime_error(fmt::format("Could not open {}", path_.string()));
  }

  std::string head(kHeaderProbeBytes, '\0');
  stream.read(head.data(), static_cast<std::streamsize>(head.size()));
  head.resize(static_cast<std::size_t>(stream.gcount()));
  head_bytes_ = std::move(head);
  return *head_bytes_;
}

const std::vector<std::string>& LogFile::HeaderColumns() {
  if (header_columns_.has_value()) {
    return *header_columns_;
  }

  std::string_view head = HeadBytes();
  if (head.starts_with("\xEF\xBB\xBF")) {
    head.remove_prefix(3);
  }
  // Blank lines before the header are skipped, as the CSV decoder does.
  std::string_view first_line;
  while (!head.empty()) {
    const auto newline = head.find('\n');
    first_line = head.substr(0, newline);
    head.remove_prefix(newline == std::string_view::npos ? head.size() : newline + 1);
    if (!IsBlank(first_line)) {
      break;
    }
  }

  header_columns_ = IsBlank(first_line) ? std::vector<std::string>{} : SplitCsvLine(first_line);
  return *header_columns_;
}

std::optional<ProbeVerdict> LogFile::CachedVerdict(const std::string& tag) const {
  const auto it = verdicts_.find(tag);
  if (it == verdicts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void LogFile::RememberVerdict(const std::string& tag, ProbeVerdict verdict) {
  verdicts_[tag] = std::move(verdict);
}

}  // namespace rigtrace::io
