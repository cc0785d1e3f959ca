#include "rigtrace/io/csv_log.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "rigtrace/io/csv_fields.hpp"
#include "rigtrace/io/errors.hpp"

namespace rigtrace::io {
namespace {

struct CsvHeader {
  std::vector<std::string> columns;
  std::size_t timestamp_index = 0;
};

struct CsvLine {
  std::string text;
  std::uint64_t offset = 0;
  std::size_t number = 0;
};

class LineReader {
 public:
  explicit LineReader(std::ifstream& stream) : stream_(stream) {}

  // Next non-blank line, or false at end of file.
  bool Next(CsvLine* line) {
    std::string text;
    while (std::getline(stream_, text)) {
      const std::uint64_t line_offset = offset_;
      offset_ += text.size() + 1;
      ++number_;
      if (IsBlank(text)) {
        continue;
      }
      *line = CsvLine{std::move(text), line_offset, number_};
      return true;
    }
    return false;
  }

 private:
  std::ifstream& stream_;
  std::uint64_t offset_ = 0;
  std::size_t number_ = 0;
};

std::ifstream OpenOrThrow(const std::filesystem::path& path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream.is_open()) {
    throw CorruptLogError(path.string(), 0, 0, "could not open file");
  }
  return stream;
}

CsvHeader ParseHeader(const CsvLine& line, const std::filesystem::path& path) {
  std::string_view text = line.text;
  if (text.starts_with("\xEF\xBB\xBF")) {
    text.remove_prefix(3);
  }

  CsvHeader header;
  header.columns = SplitCsvLine(text);

  std::set<std::string_view> seen;
  for (const std::string& column : header.columns) {
    if (!seen.insert(column).second) {
      throw CorruptLogError(path.string(), line.offset, line.number, fmt::format("duplicate column '{}'", column));
    }
  }

  const auto it = std::find(header.columns.begin(), header.columns.end(), kTimestampColumn);
  if (it == header.columns.end()) {
    throw CorruptLogError(path.string(), line.offset, line.number, "missing 'timestamp' column");
  }
  header.timestamp_index = static_cast<std::size_t>(std::distance(header.columns.begin(), it));
  return header;
}

std::vector<std::string> SplitRow(const CsvLine& line, const CsvHeader& header, const std::filesystem::path& path) {
  auto fields = SplitCsvLine(line.text);
  if (fields.size() != header.columns.size()) {
    throw CorruptLogError(
        path.string(),
        line.offset,
        line.number,
        fmt::format("expected {} fields, found {}", header.columns.size(), fields.size()));
  }
  return fields;
}

std::int64_t ParseTimestamp(std::string_view value, const CsvLine& line, const std::filesystem::path& path) {
  std::int64_t timestamp = 0;
  const auto result = std::from_chars(value.data(), value.data() + value.size(), timestamp);
  if (value.empty() || result.ec != std::errc() || result.ptr != value.data() + value.size()) {
    throw CorruptLogError(
        path.string(), line.offset, line.number, fmt::format("timestamp '{}' is not an integer", value));
  }
  return timestamp;
}

// Last non-blank line, read backwards from the end in fixed chunks.
CsvLine ReadLastLine(std::ifstream& stream) {
  constexpr std::streamoff kChunkSize = 4096;

  stream.clear();
  stream.seekg(0, std::ios::end);
  std::streamoff position = stream.tellg();

  std::string tail;
  while (position > 0) {
    const std::streamoff read_size = std::min(kChunkSize, position);
    position -= read_size;

    std::string chunk(static_cast<std::size_t>(read_size), '\0');
    stream.seekg(position);
    stream.read(chunk.data(), read_size);
    tail.insert(0, chunk);

    std::string_view view = tail;
    while (!view.empty() && (view.back() == '\n' || view.back() == '\r' || view.back() == ' ')) {
      view.remove_suffix(1);
    }
    const auto newline = view.rfind('\n');
    if (newline != std::string_view::npos) {
      const auto offset = static_cast<std::uint64_t>(position) + newline + 1;
      return CsvLine{std::string(view.substr(newline + 1)), offset, 0};
    }
    if (position == 0) {
      return CsvLine{std::string(view), 0, 1};
    }
  }
  return CsvLine{};
}

}  // namespace

DecodedLog CsvLogDecoder::Parse(const std::filesystem::path& path) const {
  std::ifstream stream = OpenOrThrow(path);
  LineReader reader(stream);

  CsvLine line;
  if (!reader.Next(&line)) {
    throw CorruptLogError(path.string(), 0, 0, "file has no header row");
  }
  const CsvHeader header = ParseHeader(line, path);

  DecodedLog decoded;
  for (std::size_t i = 0; i < header.columns.size(); ++i) {
    if (i != header.timestamp_index) {
      decoded.field_names.push_back(header.columns[i]);
    }
  }

  while (reader.Next(&line)) {
    const auto fields = SplitRow(line, header, path);

    LogRecord record;
    record.timestamp_ns = ParseTimestamp(fields[header.timestamp_index], line, path);
    for (std::size_t i = 0; i < fields.size(); ++i) {
      if (i != header.timestamp_index) {
        record.fields.emplace(header.columns[i], ParseFieldValue(fields[i]));
      }
    }
    decoded.records.push_back(std::move(record));
  }

  std::stable_sort(decoded.records.begin(), decoded.records.end(), [](const LogRecord& lhs, const LogRecord& rhs) {
    return lhs.timestamp_ns < rhs.timestamp_ns;
  });

  return decoded;
}

std::optional<TimeSpan> CsvLogDecoder::ProbeTimeSpan(const std::filesystem::path& path) const {
  std::ifstream stream = OpenOrThrow(path);
  LineReader reader(stream);

  CsvLine header_line;
  if (!reader.Next(&header_line)) {
    throw CorruptLogError(path.string(), 0, 0, "file has no header row");
  }
  const CsvHeader header = ParseHeader(header_line, path);

  CsvLine first_line;
  if (!reader.Next(&first_line)) {
    return std::nullopt;
  }
  const auto first_fields = SplitRow(first_line, header, path);
  const std::int64_t start_ns = ParseTimestamp(first_fields[header.timestamp_index], first_line, path);

  const CsvLine last_line = ReadLastLine(stream);
  const auto last_fields = SplitRow(last_line, header, path);
  const std::int64_t end_ns = ParseTimestamp(last_fields[header.timestamp_index], last_line, path);

  return TimeSpan{start_ns, end_ns};
}

}  // namespace rigtrace::io
