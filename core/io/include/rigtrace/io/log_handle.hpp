#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "rigtrace/io/log_record.hpp"

namespace rigtrace::io {

// Immutable table of records decoded from one file. Timestamps are non-decreasing.
class LogHandle {
 public:
  LogHandle(std::filesystem::path source, DecodedLog decoded);

  LogHandle(const LogHandle&) = delete;
  LogHandle& operator=(const LogHandle&) = delete;

  const std::filesystem::path& source() const;
  const std::vector<std::string>& field_names() const;
  const std::vector<LogRecord>& records() const;

  std::size_t size() const;
  bool empty() const;
  bool HasField(std::string_view field) const;

  std::vector<std::int64_t> Timestamps() const;
  // Cells without a numeric value come back as NaN. Throws std::out_of_range for unknown fields.
  std::vector<double> NumericColumn(std::string_view field) const;
  // Index of the first record at or after timestamp_ns; size() when there is none.
  std::size_t LowerBound(std::int64_t timestamp_ns) const;

  std::int64_t start_timestamp_ns() const;
  std::int64_t end_timestamp_ns() const;

 private:
  const std::filesystem::path source_;
  const std::vector<std::string> field_names_;
  const std::vector<LogRecord> records_;
};

}  // namespace rigtrace::io
