#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "rigtrace/io/decoder.hpp"

namespace rigtrace::io {

inline constexpr char kTimestampColumn[] = "timestamp";

// Comma separated table with a header row and an integer nanosecond "timestamp" column.
class CsvLogDecoder : public Decoder {
 public:
  DecodedLog Parse(const std::filesystem::path& path) const override;
  std::optional<TimeSpan> ProbeTimeSpan(const std::filesystem::path& path) const override;
};

}  // namespace rigtrace::io
