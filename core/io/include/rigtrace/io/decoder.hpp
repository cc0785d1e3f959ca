#pragma once

#include <filesystem>
#include <optional>

#include "rigtrace/io/log_record.hpp"

namespace rigtrace::io {

// Turns one file into ordered records. Implementations throw CorruptLogError on malformed input,
// must return equal records when parsing the same file twice, and never look at other files.
class Decoder {
 public:
  virtual ~Decoder() = default;

  virtual DecodedLog Parse(const std::filesystem::path& path) const = 0;

  // First and last timestamp without a full decode. Decoders that cannot do it return std::nullopt.
  virtual std::optional<TimeSpan> ProbeTimeSpan(const std::filesystem::path& path) const;
};

}  // namespace rigtrace::io
