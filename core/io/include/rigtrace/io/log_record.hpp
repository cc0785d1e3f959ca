#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rigtrace::io {

using FieldValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using FieldMap = std::map<std::string, FieldValue, std::less<>>;

struct LogRecord {
  std::int64_t timestamp_ns = 0;
  FieldMap fields;

  const FieldValue* Find(std::string_view field) const;

  bool operator==(const LogRecord&) const = default;
};

// Output of a decoder: field names in source order (timestamp excluded) and the records.
struct DecodedLog {
  std::vector<std::string> field_names;
  std::vector<LogRecord> records;
};

struct TimeSpan {
  std::int64_t start_ns = 0;
  std::int64_t end_ns = 0;
};

// Typed cell parsing shared by the text decoders: empty, True/False, integer, floating point, then string.
FieldValue ParseFieldValue(std::string_view text);

// Numeric view of a cell. Booleans map to 0/1; empty and text cells have no numeric value.
std::optional<double> AsDouble(const FieldValue& value);

std::string ToString(const FieldValue& value);

}  // namespace rigtrace::io
