#include "rigtrace/io/log_handle.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "rigtrace/io/errors.hpp"

namespace rigtrace::io {
namespace {

std::vector<LogRecord> CheckedRecords(const std::filesystem::path& source, std::vector<LogRecord> records) {
  for (std::size_t i = 1; i < records.size(); ++i) {
    if (records[i].timestamp_ns < records[i - 1].timestamp_ns) {
      throw CorruptLogError(
          source.string(),
          0,
          i,
          fmt::format("timestamp {} of record {} precedes {}", records[i].timestamp_ns, i, records[i - 1].timestamp_ns));
    }
  }
  return records;
}

}  // namespace

LogHandle::LogHandle(std::filesystem::path source, DecodedLog decoded)
    : source_(std::move(source)),
      field_names_(std::move(decoded.field_names)),
      records_(CheckedRecords(source_, std::move(decoded.records))) {}

const std::filesystem::path& LogHandle::source() const {
  return source_;
}

const std::vector<std::string>& LogHandle::field_names() const {
  return field_names_;
}

const std::vector<LogRecord>& LogHandle::records() const {
  return records_;
}

std::size_t LogHandle::size() const {
  return records_.size();
}

bool LogHandle::empty() const {
  return records_.empty();
}

bool LogHandle::HasField(std::string_view field) const {
  return std::find(field_names_.begin(), field_names_.end(), field) != field_names_.end();
}

std::vector<std::int64_t> LogHandle::Timestamps() const {
  std::vector<std::int64_t> timestamps;
  timestamps.reserve(records_.size());
  for (const LogRecord& record : records_) {
    timestamps.push_back(record.timestamp_ns);
  }
  return timestamps;
}

std::vector<double> LogHandle::NumericColumn(std::string_view field) const {
  if (!HasField(field)) {
    throw std::out_of_range(fmt::format("{} has no field '{}'", source_.string(), field));
  }

  std::vector<double> column;
  column.reserve(records_.size());
  for (const LogRecord& record : records_) {
    const FieldValue* value = record.Find(field);
    const auto number = value != nullptr ? AsDouble(*value) : std::nullopt;
    column.push_back(number.value_or(std::numeric_limits<double>::quiet_NaN()));
  }
  return column;
}

std::size_t LogHandle::LowerBound(std::int64_t timestamp_ns) const {
  const auto it = std::lower_bound(
      records_.begin(), records_.end(), timestamp_ns, [](const LogRecord& record, std::int64_t ts) {
        return record.timestamp_ns < ts;
      });
  return static_cast<std::size_t>(std::distance(records_.begin(), it));
}

std::int64_t LogHandle::start_timestamp_ns() const {
  if (records_.empty()) {
    throw std::out_of_range(fmt::format("{} has no records", source_.string()));
  }
  return records_.front().timestamp_ns;
}

std::int64_t LogHandle::end_timestamp_ns() const {
  if (records_.empty()) {
    throw std::out_of_range(fmt::format("{} has no records", source_.string()));
  }
  return records_.back().timestamp_ns;
}

}  // namespace rigtrace::io
