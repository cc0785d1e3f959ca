#include "rigtrace/io/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace rigtrace::io {

CorruptLogError::CorruptLogError(std::string path, std::uint64_t offset, std::size_t line, std::string reason)
    : std::runtime_error(fmt::format("Corrupt log {} (line {}, byte {}): {}", path, line, offset, reason)),
      path_(std::move(path)),
      offset_(offset),
      line_(line),
      reason_(std::move(reason)) {}

const std::string& CorruptLogError::path() const {
  return path_;
}

std::uint64_t CorruptLogError::offset() const {
  return offset_;
}

std::size_t CorruptLogError::line() const {
  return line_;
}

const std::string& CorruptLogError::reason() const {
  return reason_;
}

}  // namespace rigtrace::io
