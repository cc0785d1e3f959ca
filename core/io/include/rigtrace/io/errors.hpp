#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rigtrace::io {

// Raised by decoders when a file that was classified as a log type cannot be parsed.
class CorruptLogError : public std::runtime_error {
 public:
  CorruptLogError(std::string path, std::uint64_t offset, std::size_t line, std::string reason);

  const std::string& path() const;
  std::uint64_t offset() const;
  std::size_t line() const;
  const std::string& reason() const;

 private:
  std::string path_;
  std::uint64_t offset_ = 0;
  std::size_t line_ = 0;
  std::string reason_;
};

}  // namespace rigtrace::io
