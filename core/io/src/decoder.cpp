#include "rigtrace/io/decoder.hpp"

namespace rigtrace::io {

std::optional<TimeSpan> Decoder::ProbeTimeSpan(const std::filesystem::path& /*path*/) const {
  return std::nullopt;
}

}  // namespace rigtrace::io
