#pragma once

#include <filesystem>

#include "rigtrace/io/decoder.hpp"

namespace rigtrace::io {

// YAML or JSON document flattened into a single record. Nested keys are joined with '.', sequence
// items are addressed as key[i]. A top-level integer "timestamp" becomes the record timestamp.
class StructuredLogDecoder : public Decoder {
 public:
  DecodedLog Parse(const std::filesystem::path& path) const override;
};

}  // namespace rigtrace::io
