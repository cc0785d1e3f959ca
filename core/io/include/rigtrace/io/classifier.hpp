#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "rigtrace/io/log_file.hpp"

namespace rigtrace::io {

// Relative price of a probe. Registries run cheaper probes first.
enum class ProbeCost : std::uint8_t {
  kName = 0,
  kMagic = 1,
  kHeader = 2,
  kFullParse = 3,
};

class LogClassifier {
 public:
  virtual ~LogClassifier() = default;

  virtual std::string name() const = 0;
  virtual ProbeCost cost() const = 0;

  // Never throws: a probe that fails is a negative verdict carrying the failure as its reason.
  ProbeVerdict Evaluate(LogFile& file) const;

  // With report_failure set, a negative result is logged with its reason. The reason is copied to
  // *reason either way.
  bool IsValid(LogFile& file, bool report_failure, std::string* reason = nullptr) const;
  bool IsValid(const std::filesystem::path& path, bool report_failure, std::string* reason = nullptr) const;

 protected:
  virtual ProbeVerdict Probe(LogFile& file) const = 0;
};

struct LogSignature {
  std::string extension;
  // The file name must contain at least one of these, when non-empty.
  std::vector<std::string> name_fragments;
  std::string magic_prefix;
  // The first line must contain every one of these columns.
  std::vector<std::string> required_columns;
};

class SignatureClassifier : public LogClassifier {
 public:
  SignatureClassifier(std::string name, LogSignature signature);

  std::string name() const override;
  ProbeCost cost() const override;

  const LogSignature& signature() const;

 protected:
  ProbeVerdict Probe(LogFile& file) const override;

 private:
  std::string name_;
  LogSignature signature_;
};

}  // namespace rigtrace::io
