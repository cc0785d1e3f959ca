#include "rigtrace/io/classifier.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace rigtrace::io {

ProbeVerdict LogClassifier::Evaluate(LogFile& file) const {
  try {
    return Probe(file);
  } catch (const std::exception& ex) {
    return ProbeVerdict{false, fmt::format("probe failed: {}", ex.what())};
  }
}

bool LogClassifier::IsValid(LogFile& file, bool report_failure, std::string* reason) const {
  const ProbeVerdict verdict = Evaluate(file);
  if (verdict.valid) {
    return true;
  }

  if (report_failure) {
    spdlog::warn("{} is not a valid {} log: {}", file.path().string(), name(), verdict.reason);
  }
  if (reason != nullptr) {
    *reason = verdict.reason;
  }
  return false;
}

bool LogClassifier::IsValid(const std::filesystem::path& path, bool report_failure, std::string* reason) const {
  LogFile file(path);
  return IsValid(file, report_failure, reason);
}

SignatureClassifier::SignatureClassifier(std::string name, LogSignature signature)
    : name_(std::move(name)), signature_(std::move(signature)) {}

std::string SignatureClassifier::name() const {
  return name_;
}

ProbeCost SignatureClassifier::cost() const {
  if (!signature_.required_columns.empty()) {
    return ProbeCost::kHeader;
  }
  if (!signature_.magic_prefix.empty()) {
    return ProbeCost::kMagic;
  }
  return ProbeCost::kName;
}

const LogSignature& SignatureClassifier::signature() const {
  return signature_;
}

ProbeVerdict SignatureClassifier::Probe(LogFile& file) const {
  if (!signature_.extension.empty() && file.extension() != signature_.extension) {
    return {false, fmt::format("extension '{}' is not '{}'", file.extension(), signature_.extension)};
  }

  if (!signature_.name_fragments.empty()) {
    const std::string filename = file.filename();
    const bool named = std::any_of(
        signature_.name_fragments.begin(), signature_.name_fragments.end(), [&filename](const std::string& fragment) {
          return filename.find(fragment) != std::string::npos;
        });
    if (!named) {
      return {false, fmt::format("name does not contain any of [{}]", fmt::join(signature_.name_fragments, ", "))};
    }
  }

  if (!signature_.magic_prefix.empty() && !file.HeadBytes().starts_with(signature_.magic_prefix)) {
    return {false, "magic prefix not found"};
  }

  if (!signature_.required_columns.empty()) {
    const std::vector<std::string>& columns = file.HeaderColumns();
    std::vector<std::string> missing;
    for (const std::string& column : signature_.required_columns) {
      if (std::find(columns.begin(), columns.end(), column) == columns.end()) {
        missing.push_back(column);
      }
    }
    if (!missing.empty()) {
      return {false, fmt::format("header is missing column(s) [{}]", fmt::join(missing, ", "))};
    }
  }

  return {true, {}};
}

}  // namespace rigtrace::io
