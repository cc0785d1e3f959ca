#include "rigtrace/io/structured_log.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "rigtrace/io/errors.hpp"

namespace rigtrace::io {
namespace {

void AddField(const std::filesystem::path& path,
              const YAML::Node& node,
              const std::string& key,
              FieldValue value,
              DecodedLog* decoded,
              LogRecord* record) {
  if (!record->fields.emplace(key, std::move(value)).second) {
    const YAML::Mark mark = node.Mark();
    const auto offset = mark.pos < 0 ? 0 : static_cast<std::uint64_t>(mark.pos);
    const auto line = mark.line < 0 ? 0 : static_cast<std::size_t>(mark.line + 1);
    throw CorruptLogError(path.string(), offset, line, fmt::format("duplicate key '{}'", key));
  }
  decoded->field_names.push_back(key);
}

void Flatten(const std::filesystem::path& path,
             const YAML::Node& node,
             const std::string& key,
             DecodedLog* decoded,
             LogRecord* record) {
  switch (node.Type()) {
    case YAML::NodeType::Map:
      for (const auto& item : node) {
        const std::string child = item.first.as<std::string>();
        Flatten(path, item.second, key.empty() ? child : fmt::format("{}.{}", key, child), decoded, record);
      }
      return;
    case YAML::NodeType::Sequence:
      for (std::size_t i = 0; i < node.size(); ++i) {
        Flatten(path, node[i], fmt::format("{}[{}]", key, i), decoded, record);
      }
      return;
    case YAML::NodeType::Scalar:
      AddField(path, node, key, ParseFieldValue(node.Scalar()), decoded, record);
      return;
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      AddField(path, node, key, std::monostate{}, decoded, record);
      return;
  }
}

CorruptLogError FromYamlError(const std::filesystem::path& path, const YAML::Exception& ex) {
  const auto offset = ex.mark.pos < 0 ? 0 : static_cast<std::uint64_t>(ex.mark.pos);
  const auto line = ex.mark.line < 0 ? 0 : static_cast<std::size_t>(ex.mark.line + 1);
  return CorruptLogError(path.string(), offset, line, ex.msg);
}

}  // namespace

DecodedLog StructuredLogDecoder::Parse(const std::filesystem::path& path) const {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::BadFile&) {
    throw CorruptLogError(path.string(), 0, 0, "could not open file");
  } catch (const YAML::ParserException& ex) {
    throw FromYamlError(path, ex);
  }

  if (!root.IsMap()) {
    throw CorruptLogError(path.string(), 0, 1, "document root is not a mapping");
  }

  DecodedLog decoded;
  LogRecord record;
  try {
    for (const auto& item : root) {
      const std::string key = item.first.as<std::string>();
      if (key == "timestamp" && item.second.IsScalar()) {
        const FieldValue value = ParseFieldValue(item.second.Scalar());
        if (const auto* timestamp = std::get_if<std::int64_t>(&value)) {
          record.timestamp_ns = *timestamp;
          continue;
        }
      }
      Flatten(path, item.second, key, &decoded, &record);
    }
  } catch (const YAML::Exception& ex) {
    throw FromYamlError(path, ex);
  }

  decoded.records.push_back(std::move(record));
  return decoded;
}

}  // namespace rigtrace::io
