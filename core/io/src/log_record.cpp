#include "rigtrace/io/log_record.hpp"

#include <charconv>
#include <cmath>
#include <type_traits>

#include <fmt/format.h>

namespace rigtrace::io {

const FieldValue* LogRecord::Find(std::string_view field) const {
  const auto it = fields.find(field);
  return it == fields.end() ? nullptr : &it->second;
}

FieldValue ParseFieldValue(std::string_view text) {
  if (text.empty()) {
    return std::monostate{};
  }
  if (text == "True" || text == "true" || text == "TRUE") {
    return true;
  }
  if (text == "False" || text == "false" || text == "FALSE") {
    return false;
  }

  const char* first = text.data();
  const char* last = text.data() + text.size();

  std::int64_t integer = 0;
  const auto int_result = std::from_chars(first, last, integer);
  if (int_result.ec == std::errc() && int_result.ptr == last) {
    return integer;
  }

  double number = 0.0;
  const auto double_result = std::from_chars(first, last, number);
  if (double_result.ec == std::errc() && double_result.ptr == last) {
    return number;
  }

  return std::string(text);
}

std::optional<double> AsDouble(const FieldValue& value) {
  return std::visit(
      [](const auto& v) -> std::optional<double> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return v ? 1.0 : 0.0;
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
          return static_cast<double>(v);
        } else {
          return std::nullopt;
        }
      },
      value);
}

std::string ToString(const FieldValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return {};
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "True" : "False";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return fmt::format("{}", v);
        }
      },
      value);
}

}  // namespace rigtrace::io
