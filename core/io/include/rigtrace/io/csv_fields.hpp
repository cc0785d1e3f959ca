#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rigtrace::io {

std::string Trim(std::string_view value);

bool IsBlank(std::string_view line);

// Splits one CSV line. Double-quoted cells may contain commas; "" inside quotes is a literal quote.
std::vector<std::string> SplitCsvLine(std::string_view line);

}  // namespace rigtrace::io
