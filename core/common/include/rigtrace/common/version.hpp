#pragma once

#include <string>

namespace rigtrace::common {

std::string version();

}  // namespace rigtrace::common
