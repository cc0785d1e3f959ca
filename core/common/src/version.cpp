#include "rigtrace/common/version.hpp"

#ifndef RIGTRACE_VERSION
#define RIGTRACE_VERSION "0.0.0"
#endif

namespace rigtrace::common {

std::string version() {
  return RIGTRACE_VERSION;
}

}  // namespace rigtrace::common
