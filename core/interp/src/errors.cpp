#include "rigtrace/interp/errors.hpp"

#include <fmt/format.h>

namespace rigtrace::interp {

DuplicateTagError::DuplicateTagError(const std::string& tag)
    : RegistryError(fmt::format("Log type '{}' is already registered", tag)), tag_(tag) {}

const std::string& DuplicateTagError::tag() const {
  return tag_;
}

}  // namespace rigtrace::interp
