#pragma once

#include <stdexcept>
#include <string>

namespace rigtrace::interp {

// Misconfigured registry. Fatal: scans refuse to start.
class RegistryError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class DuplicateTagError : public RegistryError {
 public:
  explicit DuplicateTagError(const std::string& tag);

  const std::string& tag() const;

 private:
  std::string tag_;
};

// A facet accessor was called on an interpreter that does not carry the facet.
class FacetUnavailableError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace rigtrace::interp
