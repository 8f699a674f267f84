#pragma once

#include <stdexcept>
#include <string>

namespace srepl::util {

/*
  Central error types.

  Configuration faults stop the session (or a toolchain) until restart.
  Transient faults discard a single synchronization cycle.
*/

class ConfigurationFault : public std::runtime_error {
 public:
  explicit ConfigurationFault(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransientFault : public std::runtime_error {
 public:
  explicit TransientFault(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutionFailed : public TransientFault {
 public:
  explicit ExecutionFailed(const std::string& msg) : TransientFault(msg) {
  }
};

} // namespace srepl::util
