#pragma once

#include <stdexcept>
#include <string>

namespace miner::util {

/*
  Central error types.

  Fatal errors abort the run and map to exit status 1 in main().
  Stage computations may throw any of these; the worker process
  converts them into an absent result.
*/

class FatalRunError : public std::runtime_error {
 public:
  explicit FatalRunError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class CollaboratorError : public std::runtime_error {
 public:
  explicit CollaboratorError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace miner::util
