#pragma once

#include <stdexcept>
#include <string>

namespace chartsync::util {

/*
  Central error types.

  Repository result codes are translated into these by the record store.
  The gRPC transport adapter maps them from status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A storage write or commit failed; the enclosing transaction was rolled back.
class TransactionFailure : public std::runtime_error {
 public:
  explicit TransactionFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chartsync::util
