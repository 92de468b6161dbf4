#pragma once

#include <stdexcept>
#include <string>

namespace strata::util {

/*
  Central error types.

  Driver errors (pqxx::*) are never translated into these; they pass
  through the db layer untouched so callers can catch the exact type.
*/

// Retries on serialization conflicts were exhausted.
class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg = "serialization error: retries exhausted") : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg = "operation cancelled") : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg = "deadline exceeded") : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace strata::util
