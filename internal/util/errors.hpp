#pragma once

#include <stdexcept>
#include <string>

namespace mirrorsync::util {

/*
  Central error types.

  These get translated later to gRPC status codes, and back again on the
  client side, so every kind must stay distinguishable on the wire.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// pairing failures, user-correctable by issuing a fresh code

class InvalidCode : public std::runtime_error {
 public:
  explicit InvalidCode(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExpiredCode : public std::runtime_error {
 public:
  explicit ExpiredCode(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyConsumed : public std::runtime_error {
 public:
  explicit AlreadyConsumed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RateLimited : public std::runtime_error {
 public:
  explicit RateLimited(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

// transient, retried by the next cycle

class Unreachable : public std::runtime_error {
 public:
  explicit Unreachable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class HashMismatch : public std::runtime_error {
 public:
  explicit HashMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CapacityExceeded : public std::runtime_error {
 public:
  explicit CapacityExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyRunning : public std::runtime_error {
 public:
  explicit AlreadyRunning(const std::string& msg) : std::runtime_error(msg) {
  }
};

// fatal at startup only
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace mirrorsync::util
