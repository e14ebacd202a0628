#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace shopstore::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Bad input. Never retried.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

// Closing a handle that is not cached. Callers usually log and move on.
class NotOpen : public std::runtime_error {
 public:
  explicit NotOpen(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend open/load failure. Recoverable through a repair.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Local I/O failure outside the document store (metadata files, directories).
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Every unit of a bulk operation failed.
class AggregateError : public std::runtime_error {
 public:
  AggregateError(const std::string& msg, std::vector<std::string> failures)
      : std::runtime_error(msg + ": " + Join(failures)), failures_(std::move(failures)) {
  }

  const std::vector<std::string>& failures() const {
    return failures_;
  }

 private:
  static std::string Join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
      if (!out.empty()) out += "; ";
      out += part;
    }
    return out;
  }

  std::vector<std::string> failures_;
};

} // namespace shopstore::util
