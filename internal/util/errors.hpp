#pragma once

#include <stdexcept>
#include <string>

namespace sitepull::util {

/*
  Central error types.

  Server adapters translate these to gRPC status codes; the client transport
  translates non-OK statuses back into them.
*/

// Malformed cursor, unexpected response shape, unknown job.
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Network or remote failure. Only retryable ones are attempted again.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg, bool retryable = true) : std::runtime_error(msg), retryable_(retryable) {
  }

  bool Retryable() const noexcept {
    return retryable_;
  }

 private:
  bool retryable_;
};

// Bad caller input: paths, options, configuration values.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Local filesystem or key/value store failure.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Failure reported by the exported database.
class SourceError : public std::runtime_error {
 public:
  explicit SourceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sitepull::util
