#pragma once

#include <stdexcept>
#include <string>

namespace docflow::util {

/*
  Central error types.

  Orchestrator and service errors are thrown as these; the gRPC edge
  translates them to status codes. Collaborators (OCR, sentiment, object
  storage) use TransientError / MalformedDocument / Unsupported so stages
  can classify failures as retryable or fatal.
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

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another writer owns the execution (lease held or stale version).
class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The caller gave up on the operation (cancellation or stage timeout).
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Execution record store unreachable or busy; retryable.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ------------------------------------------------------------------
// Collaborator failures
// ------------------------------------------------------------------

// Timeouts, throttling, connection errors.
class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The document cannot be processed no matter how often we retry.
class MalformedDocument : public std::runtime_error {
 public:
  explicit MalformedDocument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Permanent rejection by a collaborator (unsupported language, format, ...).
class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace docflow::util
