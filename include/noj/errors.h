#ifndef INCLUDE_NOJ_ERRORS_H_
#define INCLUDE_NOJ_ERRORS_H_

#include <stdexcept>

// malformed or oversized code, bad metadata; raised before any worker contact
class ValidationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// the worker accepted the connection but its queue is full; retry later
class QueueFullError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// a credential was rejected, either by a worker or by us
class InvalidTokenError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// no registered worker answered its status probe
class WorkerUnreachableError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// a stored case output archive cannot be decoded
class ArtifactCorruptError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// a blob could not be written to the artifact store
class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// the shared cache could not complete a command
class CacheError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class NotFoundError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class PermissionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// delete blocked by a judging pass that may still be in flight
class ConflictError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// rejudge blocked by the dispatch cooldown
class TryLaterError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class RateLimitError : public std::runtime_error {
  long wait_for_;
 public:
  RateLimitError(const std::string& msg, long wait_for) :
      std::runtime_error(msg), wait_for_(wait_for) {}
  long WaitFor() const { return wait_for_; }
};

#endif  // INCLUDE_NOJ_ERRORS_H_
