#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace stockcount::util {

/*
  Central error types.

  Local and lifecycle errors are thrown synchronously to the caller.
  Remote write failures are never thrown; they stay in the pending queue.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidQuantity : public ValidationError {
 public:
  explicit InvalidQuantity(const std::string& msg) : ValidationError(msg) {
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

class SessionConflict : public std::runtime_error {
 public:
  explicit SessionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoPausedSession : public std::runtime_error {
 public:
  explicit NoPausedSession(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Area data could be neither fetched nor served from the local cache.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The device-local store rejected a read or write.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IncompleteDecisions : public std::runtime_error {
 public:
  IncompleteDecisions(std::vector<std::string> item_ids, std::vector<std::string> item_names);

  const std::vector<std::string>& ItemIds() const {
    return item_ids_;
  }
  const std::vector<std::string>& ItemNames() const {
    return item_names_;
  }

 private:
  std::vector<std::string> item_ids_;
  std::vector<std::string> item_names_;
};

} // namespace stockcount::util
