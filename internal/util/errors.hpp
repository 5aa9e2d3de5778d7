#pragma once

#include <stdexcept>
#include <string>

namespace notewatch::util {

/*
  Central error types.

  Watch and persistence errors surface to the pipeline; observer errors
  never leave the dispatcher, they become Failed results.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The note directory cannot be observed. Fatal to the watch loop.
class WatchError : public std::runtime_error {
 public:
  explicit WatchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Script fault, interpreter fault or timeout inside one observer.
class ObserverExecutionError : public std::runtime_error {
 public:
  explicit ObserverExecutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The note changed on disk between dispatch start and commit.
class MergeConflictError : public std::runtime_error {
 public:
  explicit MergeConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace notewatch::util
