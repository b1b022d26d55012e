#pragma once

#include <stdexcept>
#include <string>

namespace netmap::util {

/*
  Central error types.

  Record-level problems are never thrown; they are collected into the
  MergeReport. Everything here aborts the current call.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient store failure (busy, serialization conflict, lock timeout).
// Retried with backoff; surfaces to the caller only once retries are exhausted.
class StoreTransactionError : public std::runtime_error {
 public:
  explicit StoreTransactionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Fatal. Never retried.
class StoreCorruptionError : public std::runtime_error {
 public:
  explicit StoreCorruptionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace netmap::util
