#pragma once

#include <stdexcept>
#include <string>

namespace flowstore::util {

/*
  Central error types.

  ParseError and StoreError reach the operator unchanged; DecodeError is
  handled per flow; EncodeError never leaves the capture hooks.
*/

// Malformed filter expression.
class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Chunk set is incomplete or a payload does not match its schema.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage engine or transaction failure. Puts are idempotent, so the whole
// batch may be retried.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A flow snapshot that cannot be written as chunks.
class EncodeError : public std::runtime_error {
 public:
  explicit EncodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedFlowType : public EncodeError {
 public:
  explicit UnsupportedFlowType(const std::string& msg) : EncodeError(msg) {
  }
};

} // namespace flowstore::util
