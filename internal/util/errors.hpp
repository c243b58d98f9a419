#pragma once

#include <stdexcept>
#include <string>

namespace chunkstore::util {

/*
  Central error types.

  Engine level failures arrive as db::Result codes and are translated
  into one of these at the store boundary.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidMode : public std::runtime_error {
 public:
  explicit InvalidMode(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SequencerError : public std::runtime_error {
 public:
  explicit SequencerError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chunkstore::util
