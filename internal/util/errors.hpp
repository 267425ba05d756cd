#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace woki::util {

/*
  Central error types, one per failure taxonomy entry.

  These get translated later to gRPC status codes.
*/

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoCapacity : public std::runtime_error {
 public:
  explicit NoCapacity(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TableLocked : public std::runtime_error {
 public:
  explicit TableLocked(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OutsideServiceWindow : public std::runtime_error {
 public:
  explicit OutsideServiceWindow(const std::string& msg) : std::runtime_error(msg) {
  }
};

// "invalid_input", "not_found", ... or "internal" for anything unrecognised.
std::string_view ErrorCodeName(const std::exception& e);

} // namespace woki::util
