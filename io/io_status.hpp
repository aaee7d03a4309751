#pragma once

#include <sstream>
#include <string>

namespace objcp {

/*
 * Outcome of a storage or network operation.
 */
class IOStatus {
 public:
  IOStatus() = default;

  static IOStatus OK() { return IOStatus(); }
  static IOStatus Error(std::string message) {
    IOStatus s;
    s.ok_ = false;
    s.message_ = std::move(message);
    return s;
  }

  bool ok() const { return ok_; }
  const std::string& message() const { return message_; }

  std::string DebugString() const {
    std::stringstream ss;
    if (ok_) {
      ss << "OK";
    } else {
      ss << "IOError: " << message_;
    }
    return ss.str();
  }

 private:
  bool ok_ = true;
  std::string message_;
};

}  // namespace objcp
