#pragma once

#include <string>

namespace objcp {

/*
 * An exclusively owned byte stream. Implementations release their
 * underlying handle (file descriptor, connection) in the destructor.
 */
struct AbstractReader {
  virtual ~AbstractReader() {}
  // Return the number of bytes read, 0 at the end of the stream, -1 on failure.
  virtual int Read(void *buffer, size_t len) = 0;
  virtual std::string LastError() const = 0;
};

}  // namespace objcp
