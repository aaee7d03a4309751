#include "io/file_reader.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <climits>

#include "glog/logging.h"

namespace objcp {

FileReader::~FileReader() {
  if (fd_ >= 0 && ::close(fd_) != 0) {
    LOG(WARNING) << "Closing " << path_ << " failed: " << strerror(errno);
  }
}

IOStatus FileReader::Open(const std::string& path, std::unique_ptr<FileReader>* reader) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return IOStatus::Error("cannot open " + path + ": " + strerror(errno));
  }
  reader->reset(new FileReader(path, fd));
  return IOStatus::OK();
}

int FileReader::Read(void *buffer, size_t len) {
  if (len > INT_MAX) {
    len = INT_MAX;
  }
  ssize_t nbytes;
  do {
    nbytes = ::read(fd_, buffer, len);
  } while (nbytes < 0 && errno == EINTR);
  if (nbytes < 0) {
    error_ = "cannot read " + path_ + ": " + strerror(errno);
    return -1;
  }
  return static_cast<int>(nbytes);
}

}  // namespace objcp
