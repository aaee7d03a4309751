#pragma once

#include <memory>
#include <string>

#include "io/abstract_reader.hpp"
#include "io/io_status.hpp"

namespace objcp {

class FileReader : public AbstractReader {
 public:
  ~FileReader();
  static IOStatus Open(const std::string& path, std::unique_ptr<FileReader>* reader);

  virtual int Read(void *buffer, size_t len) override;
  virtual std::string LastError() const override { return error_; }

 private:
  FileReader(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

  std::string path_;
  int fd_;
  std::string error_;
};

}  // namespace objcp
