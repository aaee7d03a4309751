#pragma once

#include <algorithm>
#include <atomic>
#include <cstring>
#include <memory>
#include <string>

#include "io/abstract_reader.hpp"

namespace objcp {

// Serves a fixed string. Counts its own destruction in *num_released.
struct FakeReader : public AbstractReader {
  FakeReader(std::string data, std::atomic<int>* num_released = nullptr)
      : data_(std::move(data)), num_released_(num_released) {}
  ~FakeReader() {
    if (num_released_) {
      num_released_->fetch_add(1);
    }
  }

  virtual int Read(void *buffer, size_t len) override {
    size_t n = std::min(len, data_.size() - offset_);
    memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return static_cast<int>(n);
  }

  virtual std::string LastError() const override {
    return "";
  }

  std::string data_;
  size_t offset_ = 0;
  std::atomic<int>* num_released_;
};

// Fails on the first Read.
struct FailingReader : public AbstractReader {
  virtual int Read(void *buffer, size_t len) override {
    return -1;
  }

  virtual std::string LastError() const override {
    return "injected read failure";
  }
};

}  // namespace objcp
