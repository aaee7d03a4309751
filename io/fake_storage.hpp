#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "glog/logging.h"

#include "io/abstract_storage.hpp"

namespace objcp {

/*
 * In-memory destination. Records every attempted relative path, the bytes
 * of committed ones, and the highest number of concurrent PutFile calls.
 */
struct FakeStorage : public AbstractStorage {
  virtual std::shared_ptr<ItemStream> ListFiles() override {
    auto stream = std::make_shared<ItemStream>();
    stream->Close();
    return stream;
  }

  virtual IOStatus PutFile(Item item) override {
    std::string key = JoinPath(prefix, item.RelativePath());
    {
      std::lock_guard<std::mutex> lk(mu);
      attempted.push_back(key);
      in_flight += 1;
      max_in_flight = std::max(max_in_flight, in_flight);
    }
    if (delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    std::string data;
    char buffer[64];
    int n;
    while ((n = item.content->Read(buffer, sizeof(buffer))) > 0) {
      data.append(buffer, n);
    }
    item.Release();

    std::lock_guard<std::mutex> lk(mu);
    in_flight -= 1;
    if (n < 0) {
      return IOStatus::Error("read failed");
    }
    if (failing.count(key)) {
      return IOStatus::Error("injected write failure for " + key);
    }
    committed[key] = data;
    VLOG(1) << "writing: " << data.size() << " bytes to " << key;
    return IOStatus::OK();
  }

  std::string prefix;
  std::set<std::string> failing;
  int delay_ms = 0;

  std::mutex mu;
  std::vector<std::string> attempted;
  std::map<std::string, std::string> committed;
  int in_flight = 0;
  int max_in_flight = 0;
};

}  // namespace objcp
