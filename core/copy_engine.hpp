#pragma once

#include <atomic>
#include <memory>
#include <sstream>
#include <string>

#include "io/abstract_storage.hpp"
#include "io/item_stream.hpp"

namespace objcp {

const int kDefaultConcurrency = 10;

struct CopyOptions {
  int concurrency = kDefaultConcurrency;
  // Log failed items and go on instead of aborting the run.
  bool continue_on_error = false;

  std::string DebugString() const {
    std::stringstream ss;
    ss << "{ concurrency: " << concurrency << ", continue_on_error: " << continue_on_error
       << " }";
    return ss.str();
  }
};

/*
 * Drains an ItemStream into a destination with a fixed number of workers.
 *
 * Every item is taken by exactly one worker and written with PutFile().
 * A failed write is always logged. With continue_on_error it is skipped,
 * otherwise the run aborts: the stream is cancelled so no further item is
 * dispatched, and writes already in flight finish before Run() returns.
 */
class CopyEngine {
 public:
  CopyEngine(std::shared_ptr<AbstractStorage> destination, CopyOptions options);

  // Block until the stream is exhausted. Return false if the run aborted.
  bool Run(std::shared_ptr<ItemStream> items);

  int GetNumCommitted() const { return num_committed_; }
  int GetNumFailed() const { return num_failed_; }

 private:
  void WorkLoop(int worker_id, ItemStream* items);

  std::shared_ptr<AbstractStorage> destination_;
  const CopyOptions options_;
  std::atomic<bool> aborted_{false};
  std::atomic<int> num_committed_{0};
  std::atomic<int> num_failed_{0};
};

// Run a copy to completion. A failed write without continue_on_error
// terminates the process.
void Copy(std::shared_ptr<AbstractStorage> destination, std::shared_ptr<ItemStream> items,
          int concurrency, bool continue_on_error);

}  // namespace objcp
