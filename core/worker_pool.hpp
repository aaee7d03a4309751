#pragma once

#include <functional>
#include <future>
#include <thread>
#include <vector>

namespace objcp {

/*
 * A fixed number of workers that all run the same loop.
 * RunAndWait() is the completion barrier: no worker outlives the call.
 */
class WorkerPool {
 public:
  explicit WorkerPool(size_t num_workers);

  size_t size() const { return num_workers_; }

  // Run func(worker_id) on every worker and block until all have returned.
  // An exception thrown by a worker is rethrown here after the join.
  void RunAndWait(const std::function<void(int)>& func);

 private:
  size_t num_workers_;
};

}  // namespace objcp
