#include "core/worker_pool.hpp"

#include "glog/logging.h"

namespace objcp {

WorkerPool::WorkerPool(size_t num_workers) : num_workers_(num_workers) {
  CHECK_GT(num_workers_, 0);
}

void WorkerPool::RunAndWait(const std::function<void(int)>& func) {
  CHECK(func);
  std::vector<std::future<void>> results;
  std::vector<std::thread> workers;
  for (size_t i = 0; i < num_workers_; ++i) {
    std::packaged_task<void()> task(std::bind(func, static_cast<int>(i)));
    results.push_back(task.get_future());
    workers.emplace_back(std::move(task));
  }
  for (std::thread& worker : workers) {
    worker.join();
  }
  for (auto& result : results) {
    result.get();
  }
}

}  // namespace objcp
