#include "core/copy_engine.hpp"

#include "glog/logging.h"

#include "core/worker_pool.hpp"

namespace objcp {

CopyEngine::CopyEngine(std::shared_ptr<AbstractStorage> destination, CopyOptions options)
    : destination_(destination), options_(options) {
  CHECK(destination_);
  CHECK_GE(options_.concurrency, 1);
}

bool CopyEngine::Run(std::shared_ptr<ItemStream> items) {
  CHECK(items);
  LOG(INFO) << "Starting " << options_.concurrency << " workers, options: "
            << options_.DebugString();
  WorkerPool pool(options_.concurrency);
  pool.RunAndWait([this, &items](int worker_id) { WorkLoop(worker_id, items.get()); });
  LOG(INFO) << "Copy finished: " << num_committed_.load() << " done, " << num_failed_.load()
            << " failed" << (aborted_ ? ", aborted" : "");
  return !aborted_;
}

void CopyEngine::WorkLoop(int worker_id, ItemStream* items) {
  for (;;) {
    Item item;
    if (!items->Next(&item)) {
      break;
    }
    std::string name = item.DebugString();
    VLOG(1) << "Worker " << worker_id << " takes " << name;
    IOStatus status = destination_->PutFile(std::move(item));
    if (status.ok()) {
      num_committed_ += 1;
      LOG(INFO) << "Transfer of " << name << " done";
      continue;
    }
    num_failed_ += 1;
    LOG(ERROR) << "Transfer of " << name << " failed: " << status.message();
    if (!options_.continue_on_error) {
      aborted_ = true;
      items->Cancel();
      break;
    }
  }
}

void Copy(std::shared_ptr<AbstractStorage> destination, std::shared_ptr<ItemStream> items,
          int concurrency, bool continue_on_error) {
  CopyOptions options;
  options.concurrency = concurrency;
  options.continue_on_error = continue_on_error;
  CopyEngine engine(destination, options);
  if (!engine.Run(items)) {
    LOG(FATAL) << "Aborting run after a failed transfer";
  }
}

}  // namespace objcp
