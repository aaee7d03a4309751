#include "io/item_stream.hpp"

#include "glog/logging.h"

namespace objcp {

ItemStream::~ItemStream() {
  Cancel();
  if (producer_thread_.joinable()) {
    producer_thread_.join();
  }
}

std::shared_ptr<ItemStream> ItemStream::Spawn(Producer producer, size_t capacity) {
  CHECK(producer);
  auto stream = std::make_shared<ItemStream>(capacity);
  ItemStream* raw = stream.get();
  raw->producer_thread_ = std::thread([raw, producer]() {
    producer(raw);
    raw->Close();
    VLOG(1) << "Producer finished";
  });
  return stream;
}

bool ItemStream::Push(Item item) {
  if (!items_.Push(std::move(item))) {
    VLOG(1) << "Stream cancelled, dropping item";
    return false;
  }
  return true;
}

bool ItemStream::Next(Item* item) {
  return items_.WaitAndPop(item);
}

void ItemStream::Close() {
  items_.Close();
}

void ItemStream::Cancel() {
  items_.Cancel();
}

}  // namespace objcp
