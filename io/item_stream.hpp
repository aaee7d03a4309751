#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "base/threadsafe_queue.hpp"
#include "io/item.hpp"

namespace objcp {

const size_t kDefaultStreamCapacity = 16;

/*
 * A lazy, finite, non-restartable sequence of Items.
 *
 * The producer runs on its own thread and publishes with Push(); any
 * number of consumers take items with Next(). The sequence ends when the
 * producer returns. Destroying the stream cancels it and joins the producer.
 */
class ItemStream {
 public:
  using Producer = std::function<void(ItemStream*)>;

  explicit ItemStream(size_t capacity = kDefaultStreamCapacity) : items_(capacity) {}
  ~ItemStream();
  ItemStream(const ItemStream&) = delete;
  ItemStream& operator=(const ItemStream&) = delete;

  // Start producer on a dedicated thread.
  static std::shared_ptr<ItemStream> Spawn(Producer producer,
                                           size_t capacity = kDefaultStreamCapacity);

  // Called by the producer. Returns false once the stream is cancelled,
  // in which case the item is released and the producer should stop.
  bool Push(Item item);

  // Called by consumers. Blocks until an item is available; returns false
  // when the producer finished and the queue is drained, or on cancel.
  bool Next(Item* item);

  // Mark the end of the sequence. Spawn() calls it when the producer returns.
  void Close();

  // Drop queued items and reject further pushes.
  void Cancel();

 private:
  ThreadsafeQueue<Item> items_;
  std::thread producer_thread_;
};

}  // namespace objcp
