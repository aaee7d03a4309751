#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

namespace objcp {

/*
 * A closable FIFO queue shared by many producers and consumers.
 *
 * capacity == 0 means unbounded. Push blocks while the queue is full.
 * After Close(), Push is rejected and WaitAndPop drains what is left.
 * After Cancel(), pending elements are dropped and both sides return false.
 */
template <typename T>
class ThreadsafeQueue {
 public:
  ThreadsafeQueue() = default;
  explicit ThreadsafeQueue(size_t capacity) : capacity_(capacity) {}
  ThreadsafeQueue(const ThreadsafeQueue&) = delete;
  ThreadsafeQueue& operator=(const ThreadsafeQueue&) = delete;

  bool Push(T elem) {
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [this] {
      return closed_ || capacity_ == 0 || queue_.size() < capacity_;
    });
    if (closed_) {
      return false;
    }
    queue_.push_back(std::move(elem));
    lk.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool WaitAndPop(T* elem) {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return false;
    }
    *elem = std::move(queue_.front());
    queue_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return true;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  void Cancel() {
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
      dropped.swap(queue_);
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    // dropped elements are destroyed here, outside the lock
  }

  size_t Size() {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
  }

  bool IsClosed() {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

 private:
  std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> queue_;
  size_t capacity_ = 0;
  bool closed_ = false;
};

}  // namespace objcp
