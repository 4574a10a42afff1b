#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace stash {
namespace utils {

// Fixed-capacity blocking queue connecting pipeline stages.
// Producers block while the queue is full, consumers block while it is empty.
template <typename T>
class BoundedQueue {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedQueue: capacity must be positive");
    }
  }
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;


  // ---- QUEUE CONTROL METHODS ----
  // Adds an item to the back of the queue, waiting for free space.
  // Returns false when the queue was closed and the item was not queued.
  bool produce(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    queue_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  // Takes the next item, waiting until one is available.
  // Returns false once the queue is closed and drained.
  bool consume(T& item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return false;
    }
    item = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return true;
  }

  // No further items are accepted; queued items can still be consumed
  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Closes the queue and drops everything still queued
  void abort() {
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      dropped.swap(queue_);
      not_empty_.notify_all();
      not_full_.notify_all();
    }
  }


  // ---- QUERY METHODS ----
  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::size_t capacity() const { return capacity_; }

private:
  // ---- PARAMETERS ----
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> queue_;
  bool closed_{false};
};

} // namespace utils
} // namespace stash
