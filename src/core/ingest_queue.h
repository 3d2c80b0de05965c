#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace core {

// Unbounded multi-producer FIFO between callers adding points and the
// maintenance loop. Every operation takes mu_ for a short, bounded critical
// section (one deque push/pop, or one batch copy); no call waits for the other
// side to produce or consume.
template <typename T>
class IngestQueue {
public:
  IngestQueue() = default;
  IngestQueue(const IngestQueue&) = delete;
  IngestQueue& operator=(const IngestQueue&) = delete;

  // Returns false once the queue has been closed.
  bool enqueue(T item) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return false;
    items_.push_back(std::move(item));
    return true;
  }

  // The batch stays contiguous with respect to other producers.
  template <typename Range>
  bool enqueueAll(const Range& items) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return false;
    for (const auto& it : items) items_.push_back(it);
    return true;
  }

  std::optional<T> tryDequeue() {
    std::lock_guard<std::mutex> lk(mu_);
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  // Discards pending items; later enqueues are rejected.
  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    items_.clear();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }

private:
  mutable std::mutex mu_;
  std::deque<T> items_;
  bool closed_{false};
};

} // namespace core
