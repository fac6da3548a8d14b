#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace escrow {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: An unbounded FIFO that many threads can push to and pop
// from without data races. Offers a blocking pop(), a bounded wait
// pop_for(), and a non-blocking try_pop().
//
// Why in architecture: Sits between the EventBus and the IPC thread. Escrow
// events are published on whichever thread ran the escrow operation (a
// command handler, a test thread, the reconcile loop); the EscrowEngine's
// bus subscriber hands each event to IpcServer::pushTelemetry(), which
// queues it here, and the IPC thread drains the queue onto the PUB socket.
// No escrow operation ever waits on the socket.
//
// Thread model: Not tied to any thread. Safe for multiple producers and
// multiple consumers. pop() may block the caller until another thread
// pushes; pop_for() blocks at most its timeout; the other methods never
// block beyond the mutex.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable and non-movable: the mutex and condition variable are
  // neither. Share the queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item at the back and wakes one waiting consumer.
  // Why: IpcServer::pushTelemetry() hands each escrow event to the IPC
  // thread without touching the socket itself.
  // Thread-safety: Any thread. The mutex is held only while the deque
  // changes; the notify happens after it is released.
  // Input: value, taken by value so callers can std::move into it.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer can take it at once.
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting for one if the queue
  // is empty.
  // Why: For a consumer with nothing else to do; waiting on the condition
  // variable avoids a busy loop.
  // Thread-safety: Any thread. The predicate is re-checked after every
  // wakeup, so spurious wakeups are harmless.
  // Output: the front item, moved out.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout) — bounded wait
  // -------------------------------------------------------------------------
  // What: Like pop(), but gives up after `timeout` and returns nullopt.
  // Why: For a consumer that must also notice a stop flag or other work
  // while the queue stays empty.
  // Thread-safety: Any thread.
  // Output: the front item, or std::nullopt if none arrived in time.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item if there is one; otherwise
  // returns nullopt at once.
  // Why: The IPC thread drains everything already queued between
  // command polls, and once more before its sockets close.
  // Thread-safety: Any thread. Short critical section.
  // Output: the front item, or std::nullopt if the queue was empty.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // empty() / size()
  // -------------------------------------------------------------------------
  // What: Snapshot of the queue's state. Another thread may push or pop
  // right after the call returns.
  // Why: Logging and tests. Consumers should use try_pop() instead of
  // checking empty() first.
  // Thread-safety: Any thread; reads under the mutex.
  // -------------------------------------------------------------------------
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  // Guards queue_ and pairs with condition_. mutable so the const
  // snapshots can lock it.
  mutable std::mutex mutex_;

  // Signalled on every push. There is no "not full" condition: the queue
  // is unbounded.
  std::condition_variable condition_;

  std::deque<T> queue_;
};

}  // namespace escrow
