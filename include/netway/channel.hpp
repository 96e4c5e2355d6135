/**
 * @file channel.hpp
 * @brief Bounded, blocking, closeable message channel between netway layers.
 *
 * @details
 * ## What it is
 * The only way the transport, the Filter and the application talk to each
 * other. A `Channel<T, CAP>` is a FIFO with a fixed capacity stored in an
 * `etl::deque<T, CAP>`: memory is reserved up front and never grows, the
 * same way the node inbox/outbox queues are sized at compile time.
 *
 * ## Semantics
 * - **Backpressure, not loss.** `send()` blocks while the channel is full.
 *   `try_send()` is the non-blocking form and reports fullness with `false`.
 * - **Close.** `close()` wakes every waiter. After close, sends fail and
 *   receivers drain what is left, then get `false`.
 * - **Wake signal.** A consumer that waits on several channels at once (the
 *   Filter waits on three) attaches one shared `Signal` to each; every
 *   successful send bumps it. The consumer reads `Signal::generation()`,
 *   drains its channels, then `wait_for()`s a change, so a send that lands
 *   between draining and waiting is never missed.
 *
 * ## Ownership
 * Channels are shared by `std::shared_ptr`. Items move in and move out; no
 * reference to a queued item ever escapes the lock.
 *
 * @code
 *   auto ch = std::make_shared<netway::Channel<int>>();
 *   std::thread producer([ch] { for (int i = 0; i < 10; ++i) ch->send(i); ch->close(); });
 *   int v;
 *   while (ch->recv(v)) { ... }
 *   producer.join();
 * @endcode
 */
#ifndef NETWAY_CHANNEL_HPP
#define NETWAY_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "etl/deque.h"

namespace netway {

/// Default capacity for every inter-layer channel.
static constexpr size_t CHANNEL_LEN = 256;

/**
 * @class Signal
 * @brief Generation counter + condition variable shared by several channels.
 */
class Signal {
public:
  void notify() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++generation_;
    }
    cv_.notify_all();
  }

  uint64_t generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
  }

  /**
   * @brief Wait until the generation differs from `seen` or `timeout` passes.
   * @return true if woken by a notify, false on timeout.
   */
  bool wait_for(uint64_t seen, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return generation_ != seen; });
  }

private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  uint64_t                generation_{0};
};

template <typename T, size_t CAP = CHANNEL_LEN>
class Channel {
public:
  static constexpr size_t CAPACITY = CAP;

  Channel() = default;
  ~Channel() { close(); }

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  /**
   * @brief Enqueue, blocking while the channel is full.
   * @retval true  Item queued.
   * @retval false Channel closed (before or while waiting); item dropped.
   */
  bool send(T item) {
    std::shared_ptr<Signal> signal;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      not_full_.wait(lock, [this] { return closed_ || !queue_.full(); });
      if (closed_) return false;
      queue_.push_back(std::move(item));
      signal = signal_;
    }
    not_empty_.notify_one();
    if (signal) signal->notify();
    return true;
  }

  /**
   * @brief Enqueue without waiting.
   * @retval false Channel full or closed; item not queued.
   */
  bool try_send(T item) {
    std::shared_ptr<Signal> signal;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || queue_.full()) return false;
      queue_.push_back(std::move(item));
      signal = signal_;
    }
    not_empty_.notify_one();
    if (signal) signal->notify();
    return true;
  }

  /**
   * @brief Dequeue the oldest item without waiting.
   * @retval false Nothing queued.
   */
  bool try_recv(T& out) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue_.empty()) return false;
      out = std::move(queue_.front());
      queue_.pop_front();
    }
    not_full_.notify_one();
    return true;
  }

  /**
   * @brief Dequeue, blocking until an item arrives.
   * @param timeout  0 waits forever.
   * @retval false Timed out, or the channel is closed and drained.
   */
  bool recv(T& out, std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      auto ready = [this] { return closed_ || !queue_.empty(); };
      if (timeout.count() > 0) {
        if (!not_empty_.wait_for(lock, timeout, ready)) return false;
      } else {
        not_empty_.wait(lock, ready);
      }
      if (queue_.empty()) return false;   // closed and drained
      out = std::move(queue_.front());
      queue_.pop_front();
    }
    not_full_.notify_one();
    return true;
  }

  /// Refuse further sends and wake every waiter. Idempotent.
  void close() {
    std::shared_ptr<Signal> signal;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return;
      closed_ = true;
      signal  = signal_;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
    if (signal) signal->notify();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  /// Attach the consumer's wake signal (replaces any previous one).
  void set_signal(std::shared_ptr<Signal> signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    signal_ = std::move(signal);
  }

private:
  mutable std::mutex      mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  etl::deque<T, CAP>      queue_;     ///< Fixed-capacity storage; full() drives backpressure.
  bool                    closed_{false};
  std::shared_ptr<Signal> signal_;
};

} // namespace netway

#endif // NETWAY_CHANNEL_HPP
