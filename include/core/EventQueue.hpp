#pragma once
/** @file  EventQueue.hpp
 *  @brief Unbounded multi-producer / single-consumer blocking queue.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace vibedj::core {

  /**
 * @class BlockingQueue
 * @brief FIFO guarded by one mutex; consumers wait with a timeout so they can poll other work.
 */
  template <typename T> class BlockingQueue {
  public:
    void push(T item) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        items_.push_back(std::move(item));
      }
      cv_.notify_one();
    }

    /// Pops the oldest item, waiting up to \p timeout; nullopt when nothing arrived.
    template <typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
      std::unique_lock<std::mutex> lock(mtx_);
      if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); }))
        return std::nullopt;
      T item = std::move(items_.front());
      items_.pop_front();
      return item;
    }

  private:
    std::deque<T> items_;
    std::mutex mtx_;
    std::condition_variable cv_;
  };

} // namespace vibedj::core
