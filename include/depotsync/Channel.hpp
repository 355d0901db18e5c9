#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace depotsync {

/**
 * Channel is a bounded, blocking, single-direction queue connecting two
 * pipeline stages. push() blocks while the channel is full and pop() blocks
 * while it is empty and still open.
 *
 * close() marks the end of the stream: consumers drain what is left and then
 * see std::nullopt. cancel() aborts the stream: queued items are discarded and
 * every blocked producer and consumer is released.
 */
template <typename T> class Channel {
public:
  explicit Channel(std::size_t capacity) : m_capacity(capacity ? capacity : 1) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  // Returns false if the channel was closed or cancelled.
  bool push(T value) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_notFull.wait(lock, [this]() {
      return m_closed || m_cancelled || m_items.size() < m_capacity;
    });
    if (m_closed || m_cancelled)
      return false;
    m_items.push_back(std::move(value));
    m_notEmpty.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_notEmpty.wait(lock, [this]() {
      return m_cancelled || m_closed || !m_items.empty();
    });
    if (m_cancelled || m_items.empty())
      return std::nullopt;
    T value = std::move(m_items.front());
    m_items.pop_front();
    m_notFull.notify_one();
    return value;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_closed = true;
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();
  }

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_cancelled = true;
      m_items.clear();
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
  }

  std::size_t capacity() const { return m_capacity; }

private:
  const std::size_t m_capacity;
  std::deque<T> m_items;
  bool m_closed = false;
  bool m_cancelled = false;
  mutable std::mutex m_mutex;
  std::condition_variable m_notEmpty;
  std::condition_variable m_notFull;
};

} // namespace depotsync
