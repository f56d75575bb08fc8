#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

/**
 * Bounded multi-producer/multi-consumer queue.
 *
 * send() blocks while the channel is full, receive() blocks while it is
 * empty. After close() every blocked call wakes up: send() returns false and
 * receive() keeps returning the items still queued, then std::nullopt.
 */
template <typename T> class Channel {
public:
  explicit Channel(size_t capacity) : capacity_(capacity ? capacity : 1) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  // Invoked after every successful send, outside the lock. Must be set
  // before the channel is shared.
  void setSendHook(std::function<void()> hook) { sendHook_ = std::move(hook); }

  bool send(T value) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      notFull_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
      if (closed_)
        return false;
      queue_.push_back(std::move(value));
    }
    notEmpty_.notify_one();
    if (sendHook_)
      sendHook_();
    return true;
  }

  std::optional<T> receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    notEmpty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    return popLocked(lock);
  }

  // Like receive() but gives up after timeout. Use isClosed() to tell a
  // timeout from a closed channel.
  template <typename Rep, typename Period>
  std::optional<T> receiveFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    return popLocked(lock);
  }

  std::optional<T> tryReceive() {
    std::unique_lock<std::mutex> lock(mutex_);
    return popLocked(lock);
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
  }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

private:
  std::optional<T> popLocked(std::unique_lock<std::mutex> &lock) {
    if (queue_.empty())
      return std::nullopt;
    std::optional<T> value(std::move(queue_.front()));
    queue_.pop_front();
    lock.unlock();
    notFull_.notify_one();
    return value;
  }

  const size_t capacity_;
  std::deque<T> queue_;
  bool closed_ = false;
  mutable std::mutex mutex_;
  std::condition_variable notEmpty_;
  std::condition_variable notFull_;
  std::function<void()> sendHook_;
};
