#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace conduit::rt {

template <typename T> class Sender;
template <typename T> class Receiver;

namespace detail {

// Shared state of one channel. Closed once senders_ drops to zero;
// receiverGone_ makes every later send() fail.
template <typename T>
struct ChannelState {
  std::mutex              mx;
  std::condition_variable cv;
  std::deque<T>           q;
  std::size_t             senders = 1;
  bool                    receiverGone = false;
};

} // namespace detail

// Cloneable send-end. Copying clones the handle; the channel closes when the
// last clone is released (destroyed or release()d).
template <typename T>
class Sender {
public:
  Sender() = default;

  Sender(const Sender& o) : st_(o.st_) {
    if (st_) {
      std::lock_guard<std::mutex> lk(st_->mx);
      ++st_->senders;
    }
  }

  Sender(Sender&& o) noexcept : st_(std::move(o.st_)) {}

  Sender& operator=(const Sender& o) {
    if (this != &o) {
      Sender tmp(o);
      release();
      st_ = std::move(tmp.st_);
    }
    return *this;
  }

  Sender& operator=(Sender&& o) noexcept {
    if (this != &o) {
      release();
      st_ = std::move(o.st_);
    }
    return *this;
  }

  ~Sender() { release(); }

  // Returns false (and drops v) if the receiver is gone.
  bool send(T v) {
    if (!st_) return false;
    {
      std::lock_guard<std::mutex> lk(st_->mx);
      if (st_->receiverGone) return false;
      st_->q.push_back(std::move(v));
    }
    st_->cv.notify_one();
    return true;
  }

  void release() noexcept {
    if (!st_) return;
    bool closed = false;
    {
      std::lock_guard<std::mutex> lk(st_->mx);
      closed = (--st_->senders == 0);
    }
    if (closed) st_->cv.notify_all();
    st_.reset();
  }

  bool valid() const noexcept { return static_cast<bool>(st_); }

private:
  template <typename U>
  friend std::pair<Sender<U>, Receiver<U>> makeChannel();

  explicit Sender(std::shared_ptr<detail::ChannelState<T>> st) : st_(std::move(st)) {}

  std::shared_ptr<detail::ChannelState<T>> st_;
};

// Single-owner receive-end.
template <typename T>
class Receiver {
public:
  Receiver() = default;
  Receiver(const Receiver&)            = delete;
  Receiver& operator=(const Receiver&) = delete;

  Receiver(Receiver&& o) noexcept : st_(std::move(o.st_)) {}
  Receiver& operator=(Receiver&& o) noexcept {
    if (this != &o) {
      release();
      st_ = std::move(o.st_);
    }
    return *this;
  }

  ~Receiver() { release(); }

  // Blocks until a message arrives or the channel is closed and drained.
  std::optional<T> recv() {
    if (!st_) return std::nullopt;
    std::unique_lock<std::mutex> lk(st_->mx);
    st_->cv.wait(lk, [this]{ return !st_->q.empty() || st_->senders == 0; });
    return popLocked();
  }

  std::optional<T> tryRecv() {
    if (!st_) return std::nullopt;
    std::lock_guard<std::mutex> lk(st_->mx);
    return popLocked();
  }

  template <typename Rep, typename Period>
  std::optional<T> recvFor(std::chrono::duration<Rep, Period> timeout) {
    if (!st_) return std::nullopt;
    std::unique_lock<std::mutex> lk(st_->mx);
    st_->cv.wait_for(lk, timeout, [this]{ return !st_->q.empty() || st_->senders == 0; });
    return popLocked();
  }

  // Closed: no sender left and nothing queued.
  bool closed() const {
    if (!st_) return true;
    std::lock_guard<std::mutex> lk(st_->mx);
    return st_->senders == 0 && st_->q.empty();
  }

  void release() noexcept {
    if (!st_) return;
    {
      std::lock_guard<std::mutex> lk(st_->mx);
      st_->receiverGone = true;
      st_->q.clear();
    }
    st_.reset();
  }

  bool valid() const noexcept { return static_cast<bool>(st_); }

private:
  template <typename U>
  friend std::pair<Sender<U>, Receiver<U>> makeChannel();

  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> st) : st_(std::move(st)) {}

  std::optional<T> popLocked() {
    if (st_->q.empty()) return std::nullopt;
    T v = std::move(st_->q.front());
    st_->q.pop_front();
    return v;
  }

  std::shared_ptr<detail::ChannelState<T>> st_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel() {
  auto st = std::make_shared<detail::ChannelState<T>>();
  return { Sender<T>(st), Receiver<T>(st) };
}

} // namespace conduit::rt
