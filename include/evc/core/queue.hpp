#pragma once

#include "evc/core/error.hpp"
#include "evc/types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace evc {

enum class PushStatus {
  Pushed,      // 已入队，元素已被移走
  Full,        // 队列已满 (或等待超时)，元素未被触碰
  Disconnected // 没有存活的接收端，元素未被触碰
};

inline std::ostream &operator<<(std::ostream &os, PushStatus s) {
  switch (s) {
  case PushStatus::Pushed:
    return os << "Pushed";
  case PushStatus::Full:
    return os << "Full";
  case PushStatus::Disconnected:
    return os << "Disconnected";
  }
  return os << "Unknown";
}

/**
 * @brief 多生产者-多消费者 (MPMC) 有界 FIFO 队列
 *
 * 通道的底层传输层：所有 Sender / Receiver 句柄共享同一个实例
 * (`std::shared_ptr`)，最后一个句柄释放时队列随之销毁。
 *
 * @section 特性
 * 1. 一把互斥锁保护存储，两个条件变量分别服务阻塞发送和阻塞接收。
 * 2. 句柄计数：最后一个接收端离开后发送失败；最后一个发送端离开后，
 *    接收端取完剩余数据再收到 Disconnected。
 * 3. 协程等待者：注册一个唤醒回调 (Waker)，入队时唤醒一个，
 *    断开时唤醒全部。被唤醒者必须重新尝试出队，它等待的那个元素
 *    可能已经被驱逐或被其他接收端取走。Waker 返回 false 表示
 *    等待者已不存在 (例如其 io_context 已销毁)，入队时改为唤醒下一个。
 *
 * 所有 push 接口都以 `T&` 接收元素，仅在返回 Pushed 时才会移走它，
 * 失败时调用方仍然持有原值。
 *
 * @tparam T 元素类型，满足 ChannelItem
 */
template <typename T>
  requires ChannelItem<T>
class Queue {
public:
  /// 唤醒回调；等待者已失效时返回 false
  using Waker = std::move_only_function<bool()>;

  /**
   * @param capacity 固定容量；`std::nullopt` 表示无界
   * @throws std::invalid_argument 容量为 0
   */
  explicit Queue(std::optional<std::size_t> capacity) : capacity_(capacity) {
    if (capacity_ && *capacity_ == 0) {
      throw std::invalid_argument("channel capacity must be greater than 0");
    }
  }

  Queue(const Queue &) = delete;
  Queue &operator=(const Queue &) = delete;

  // ===========================================================================
  // 句柄计数 (Handle Accounting)
  // ===========================================================================

  void add_sender() {
    std::lock_guard lock(mutex_);
    ++senders_;
  }

  void add_receiver() {
    std::lock_guard lock(mutex_);
    ++receivers_;
  }

  /// 最后一个发送端离开：唤醒所有等待中的接收端 (线程与协程)
  void release_sender() {
    std::vector<Waker> wakers;
    {
      std::lock_guard lock(mutex_);
      if (--senders_ != 0) {
        return;
      }
      wakers = take_wakers_locked();
    }
    not_empty_.notify_all();
    for (auto &wake : wakers) {
      (void)wake();
    }
  }

  /// 最后一个接收端离开：唤醒所有阻塞在满队列上的发送端
  void release_receiver() {
    {
      std::lock_guard lock(mutex_);
      if (--receivers_ != 0) {
        return;
      }
    }
    not_full_.notify_all();
  }

  [[nodiscard]] std::size_t sender_count() const {
    std::lock_guard lock(mutex_);
    return senders_;
  }

  [[nodiscard]] std::size_t receiver_count() const {
    std::lock_guard lock(mutex_);
    return receivers_;
  }

  // ===========================================================================
  // PUSH 操作 (Producer Operations)
  // ===========================================================================

  /**
   * @brief 非阻塞入队
   * @return Pushed / Full / Disconnected
   */
  [[nodiscard]] PushStatus try_push(T &value) {
    std::unique_lock lock(mutex_);
    if (receivers_ == 0) {
      return PushStatus::Disconnected;
    }
    if (full_locked()) {
      return PushStatus::Full;
    }
    enqueue_and_notify(lock, value);
    return PushStatus::Pushed;
  }

  /**
   * @brief 阻塞入队 (背压)
   * 队列满时等待，直到有空位或接收端全部离开。
   * @return Pushed / Disconnected
   */
  [[nodiscard]] PushStatus push(T &value) {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [this] { return receivers_ == 0 || !full_locked(); });
    if (receivers_ == 0) {
      return PushStatus::Disconnected;
    }
    enqueue_and_notify(lock, value);
    return PushStatus::Pushed;
  }

  /**
   * @brief 带截止时间的阻塞入队
   * @return Pushed / Disconnected；截止时间到仍无空位返回 Full
   */
  template <class Clock, class Duration>
  [[nodiscard]] PushStatus
  push_until(T &value, const std::chrono::time_point<Clock, Duration> &deadline) {
    std::unique_lock lock(mutex_);
    const bool ready = not_full_.wait_until(
        lock, deadline, [this] { return receivers_ == 0 || !full_locked(); });
    if (receivers_ == 0) {
      return PushStatus::Disconnected;
    }
    if (!ready) {
      return PushStatus::Full;
    }
    enqueue_and_notify(lock, value);
    return PushStatus::Pushed;
  }

  // ===========================================================================
  // POP 操作 (Consumer Operations)
  // ===========================================================================

  /**
   * @brief 非阻塞出队
   * 队列为空时：仍有发送端返回 Empty，否则返回 Disconnected。
   */
  [[nodiscard]] std::expected<T, TryRecvError> try_pop() {
    std::unique_lock lock(mutex_);
    if (items_.empty()) {
      return std::unexpected(senders_ == 0 ? TryRecvError::Disconnected
                                           : TryRecvError::Empty);
    }
    return dequeue_and_notify(lock);
  }

  /**
   * @brief 阻塞出队
   * 等待直到有数据；发送端全部离开且队列已空时返回 Disconnected。
   */
  [[nodiscard]] std::expected<T, RecvError> pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return senders_ == 0 || !items_.empty(); });
    if (items_.empty()) {
      return std::unexpected(RecvError::Disconnected);
    }
    return dequeue_and_notify(lock);
  }

  template <class Clock, class Duration>
  [[nodiscard]] std::expected<T, RecvTimeoutError>
  pop_until(const std::chrono::time_point<Clock, Duration> &deadline) {
    std::unique_lock lock(mutex_);
    const bool ready = not_empty_.wait_until(
        lock, deadline, [this] { return senders_ == 0 || !items_.empty(); });
    if (!items_.empty()) {
      return dequeue_and_notify(lock);
    }
    return std::unexpected(ready ? RecvTimeoutError::Disconnected
                                 : RecvTimeoutError::Timeout);
  }

  /**
   * @brief 协程接收：出队，或在队列为空时登记唤醒回调
   *
   * 检查与登记在同一把锁内完成，不会丢失唤醒。
   * 只有在返回 Empty 时才会调用 `make_waker()` 生成并登记回调。
   */
  template <typename MakeWaker>
    requires std::convertible_to<std::invoke_result_t<MakeWaker>, Waker>
  [[nodiscard]] std::expected<T, TryRecvError>
  try_pop_or_park(MakeWaker &&make_waker) {
    std::unique_lock lock(mutex_);
    if (!items_.empty()) {
      return dequeue_and_notify(lock);
    }
    if (senders_ == 0) {
      return std::unexpected(TryRecvError::Disconnected);
    }
    wakers_.push_back(std::invoke(std::forward<MakeWaker>(make_waker)));
    return std::unexpected(TryRecvError::Empty);
  }

  /// 一次性取走队列中的全部元素 (按入队顺序)
  [[nodiscard]] std::vector<T> drain() {
    std::vector<T> out;
    {
      std::lock_guard lock(mutex_);
      out.reserve(items_.size());
      for (auto &item : items_) {
        out.push_back(std::move(item));
      }
      items_.clear();
    }
    if (!out.empty()) {
      not_full_.notify_all();
    }
    return out;
  }

  // ===========================================================================
  // 状态查询 (Status Queries)
  // ===========================================================================

  [[nodiscard]] std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  [[nodiscard]] bool empty() const { return size() == 0; }

  [[nodiscard]] bool full() const {
    std::lock_guard lock(mutex_);
    return full_locked();
  }

  /// 固定容量；无界队列返回 `std::nullopt`
  [[nodiscard]] std::optional<std::size_t> capacity() const noexcept {
    return capacity_;
  }

private:
  bool full_locked() const noexcept {
    return capacity_ && items_.size() >= *capacity_;
  }

  std::vector<Waker> take_wakers_locked() {
    std::vector<Waker> out;
    out.reserve(wakers_.size());
    for (auto &w : wakers_) {
      out.push_back(std::move(w));
    }
    wakers_.clear();
    return out;
  }

  void enqueue_and_notify(std::unique_lock<std::mutex> &lock, T &value) {
    items_.push_back(std::move(value));

    Waker waker = take_front_waker_locked();
    lock.unlock();

    not_empty_.notify_one();
    // 失效的 Waker 不消耗这次唤醒
    while (waker && !waker()) {
      lock.lock();
      waker = take_front_waker_locked();
      lock.unlock();
    }
  }

  Waker take_front_waker_locked() {
    Waker waker;
    if (!wakers_.empty()) {
      waker = std::move(wakers_.front());
      wakers_.pop_front();
    }
    return waker;
  }

  T dequeue_and_notify(std::unique_lock<std::mutex> &lock) {
    T value = std::move(items_.front());
    items_.pop_front();
    lock.unlock();

    if (capacity_) {
      not_full_.notify_one();
    }
    return value;
  }

  const std::optional<std::size_t> capacity_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;

  std::deque<T> items_;
  std::deque<Waker> wakers_;
  std::size_t senders_ = 0;
  std::size_t receivers_ = 0;
};

} // namespace evc
