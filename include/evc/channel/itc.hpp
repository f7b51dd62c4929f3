#pragma once

#include "evc/core/error.hpp"
#include "evc/core/queue.hpp"
#include "evc/types.hpp"
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/basic_waitable_timer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/wait_traits.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace evc::itc {

namespace detail {

/**
 * @brief 协程/回调式接收操作
 *
 * 出队成功或通道断开时完成；队列为空时挂起在自己的定时器上
 * (到期时间为无穷远)，并向 Queue 登记一个只持有弱引用的 Waker。
 * 发送端唤醒时 cancel 该定时器，操作回到 handler 的执行器上重新尝试。
 * 若唤醒它的那个元素已被驱逐或被其他接收端取走，就再次挂起，
 * 继续等待下一个元素。
 *
 * 挂起期间操作由定时器的等待 handler 持有：未完成的等待使
 * `io_context::run()` 不会提前返回；io_context 销毁时操作随之析构，
 * Queue 中残留的 Waker 失效，之后的发送会跳过它。
 */
template <typename T, typename Handler> class ReceiveOp {
  using Executor = boost::asio::associated_executor_t<Handler>;
  using Clock = std::chrono::steady_clock;
  using Timer =
      boost::asio::basic_waitable_timer<Clock, boost::asio::wait_traits<Clock>,
                                        Executor>;

  // 一次挂起的唤醒状态，Waker 只持有它的 weak_ptr
  struct Parking {
    std::mutex mutex;
    Timer *timer = nullptr;
    bool woken = false;
  };

public:
  static void start(std::shared_ptr<Queue<T>> queue, Handler handler) {
    auto ex = boost::asio::get_associated_executor(handler);
    attempt(std::unique_ptr<ReceiveOp>(
        new ReceiveOp(std::move(queue), std::move(handler), ex)));
  }

  ReceiveOp(const ReceiveOp &) = delete;
  ReceiveOp &operator=(const ReceiveOp &) = delete;

  ~ReceiveOp() { unpark(); }

private:
  ReceiveOp(std::shared_ptr<Queue<T>> queue, Handler handler,
            const Executor &ex)
      : queue_(std::move(queue)), handler_(std::move(handler)), timer_(ex) {}

  static void attempt(std::unique_ptr<ReceiveOp> op) {
    op->unpark();

    auto parking = std::make_shared<Parking>();
    auto result =
        op->queue_->try_pop_or_park([&parking]() -> typename Queue<T>::Waker {
          return [weak = std::weak_ptr<Parking>(parking)] { return wake(weak); };
        });

    if (result) {
      complete(std::move(op), RecvResult<T>(std::move(*result)));
    } else if (result.error() == TryRecvError::Disconnected) {
      complete(std::move(op),
               RecvResult<T>(std::unexpect, RecvError::Disconnected));
    } else {
      park(std::move(op), std::move(parking));
    }
  }

  // 在发送端线程上被调用。操作已析构时返回 false，由 Queue 唤醒下一个
  static bool wake(const std::weak_ptr<Parking> &weak) {
    auto parking = weak.lock();
    if (!parking) {
      return false;
    }
    std::lock_guard<std::mutex> guard(parking->mutex);
    parking->woken = true;
    if (parking->timer) {
      parking->timer->cancel();
    }
    return true;
  }

  static void park(std::unique_ptr<ReceiveOp> op,
                   std::shared_ptr<Parking> parking) {
    std::lock_guard<std::mutex> guard(parking->mutex);
    op->parking_ = parking;

    auto &timer = op->timer_;
    if (parking->woken) {
      // 登记之后、挂起之前就被唤醒了
      boost::asio::post(timer.get_executor(), [op = std::move(op)]() mutable {
        attempt(std::move(op));
      });
      return;
    }

    parking->timer = &timer;
    timer.expires_at(Timer::time_point::max());
    timer.async_wait(
        [op = std::move(op)](const boost::system::error_code &) mutable {
          attempt(std::move(op));
        });
  }

  void unpark() {
    if (parking_) {
      std::lock_guard<std::mutex> guard(parking_->mutex);
      parking_->timer = nullptr;
    }
    parking_.reset();
  }

  static void complete(std::unique_ptr<ReceiveOp> op, RecvResult<T> result) {
    auto ex = op->timer_.get_executor();
    auto handler = std::move(op->handler_);
    op.reset();
    boost::asio::post(ex, [handler = std::move(handler),
                           result = std::move(result)]() mutable {
      std::move(handler)(std::move(result));
    });
  }

  std::shared_ptr<Queue<T>> queue_;
  Handler handler_;
  Timer timer_;
  std::shared_ptr<Parking> parking_;
};

template <typename T> struct ReceiveInitiation {
  std::shared_ptr<Queue<T>> queue;

  template <typename Handler> void operator()(Handler &&handler) const {
    ReceiveOp<T, std::decay_t<Handler>>::start(queue,
                                                std::forward<Handler>(handler));
  }
};

} // namespace detail

template <typename T>
  requires ChannelItem<T>
class Receiver;

// =========================================================
// Sender
// =========================================================

/**
 * @brief 发送端句柄
 *
 * 可复制：复制即克隆，多个发送端共享同一个队列；
 * 最后一个发送端析构后，接收端取完剩余数据即收到 Disconnected。
 */
template <typename T>
  requires ChannelItem<T>
class Sender {
public:
  using DataType = T;

  explicit Sender(std::shared_ptr<Queue<T>> queue) : queue_(std::move(queue)) {
    queue_->add_sender();
  }

  Sender(const Sender &other) : queue_(other.queue_) {
    if (queue_) {
      queue_->add_sender();
    }
  }

  Sender &operator=(const Sender &other) {
    if (this != &other) {
      Sender copy(other);
      *this = std::move(copy);
    }
    return *this;
  }

  Sender(Sender &&) noexcept = default;

  Sender &operator=(Sender &&other) noexcept {
    if (this != &other) {
      reset();
      queue_ = std::move(other.queue_);
    }
    return *this;
  }

  ~Sender() { reset(); }

  // --- 基础接口 ---

  /// 阻塞发送 (背压)：队列满时等待，直到有空位或接收端全部离开
  std::expected<void, SendError<T>> send(T value) {
    if (queue_->push(value) == PushStatus::Disconnected) {
      return std::unexpected(SendError<T>{std::move(value)});
    }
    return {};
  }

  std::expected<void, TrySendError<T>> try_send(T value) {
    switch (queue_->try_push(value)) {
    case PushStatus::Pushed:
      return {};
    case PushStatus::Full:
      return std::unexpected(
          TrySendError<T>{TrySendError<T>::Kind::Full, std::move(value)});
    case PushStatus::Disconnected:
      break;
    }
    return std::unexpected(
        TrySendError<T>{TrySendError<T>::Kind::Disconnected, std::move(value)});
  }

  // --- 超时接口 ---
  template <class Rep, class Period>
  std::expected<void, SendTimeoutError<T>>
  send(T value, const std::chrono::duration<Rep, Period> &timeout) {
    return send(std::move(value), std::chrono::steady_clock::now() + timeout);
  }

  template <class Clock, class Duration>
  std::expected<void, SendTimeoutError<T>>
  send(T value, const std::chrono::time_point<Clock, Duration> &deadline) {
    switch (queue_->push_until(value, deadline)) {
    case PushStatus::Pushed:
      return {};
    case PushStatus::Full:
      return std::unexpected(SendTimeoutError<T>{
          SendTimeoutError<T>::Kind::Timeout, std::move(value)});
    case PushStatus::Disconnected:
      break;
    }
    return std::unexpected(SendTimeoutError<T>{
        SendTimeoutError<T>::Kind::Disconnected, std::move(value)});
  }

  // --- 批量接口 ---
  /// 非阻塞批量发送，遇到满队列或断开即停止，返回已发送数量
  template <typename InputIt> std::size_t send_batch(InputIt first, InputIt last) {
    std::size_t count = 0;
    while (first != last) {
      if (!try_send(T(*first))) {
        break;
      }
      ++first;
      ++count;
    }
    return count;
  }

  // --- 状态查询 ---
  std::size_t size() const { return queue_->size(); }
  bool is_empty() const { return queue_->empty(); }
  bool is_full() const { return queue_->full(); }
  std::optional<std::size_t> capacity() const noexcept {
    return queue_->capacity();
  }
  bool is_disconnected() const { return queue_->receiver_count() == 0; }
  std::size_t sender_count() const { return queue_->sender_count(); }
  std::size_t receiver_count() const { return queue_->receiver_count(); }

  bool same_channel(const Sender &other) const noexcept {
    return queue_ == other.queue_;
  }

private:
  friend class Receiver<T>;

  void reset() noexcept {
    if (queue_) {
      queue_->release_sender();
      queue_.reset();
    }
  }

  std::shared_ptr<Queue<T>> queue_;
};

// =========================================================
// Receiver
// =========================================================

/**
 * @brief 接收端句柄
 *
 * 可复制：多个接收端竞争同一个队列，每个元素只会交付给其中一个。
 * 最后一个接收端析构后，所有发送都会失败并交还元素。
 */
template <typename T>
  requires ChannelItem<T>
class Receiver {
public:
  using DataType = T;

  explicit Receiver(std::shared_ptr<Queue<T>> queue)
      : queue_(std::move(queue)) {
    queue_->add_receiver();
  }

  Receiver(const Receiver &other) : queue_(other.queue_) {
    if (queue_) {
      queue_->add_receiver();
    }
  }

  Receiver &operator=(const Receiver &other) {
    if (this != &other) {
      Receiver copy(other);
      *this = std::move(copy);
    }
    return *this;
  }

  Receiver(Receiver &&) noexcept = default;

  Receiver &operator=(Receiver &&other) noexcept {
    if (this != &other) {
      reset();
      queue_ = std::move(other.queue_);
    }
    return *this;
  }

  ~Receiver() { reset(); }

  // --- 基础接口 ---
  RecvResult<T> receive() { return queue_->pop(); }
  std::expected<T, TryRecvError> try_receive() { return queue_->try_pop(); }

  // --- 超时接口 ---
  template <class Rep, class Period>
  std::expected<T, RecvTimeoutError>
  receive(const std::chrono::duration<Rep, Period> &timeout) {
    return queue_->pop_until(std::chrono::steady_clock::now() + timeout);
  }

  template <class Clock, class Duration>
  std::expected<T, RecvTimeoutError>
  receive(const std::chrono::time_point<Clock, Duration> &deadline) {
    return queue_->pop_until(deadline);
  }

  // --- 批量接口 ---
  template <typename OutputIt>
  std::size_t receive_batch(OutputIt d_first, std::size_t max_count) {
    std::size_t count = 0;
    while (count < max_count) {
      auto item = queue_->try_pop();
      if (!item) {
        break;
      }
      *d_first++ = std::move(*item);
      ++count;
    }
    return count;
  }

  /// 取走当前队列中的全部元素，不等待
  std::vector<T> drain() { return queue_->drain(); }

  // --- 异步接口 (Boost.Asio) ---

  /**
   * @brief 异步接收，支持任意 Asio 完成令牌
   *
   * 完成签名为 `void(RecvResult<T>)`。协程中直接使用 `receive_async()`。
   */
  template <typename CompletionToken>
  auto async_receive(CompletionToken &&token) {
    return boost::asio::async_initiate<CompletionToken, void(RecvResult<T>)>(
        detail::ReceiveInitiation<T>{queue_}, token);
  }

  boost::asio::awaitable<RecvResult<T>> receive_async() {
    co_return co_await async_receive(boost::asio::use_awaitable);
  }

  // --- 状态查询 ---
  std::size_t size() const { return queue_->size(); }
  bool is_empty() const { return queue_->empty(); }
  bool is_full() const { return queue_->full(); }
  std::optional<std::size_t> capacity() const noexcept {
    return queue_->capacity();
  }
  bool is_disconnected() const { return queue_->sender_count() == 0; }
  std::size_t sender_count() const { return queue_->sender_count(); }
  std::size_t receiver_count() const { return queue_->receiver_count(); }

  bool same_channel(const Receiver &other) const noexcept {
    return queue_ == other.queue_;
  }
  bool same_channel(const Sender<T> &other) const noexcept {
    return queue_ == other.queue_;
  }

private:
  void reset() noexcept {
    if (queue_) {
      queue_->release_receiver();
      queue_.reset();
    }
  }

  std::shared_ptr<Queue<T>> queue_;
};

// =========================================================
// 工厂
// =========================================================

/**
 * @brief 创建有界通道
 * @throws std::invalid_argument capacity 为 0
 */
template <typename T>
  requires ChannelItem<T>
auto bounded(std::size_t capacity = config::DEFAULT_CAPACITY) {
  auto queue = std::make_shared<Queue<T>>(capacity);
  return std::make_pair(Sender<T>(queue), Receiver<T>(queue));
}

/// 创建无界通道：发送永远不会因容量而阻塞或失败
template <typename T>
  requires ChannelItem<T>
auto unbounded() {
  auto queue = std::make_shared<Queue<T>>(std::nullopt);
  return std::make_pair(Sender<T>(queue), Receiver<T>(queue));
}

} // namespace evc::itc
