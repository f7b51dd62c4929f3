#pragma once

#include "evc/channel/itc.hpp"
#include "evc/core/error.hpp"
#include "evc/core/evictor.hpp"
#include "evc/core/queue.hpp"
#include "evc/types.hpp"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace evc {

/**
 * @brief 覆盖发送端：队列满时驱逐最旧的未读元素，而不是阻塞
 *
 * 组合而非继承：内部持有一个普通 `itc::Sender<T>` 并转发它的全部接口，
 * 同一个句柄既可以做覆盖发送，也可以做普通的背压发送。
 *
 * 覆盖发送只会因为接收端全部离开而失败，容量永远不会成为错误。
 */
template <typename T>
  requires ChannelItem<T>
class OverwriteSender {
public:
  using DataType = T;

  OverwriteSender(itc::Sender<T> sender, std::shared_ptr<Evictor<T>> evictor)
      : sender_(std::move(sender)), evictor_(std::move(evictor)) {}

  // =========================================================
  // 覆盖发送
  // =========================================================

  /**
   * @brief 同步覆盖发送，永不等待接收端
   *
   * @return
   * - `std::nullopt`: 有空位，未驱逐任何元素
   * - `std::vector<T>`: 为腾出空位而驱逐的元素，最旧在前
   * - `SendError<T>`: 所有接收端已离开，元素原样交还。若接收端是在
   *   驱逐途中离开的，本次已驱逐的元素被丢弃，错误中只有 value
   */
  SendResult<T> send_overwrite(T value) {
    return evictor_->push_evicting(std::move(value));
  }

  /**
   * @brief 协程覆盖发送
   *
   * 与 send_overwrite 语义完全一致。唯一的挂起点是驱逐锁被其他发送端
   * 占用时让出调度器，拿到锁后同步完成，不会等待接收端。
   * 挂起期间被取消时，元素尚未入队。
   *
   * @note 协程完成之前 `*this` 必须保持有效。
   */
  boost::asio::awaitable<SendResult<T>> send_overwrite_async(T value) {
    auto evictor = evictor_;
    while (true) {
      if (auto result = evictor->try_push_evicting(value)) {
        co_return std::move(*result);
      }
      co_await boost::asio::post(co_await boost::asio::this_coro::executor,
                                 boost::asio::use_awaitable);
    }
  }

  /**
   * @brief 批量覆盖发送
   *
   * 依次覆盖发送区间内的每个元素，把各次驱逐的批次按顺序拼接。
   * 接收端中途离开时停止，错误中携带第一个未能发送的元素。
   */
  template <typename InputIt>
  SendResult<T> send_overwrite_batch(InputIt first, InputIt last) {
    std::vector<T> evicted;
    for (; first != last; ++first) {
      auto result = evictor_->push_evicting(T(*first));
      if (!result) {
        return std::unexpected(std::move(result.error()));
      }
      if (*result) {
        for (auto &item : **result) {
          evicted.push_back(std::move(item));
        }
      }
    }
    if (evicted.empty()) {
      return Evicted<T>{};
    }
    return Evicted<T>{std::move(evicted)};
  }

  // =========================================================
  // 转发普通 Sender 接口
  // =========================================================

  std::expected<void, SendError<T>> send(T value) {
    return sender_.send(std::move(value));
  }

  std::expected<void, TrySendError<T>> try_send(T value) {
    return sender_.try_send(std::move(value));
  }

  template <class Rep, class Period>
  std::expected<void, SendTimeoutError<T>>
  send(T value, const std::chrono::duration<Rep, Period> &timeout) {
    return sender_.send(std::move(value), timeout);
  }

  template <class Clock, class Duration>
  std::expected<void, SendTimeoutError<T>>
  send(T value, const std::chrono::time_point<Clock, Duration> &deadline) {
    return sender_.send(std::move(value), deadline);
  }

  template <typename InputIt> std::size_t send_batch(InputIt first, InputIt last) {
    return sender_.send_batch(first, last);
  }

  std::size_t size() const { return sender_.size(); }
  bool is_empty() const { return sender_.is_empty(); }
  bool is_full() const { return sender_.is_full(); }
  std::optional<std::size_t> capacity() const noexcept {
    return sender_.capacity();
  }
  bool is_disconnected() const { return sender_.is_disconnected(); }
  std::size_t sender_count() const { return sender_.sender_count(); }
  std::size_t receiver_count() const { return sender_.receiver_count(); }

  bool same_channel(const OverwriteSender &other) const noexcept {
    return sender_.same_channel(other.sender_);
  }

  /// 底层普通发送端，可以单独克隆出去做背压发送
  const itc::Sender<T> &as_sender() const noexcept { return sender_; }

private:
  itc::Sender<T> sender_;
  std::shared_ptr<Evictor<T>> evictor_;
};

/// 接收端没有任何覆盖相关的逻辑，直接复用普通 Receiver
template <typename T> using OverwriteReceiver = itc::Receiver<T>;

/**
 * @brief 创建带覆盖能力的有界通道
 * @throws std::invalid_argument capacity 为 0 (没有任何槽位可供覆盖)
 */
template <typename T>
  requires ChannelItem<T>
auto bounded_overwrite(std::size_t capacity = config::DEFAULT_CAPACITY) {
  auto queue = std::make_shared<Queue<T>>(capacity);
  auto evictor = std::make_shared<Evictor<T>>(queue);
  return std::make_pair(
      OverwriteSender<T>(itc::Sender<T>(queue), std::move(evictor)),
      OverwriteReceiver<T>(queue));
}

/// 无界版本：覆盖发送永远不需要驱逐，结果总是 `std::nullopt`
template <typename T>
  requires ChannelItem<T>
auto unbounded_overwrite() {
  auto queue = std::make_shared<Queue<T>>(std::nullopt);
  auto evictor = std::make_shared<Evictor<T>>(queue);
  return std::make_pair(
      OverwriteSender<T>(itc::Sender<T>(queue), std::move(evictor)),
      OverwriteReceiver<T>(queue));
}

} // namespace evc
