#pragma once

#include "evc/core/error.hpp"
#include "evc/core/queue.hpp"
#include "evc/core/spin_lock.hpp"
#include "evc/types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace evc {

/**
 * @brief 驱逐协调器：把 "检查容量 -> 驱逐最旧 -> 入队新元素" 变成一个原子步骤
 *
 * 自身不持有数据，只协调对 Queue 的访问。同一通道的所有覆盖发送端
 * 共享一个 Evictor，因此共享同一把驱逐锁。
 *
 * @section 算法
 * 先尝试不驱逐直接入队；若返回 Full，非阻塞地弹出一个最旧元素放进批次，
 * 然后重试入队，直到成功。驱逐完全由 "入队是否成功" 驱动，
 * 不依赖缓存的长度：
 * - 并发接收端在两次尝试之间取走了数据 -> 下一次入队直接成功，不会多驱逐；
 * - 普通 (非覆盖) 发送端抢占了刚腾出的空位 -> 再驱逐一个，批次仍然正确。
 *
 * 接收端走 Queue 自身的出队路径，无需获取驱逐锁。
 */
template <typename T>
  requires ChannelItem<T>
class Evictor {
public:
  explicit Evictor(std::shared_ptr<Queue<T>> queue) : queue_(std::move(queue)) {}

  Evictor(const Evictor &) = delete;
  Evictor &operator=(const Evictor &) = delete;

  /**
   * @brief 同步路径：自旋获取驱逐锁后执行入队/驱逐
   *
   * @note 若驱逐了若干元素之后所有接收端恰好离开，结果是 SendError，
   *       这些已被驱逐的元素随之丢弃，不会出现在任何返回值中。
   */
  [[nodiscard]] SendResult<T> push_evicting(T value) {
    std::lock_guard guard(lock_);
    return push_locked(value);
  }

  /**
   * @brief 协程路径：驱逐锁被占用时立即返回 `std::nullopt`
   *
   * 返回 nullopt 时 `value` 原封未动，调用方让出调度器后重试。
   * 拿到锁后整个入队/驱逐步骤同步完成，不存在半途取消的窗口。
   */
  [[nodiscard]] std::optional<SendResult<T>> try_push_evicting(T &value) {
    std::unique_lock guard(lock_, std::try_to_lock);
    if (!guard.owns_lock()) {
      return std::nullopt;
    }
    return push_locked(value);
  }

  /**
   * @brief 驱逐锁本身
   *
   * 持有期间，共享这个 Evictor 的覆盖发送端都无法入队或驱逐：
   * push_evicting 自旋等待，try_push_evicting 返回 nullopt。
   * 普通发送与接收不受影响。
   */
  SpinLock &eviction_lock() noexcept { return lock_; }

private:
  // 驱逐途中最后一个接收端离开时返回 SendError，只交还 value；
  // 本次调用中已经弹出的元素不会再入队，随 evicted 一起销毁
  SendResult<T> push_locked(T &value) {
    std::vector<T> evicted;
    while (true) {
      switch (queue_->try_push(value)) {
      case PushStatus::Pushed:
        if (evicted.empty()) {
          return Evicted<T>{};
        }
        return Evicted<T>{std::move(evicted)};

      case PushStatus::Disconnected:
        return std::unexpected(SendError<T>{std::move(value)});

      case PushStatus::Full:
        // Empty 说明并发接收端刚取走了队头，直接重试入队
        if (auto oldest = queue_->try_pop()) {
          evicted.push_back(std::move(*oldest));
        }
        break;
      }
    }
  }

  std::shared_ptr<Queue<T>> queue_;
  SpinLock lock_;
};

} // namespace evc
