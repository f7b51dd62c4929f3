#pragma once

#include "evc/platform.hpp"
#include "evc/types.hpp"
#include <atomic>

namespace evc {

/**
 * @brief TTAS 自旋锁 (Test-Test-And-Set)
 *
 * 满足 Lockable 要求，可直接配合 `std::lock_guard` / `std::unique_lock`。
 *
 * 临界区只包含若干次非阻塞的入队/出队尝试，持有时间很短，
 * 因此同步路径自旋等待；协程路径用 `try_lock()` 失败后让出调度器。
 */
class alignas(config::CACHE_LINE_SIZE) SpinLock {
public:
  SpinLock() noexcept = default;
  SpinLock(const SpinLock &) = delete;
  SpinLock &operator=(const SpinLock &) = delete;

  void lock() noexcept {
    Backoff<config::SPIN_BEFORE_YIELD> backoff;
    while (true) {
      // 1. Test (Relaxed Read)
      // 锁被持有时只读本地缓存行，不触发总线锁定
      if (!locked_.load(std::memory_order_relaxed)) {
        // 2. Test-and-Set (Acquire)
        if (!locked_.exchange(true, std::memory_order_acquire)) {
          return;
        }
      }
      // 3. Pause / Yield
      backoff.pause();
    }
  }

  [[nodiscard]] bool try_lock() noexcept {
    return !locked_.load(std::memory_order_relaxed) &&
           !locked_.exchange(true, std::memory_order_acquire);
  }

  void unlock() noexcept { locked_.store(false, std::memory_order_release); }

  /// 仅用于诊断/测试，结果可能立即过期
  [[nodiscard]] bool is_locked() const noexcept {
    return locked_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> locked_{false};
};

} // namespace evc
