#pragma once

#include <cstddef>
#include <numa.h>
#include <pthread.h>
#include <sched.h>
#include <system_error>
#include <thread>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) ||             \
    defined(_M_IX86)
#include <immintrin.h>
#endif

namespace evc {

/**
 * @brief CPU 自旋提示
 *
 * 在自旋等待循环中调用：x86 上是 `pause`，ARM64 上是 `yield`，
 * 其余平台退化为让出时间片。
 */
inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) ||             \
    defined(_M_IX86)
  _mm_pause();
#elif defined(__aarch64__)
  asm volatile("yield");
#else
  std::this_thread::yield();
#endif
}

/**
 * @brief 有界自旋 + 让出 (Spin-then-yield)
 *
 * 前 `SpinLimit` 次只做 `cpu_relax()`，之后每次都让出时间片。
 * 锁的持有时间很短时自旋足够；持有者被调度走时避免空转烧 CPU。
 */
template <std::size_t SpinLimit> class Backoff {
public:
  void pause() noexcept {
    if (count_ < SpinLimit) {
      ++count_;
      cpu_relax();
    } else {
      std::this_thread::yield();
    }
  }

  void reset() noexcept { count_ = 0; }

  [[nodiscard]] bool is_yielding() const noexcept {
    return count_ >= SpinLimit;
  }

private:
  std::size_t count_ = 0;
};

/**
 * 绑定当前线程的 CPU 亲和性
 */
inline void bind_cpu(int core_id) {
  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  CPU_SET(core_id, &cpuset);

  const int rc =
      pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
  if (rc != 0) {
    throw std::system_error(rc, std::generic_category(),
                            "Failed to set CPU affinity");
  }
}

/**
 * 绑定 NUMA 节点与 CPU 亲和性
 *
 * 基准测试用：生产者/消费者固定在同一节点，避免跨节点访问队列内存。
 */
inline void bind_numa(int node, int core_id) {
  if (numa_available() < 0) {
    throw std::system_error(ENOTSUP, std::generic_category(),
                            "NUMA is not available on this system");
  }

  if (numa_node_of_cpu(core_id) != node) {
    throw std::system_error(
        EINVAL, std::generic_category(),
        "Topology mismatch: Core is not on the specified NUMA node");
  }

  struct bitmask *nodemask = numa_allocate_nodemask();
  if (!nodemask) {
    throw std::system_error(errno, std::generic_category(),
                            "Failed to allocate NUMA nodemask");
  }

  numa_bitmask_setbit(nodemask, node);
  numa_set_membind(nodemask);
  numa_free_nodemask(nodemask);

  bind_cpu(core_id);
}

/// 当前机器可用的 CPU 数量 (至少为 1)
inline unsigned cpu_count() noexcept {
  const unsigned n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : n;
}

} // namespace evc
