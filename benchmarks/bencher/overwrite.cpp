#include <benchmark/benchmark.h>
#include <cstdint>
#include <cstring>
#include <numa.h>
#include <system_error>
#include <utility>

#include "evc/channel.hpp"
#include "evc/platform.hpp"

// ============================================================================
// 辅助工具：定长载荷 (Payload)
// ============================================================================

template <size_t Bytes> struct alignas(8) Payload {
  uint8_t data[Bytes];
  Payload() { std::memset(data, 0, Bytes); }
};

template <> struct alignas(8) Payload<8> {
  uint64_t v;
  Payload() : v(0) {}
};

// 第 index 个基准线程固定到一个核心上；有 NUMA 时同时绑定内存节点
static bool pin_thread(benchmark::State &state, int index) {
  const int core = index % static_cast<int>(evc::cpu_count());
  try {
    if (numa_available() >= 0) {
      evc::bind_numa(numa_node_of_cpu(core), core);
    } else {
      evc::bind_cpu(core);
    }
  } catch (const std::system_error &e) {
    state.SkipWithError(e.what());
    return false;
  }
  return true;
}

template <typename T> using Channel =
    std::pair<evc::OverwriteSender<T>, evc::OverwriteReceiver<T>>;

// ============================================================================
// 1. Overwrite_Full<PayloadSize, Cap>
// 场景：通道已满，每次覆盖发送都要驱逐一个元素 (无接收端参与)
// ============================================================================

template <size_t PayloadSize, size_t Cap>
static void BM_Overwrite_Full(benchmark::State &state) {
  using T = Payload<PayloadSize>;
  auto [tx, rx] = evc::bounded_overwrite<T>(Cap);
  for (size_t i = 0; i < Cap; ++i) {
    (void)tx.send_overwrite(T{});
  }

  for ([[maybe_unused]] auto _ : state) {
    auto evicted = tx.send_overwrite(T{});
    benchmark::DoNotOptimize(evicted);
  }

  state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// 2. SendRecv<PayloadSize, Cap>
// 场景：单线程 发送 + 接收 开销，覆盖发送 vs 普通 try_send
// ============================================================================

template <size_t PayloadSize, size_t Cap>
static void BM_Overwrite_SendRecv(benchmark::State &state) {
  using T = Payload<PayloadSize>;
  auto [tx, rx] = evc::bounded_overwrite<T>(Cap);

  for ([[maybe_unused]] auto _ : state) {
    auto evicted = tx.send_overwrite(T{});
    auto out = rx.try_receive();
    benchmark::DoNotOptimize(evicted);
    benchmark::DoNotOptimize(out);
    benchmark::ClobberMemory();
  }

  state.SetItemsProcessed(state.iterations() * 2);
}

template <size_t PayloadSize, size_t Cap>
static void BM_Plain_SendRecv(benchmark::State &state) {
  using T = Payload<PayloadSize>;
  auto [tx, rx] = evc::itc::bounded<T>(Cap);

  for ([[maybe_unused]] auto _ : state) {
    auto sent = tx.try_send(T{});
    auto out = rx.try_receive();
    benchmark::DoNotOptimize(sent);
    benchmark::DoNotOptimize(out);
    benchmark::ClobberMemory();
  }

  state.SetItemsProcessed(state.iterations() * 2);
}

// ============================================================================
// 3. Overwrite_Throughput<PayloadSize, Cap>
// 场景：1 个覆盖生产者 + 1 个消费者
// 生产者永不阻塞，消费者能接到多少算多少；统计两侧各自处理的元素数
// ============================================================================

template <size_t PayloadSize, size_t Cap>
static void BM_Overwrite_Throughput(benchmark::State &state) {
  using T = Payload<PayloadSize>;
  // 静态分配，跨线程共享并在多次运行间复用
  static auto *ch = new Channel<T>(evc::bounded_overwrite<T>(Cap));

  if (evc::cpu_count() < 2) {
    state.SkipWithError("Need at least 2 cores");
    return;
  }
  if (!pin_thread(state, state.thread_index())) {
    return;
  }

  if (state.thread_index() == 0) {
    int64_t evicted = 0;
    for ([[maybe_unused]] auto _ : state) {
      auto r = ch->first.send_overwrite(T{});
      if (r && *r) {
        evicted += static_cast<int64_t>((*r)->size());
      }
    }
    state.counters["evicted"] = static_cast<double>(evicted);
  } else {
    int64_t received = 0;
    for ([[maybe_unused]] auto _ : state) {
      auto out = ch->second.try_receive();
      if (out) {
        ++received;
      }
      benchmark::DoNotOptimize(out);
    }
    state.counters["received"] = static_cast<double>(received);
  }

  state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// 4. Overwrite_Contended<PayloadSize, Cap>
// 场景：N 个覆盖生产者竞争同一把驱逐锁，没有消费者
// ============================================================================

template <size_t PayloadSize, size_t Cap>
static void BM_Overwrite_Contended(benchmark::State &state) {
  using T = Payload<PayloadSize>;
  static auto *ch = new Channel<T>(evc::bounded_overwrite<T>(Cap));

  if (!pin_thread(state, state.thread_index())) {
    return;
  }

  for ([[maybe_unused]] auto _ : state) {
    auto r = ch->first.send_overwrite(T{});
    benchmark::DoNotOptimize(r);
  }

  state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Benchmark 注册宏
// ============================================================================

// 按照载荷 8, 64, 512 字节与容量 1, 64, 1024 的矩阵进行注册
#define REGISTER_MATRIX(FUNC, ...)                                             \
  BENCHMARK_TEMPLATE(FUNC, 8, 1)->Name(#FUNC "/P:8/C:1") __VA_ARGS__;          \
  BENCHMARK_TEMPLATE(FUNC, 8, 64)->Name(#FUNC "/P:8/C:64") __VA_ARGS__;        \
  BENCHMARK_TEMPLATE(FUNC, 8, 1024)->Name(#FUNC "/P:8/C:1024") __VA_ARGS__;    \
  BENCHMARK_TEMPLATE(FUNC, 64, 1)->Name(#FUNC "/P:64/C:1") __VA_ARGS__;        \
  BENCHMARK_TEMPLATE(FUNC, 64, 64)->Name(#FUNC "/P:64/C:64") __VA_ARGS__;      \
  BENCHMARK_TEMPLATE(FUNC, 64, 1024)->Name(#FUNC "/P:64/C:1024") __VA_ARGS__;  \
  BENCHMARK_TEMPLATE(FUNC, 512, 1)->Name(#FUNC "/P:512/C:1") __VA_ARGS__;      \
  BENCHMARK_TEMPLATE(FUNC, 512, 64)->Name(#FUNC "/P:512/C:64") __VA_ARGS__;    \
  BENCHMARK_TEMPLATE(FUNC, 512, 1024)->Name(#FUNC "/P:512/C:1024") __VA_ARGS__

// 1. 满通道覆盖
REGISTER_MATRIX(BM_Overwrite_Full);

// 2. 单线程发送 + 接收
REGISTER_MATRIX(BM_Overwrite_SendRecv);
REGISTER_MATRIX(BM_Plain_SendRecv);

// 3. 生产者 / 消费者吞吐量
REGISTER_MATRIX(BM_Overwrite_Throughput, ->Threads(2)->UseRealTime());

// 4. 多生产者竞争
REGISTER_MATRIX(BM_Overwrite_Contended, ->ThreadRange(1, 8)->UseRealTime());

BENCHMARK_MAIN();
