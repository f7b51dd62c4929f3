#pragma once

#include "evc/core/error.hpp"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace evc::test {

// 线程辅助工具
class ThreadRunner {
  std::vector<std::thread> threads_;

public:
  template <typename Func, typename... Args>
  void spawn(Func &&func, Args &&...args) {
    threads_.emplace_back(std::forward<Func>(func), std::forward<Args>(args)...);
  }

  void join_all() {
    for (auto &t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  ~ThreadRunner() { join_all(); }
};

// 超时检测工具：func 的所有权交给工作线程，超时后分离也不会悬空
template <typename Func>
bool run_with_timeout(Func func, std::chrono::milliseconds timeout) {
  auto task = std::make_shared<std::packaged_task<void()>>(std::move(func));
  auto done = task->get_future();
  std::thread worker([task] { (*task)(); });

  if (done.wait_for(timeout) != std::future_status::ready) {
    worker.detach();
    return false;
  }
  worker.join();
  done.get();
  return true;
}

/**
 * 在私有 io_context 上把协程跑完并返回结果 (测试用的 block_on)
 */
template <typename T> T block_on(boost::asio::awaitable<T> task) {
  boost::asio::io_context io;
  auto result =
      boost::asio::co_spawn(io, std::move(task), boost::asio::use_future);
  io.run();
  return result.get();
}

inline void block_on(boost::asio::awaitable<void> task) {
  boost::asio::io_context io;
  auto result =
      boost::asio::co_spawn(io, std::move(task), boost::asio::use_future);
  io.run();
  result.get();
}

// 把覆盖发送的结果展开成 vector：未驱逐时为空
template <typename T> std::vector<T> evicted_items(SendResult<T> result) {
  EXPECT_TRUE(result.has_value()) << "overwrite send failed unexpectedly";
  if (!result || !*result) {
    return {};
  }
  return std::move(**result);
}

} // namespace evc::test
