#include "evc/channel.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <iostream>
#include <string>

namespace asio = boost::asio;
using namespace std::chrono_literals;

// 协程生产者：send_overwrite_async 不等待接收端，只在驱逐锁被占用时让出
asio::awaitable<void> producer(evc::OverwriteSender<std::string> tx) {
  asio::steady_timer timer(co_await asio::this_coro::executor);

  for (int i = 0; i < 10; ++i) {
    auto result = co_await tx.send_overwrite_async("tick " + std::to_string(i));
    if (!result) {
      std::cerr << "[Producer] Channel closed." << std::endl;
      co_return;
    }
    if (*result) {
      for (const auto &old : **result) {
        std::cout << "[Producer] Overwrote: " << old << std::endl;
      }
    }
    timer.expires_after(10ms);
    co_await timer.async_wait(asio::use_awaitable);
  }
  std::cout << "[Producer] Done." << std::endl;
}

// 协程消费者：比生产者慢，只能看到最新的若干条
asio::awaitable<void> consumer(evc::OverwriteReceiver<std::string> rx) {
  asio::steady_timer timer(co_await asio::this_coro::executor);

  while (true) {
    auto item = co_await rx.receive_async();
    if (!item) {
      std::cout << "[Consumer] Disconnected." << std::endl;
      co_return;
    }
    std::cout << "[Consumer] Got: " << *item << std::endl;
    timer.expires_after(35ms);
    co_await timer.async_wait(asio::use_awaitable);
  }
}

int main() {
  std::cout << "=== Async Overwrite Channel Demo ===" << std::endl;

  asio::io_context io;
  auto [tx, rx] = evc::bounded_overwrite<std::string>(2);

  asio::co_spawn(io, consumer(std::move(rx)), asio::detached);
  asio::co_spawn(io, producer(std::move(tx)), asio::detached);

  io.run();

  std::cout << "=== Demo Finished ===" << std::endl;
  return 0;
}
