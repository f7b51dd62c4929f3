#include "evc/channel.hpp"
#include "../fixtures/config.hpp"
#include "../fixtures/utils.hpp"
#include <atomic>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <iterator>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace evc;
using namespace evc::itc;
using namespace evc::test;

namespace asio = boost::asio;

class ItcChannelTest : public ::testing::Test {
protected:
  TestDataGenerator gen_;
};

// ============================================================================
// 1. 创建与句柄
// ============================================================================

TEST_F(ItcChannelTest, ChannelCreation) {
  auto [sender, receiver] = bounded<int>();

  EXPECT_EQ(sender.capacity(), config::DEFAULT_CAPACITY);
  EXPECT_TRUE(receiver.is_empty());
  EXPECT_EQ(sender.size(), 0u);
  EXPECT_EQ(sender.sender_count(), 1u);
  EXPECT_EQ(sender.receiver_count(), 1u);
  EXPECT_TRUE(receiver.same_channel(sender));
}

TEST_F(ItcChannelTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(bounded<int>(0), std::invalid_argument);
}

TEST_F(ItcChannelTest, UnboundedHasNoCapacity) {
  auto [sender, receiver] = unbounded<int>();
  EXPECT_FALSE(sender.capacity().has_value());

  for (int i = 0; i < TestConfig::MEDIUM_DATA_SIZE; ++i) {
    ASSERT_TRUE(sender.try_send(i));
  }
  EXPECT_FALSE(sender.is_full());
  EXPECT_EQ(receiver.size(), static_cast<std::size_t>(TestConfig::MEDIUM_DATA_SIZE));
}

TEST_F(ItcChannelTest, CloneAndMoveAccounting) {
  auto [sender, receiver] = bounded<int>(4);

  {
    auto tx2 = sender;
    auto rx2 = receiver;
    EXPECT_EQ(sender.sender_count(), 2u);
    EXPECT_EQ(sender.receiver_count(), 2u);
    EXPECT_TRUE(tx2.same_channel(sender));
    EXPECT_TRUE(rx2.same_channel(receiver));

    // 移动不改变计数
    auto tx3 = std::move(tx2);
    EXPECT_EQ(sender.sender_count(), 2u);
  }

  EXPECT_EQ(sender.sender_count(), 1u);
  EXPECT_EQ(sender.receiver_count(), 1u);

  auto [other_tx, other_rx] = bounded<int>(4);
  EXPECT_FALSE(sender.same_channel(other_tx));
  EXPECT_FALSE(receiver.same_channel(other_rx));
}

TEST_F(ItcChannelTest, SingleThreadCommunication) {
  auto [sender, receiver] = bounded<TestMessage>(8);

  auto msg = gen_.generate_message(1, 42);
  ASSERT_TRUE(sender.send(msg));

  EXPECT_FALSE(receiver.is_empty());
  EXPECT_EQ(receiver.size(), 1u);

  auto received = receiver.receive();
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, msg);
  EXPECT_TRUE(receiver.is_empty());
}

// ============================================================================
// 2. 断开语义
// ============================================================================

TEST_F(ItcChannelTest, SendFailsAfterReceiversDropped) {
  auto [sender, receiver] = bounded<std::string>(4);
  {
    auto rx = std::move(receiver);
  }

  EXPECT_TRUE(sender.is_disconnected());

  auto r = sender.send("payload");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(std::move(r.error()).into_inner(), "payload");

  auto t = sender.try_send("again");
  ASSERT_FALSE(t.has_value());
  EXPECT_TRUE(t.error().is_disconnected());
  EXPECT_EQ(t.error().code(), make_error_code(errc::disconnected));
  EXPECT_EQ(std::move(t.error()).into_inner(), "again");
}

TEST_F(ItcChannelTest, ReceiverDrainsThenSeesDisconnected) {
  auto [sender, receiver] = bounded<int>(4);
  ASSERT_TRUE(sender.send(1));
  ASSERT_TRUE(sender.send(2));
  {
    auto tx = std::move(sender);
  }

  EXPECT_TRUE(receiver.is_disconnected());
  EXPECT_EQ(receiver.receive(), 1);
  EXPECT_EQ(receiver.receive(), 2);

  auto r = receiver.receive();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), RecvError::Disconnected);

  auto t = receiver.try_receive();
  ASSERT_FALSE(t.has_value());
  EXPECT_EQ(t.error(), TryRecvError::Disconnected);
}

TEST_F(ItcChannelTest, BlockedReceiverWakesOnDisconnect) {
  auto [sender, receiver] = bounded<int>(4);

  std::thread dropper([tx = std::move(sender)]() mutable {
    std::this_thread::sleep_for(TestConfig::SHORT_TIMEOUT);
    auto gone = std::move(tx);
  });

  auto r = receiver.receive();
  EXPECT_FALSE(r.has_value());
  dropper.join();
}

// ============================================================================
// 3. 背压、超时与批量
// ============================================================================

TEST_F(ItcChannelTest, BackpressureHandling) {
  auto [sender, receiver] = bounded<int>(2);

  EXPECT_TRUE(sender.try_send(1));
  EXPECT_TRUE(sender.try_send(2));
  EXPECT_TRUE(sender.is_full());

  auto r = sender.try_send(3);
  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(r.error().is_full());
  EXPECT_EQ(std::move(r.error()).into_inner(), 3);
}

TEST_F(ItcChannelTest, TimeoutMechanism) {
  auto [sender, receiver] = bounded<int>(2);
  ASSERT_TRUE(sender.send(1));
  ASSERT_TRUE(sender.send(2));

  auto start = std::chrono::steady_clock::now();
  auto sent = sender.send(3, TestConfig::SHORT_TIMEOUT);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(sent.has_value());
  EXPECT_TRUE(sent.error().is_timeout());
  EXPECT_EQ(sent.error().value, 3);
  EXPECT_GE(elapsed, TestConfig::SHORT_TIMEOUT);

  receiver.drain();

  start = std::chrono::steady_clock::now();
  auto received = receiver.receive(TestConfig::SHORT_TIMEOUT);
  elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(received.has_value());
  EXPECT_EQ(received.error(), RecvTimeoutError::Timeout);
  EXPECT_GE(elapsed, TestConfig::SHORT_TIMEOUT);

  // 截止时间形式
  ASSERT_TRUE(sender.send(7, std::chrono::steady_clock::now() +
                                 TestConfig::SHORT_TIMEOUT));
  EXPECT_EQ(receiver.receive(std::chrono::steady_clock::now() +
                             TestConfig::SHORT_TIMEOUT),
            7);
}

TEST_F(ItcChannelTest, BatchOperations) {
  auto [sender, receiver] = bounded<int>(64);

  std::vector<int> input(50);
  std::iota(input.begin(), input.end(), 0);

  EXPECT_EQ(sender.send_batch(input.begin(), input.end()), 50u);

  std::vector<int> output(50);
  EXPECT_EQ(receiver.receive_batch(output.begin(), 50), 50u);
  EXPECT_EQ(input, output);
}

TEST_F(ItcChannelTest, PartialBatchSend) {
  auto [sender, receiver] = bounded<int>(4);

  std::vector<int> data = {1, 2, 3, 4, 5, 6, 7, 8};
  EXPECT_EQ(sender.send_batch(data.begin(), data.end()), 4u);
  EXPECT_TRUE(sender.is_full());

  std::vector<int> out;
  EXPECT_EQ(receiver.receive_batch(std::back_inserter(out), 10), 4u);
  EXPECT_EQ(out, (std::vector<int>{1, 2, 3, 4}));
}

// ============================================================================
// 4. 多线程
// ============================================================================

TEST_F(ItcChannelTest, MultiThreadCommunication) {
  auto [sender, receiver] = bounded<int>(1024);
  constexpr int COUNT = TestConfig::MEDIUM_DATA_SIZE;

  std::thread consumer([rx = std::move(receiver)]() mutable {
    for (int i = 0; i < COUNT; ++i) {
      EXPECT_EQ(rx.receive(), i);
    }
  });

  std::thread producer([tx = std::move(sender)]() mutable {
    for (int i = 0; i < COUNT; ++i) {
      EXPECT_TRUE(tx.send(i));
    }
  });

  producer.join();
  consumer.join();
}

TEST_F(ItcChannelTest, MpmcEveryItemDeliveredOnce) {
  auto [sender, receiver] = bounded<int>(TestConfig::SMALL_CAPACITY);
  constexpr int PER_PRODUCER = TestConfig::MEDIUM_DATA_SIZE;
  constexpr int PRODUCERS = TestConfig::NUM_THREADS;

  std::vector<std::atomic<int>> seen(PRODUCERS * PER_PRODUCER);
  {
    ThreadRunner runner;
    for (int p = 0; p < PRODUCERS; ++p) {
      runner.spawn([tx = sender, p]() mutable {
        for (int i = 0; i < PER_PRODUCER; ++i) {
          EXPECT_TRUE(tx.send(p * PER_PRODUCER + i));
        }
      });
    }
    for (int c = 0; c < TestConfig::NUM_THREADS; ++c) {
      runner.spawn([rx = receiver, &seen]() mutable {
        while (auto v = rx.receive()) {
          seen[static_cast<std::size_t>(*v)].fetch_add(1);
        }
      });
    }
    // 主线程持有的句柄必须释放，否则消费者永远等不到 Disconnected
    auto drop_tx = std::move(sender);
    auto drop_rx = std::move(receiver);
  }

  for (auto &count : seen) {
    EXPECT_EQ(count.load(), 1);
  }
}

// ============================================================================
// 5. 异步接收 (Boost.Asio)
// ============================================================================

TEST_F(ItcChannelTest, AsyncReceiveReady) {
  auto [sender, receiver] = bounded<int>(4);
  ASSERT_TRUE(sender.send(5));

  auto r = block_on(receiver.receive_async());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, 5);
}

TEST_F(ItcChannelTest, AsyncReceiveWokenByOtherThread) {
  auto [sender, receiver] = bounded<std::string>(4);

  std::thread producer([tx = std::move(sender)]() mutable {
    std::this_thread::sleep_for(TestConfig::SHORT_TIMEOUT);
    EXPECT_TRUE(tx.send("late"));
  });

  auto r = block_on(receiver.receive_async());
  producer.join();

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(*r, "late");
}

TEST_F(ItcChannelTest, AsyncReceiveSeesDisconnect) {
  auto [sender, receiver] = bounded<int>(4);

  std::thread dropper([tx = std::move(sender)]() mutable {
    std::this_thread::sleep_for(TestConfig::SHORT_TIMEOUT);
    auto gone = std::move(tx);
  });

  auto r = block_on(receiver.receive_async());
  dropper.join();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), RecvError::Disconnected);
}

TEST_F(ItcChannelTest, AsyncReceiveWithCallback) {
  auto [sender, receiver] = bounded<int>(4);

  asio::io_context io;
  std::optional<RecvResult<int>> got;
  receiver.async_receive(asio::bind_executor(
      io, [&got](RecvResult<int> r) { got = std::move(r); }));

  io.poll();
  EXPECT_FALSE(got.has_value());

  std::thread producer([&sender = sender] { EXPECT_TRUE(sender.send(9)); });
  io.run();
  producer.join();

  ASSERT_TRUE(got.has_value());
  ASSERT_TRUE(got->has_value());
  EXPECT_EQ(**got, 9);
}

TEST_F(ItcChannelTest, ManyCoroutineReceivers) {
  auto [sender, receiver] = bounded<int>(TestConfig::SMALL_CAPACITY);
  constexpr int RECEIVERS = TestConfig::NUM_THREADS;
  constexpr int COUNT = TestConfig::SMALL_DATA_SIZE;

  asio::io_context io;
  std::atomic<int> total{0};
  std::atomic<long> sum{0};

  for (int i = 0; i < RECEIVERS; ++i) {
    asio::co_spawn(
        io,
        [rx = receiver, &total, &sum]() mutable -> asio::awaitable<void> {
          while (true) {
            auto r = co_await rx.receive_async();
            if (!r) {
              co_return;
            }
            total.fetch_add(1);
            sum.fetch_add(*r);
          }
        },
        asio::detached);
  }
  auto drop_rx = std::move(receiver);

  std::thread producer([tx = std::move(sender)]() mutable {
    for (int i = 1; i <= COUNT; ++i) {
      EXPECT_TRUE(tx.send(i));
    }
  });

  io.run();
  producer.join();

  EXPECT_EQ(total.load(), COUNT);
  EXPECT_EQ(sum.load(), static_cast<long>(COUNT) * (COUNT + 1) / 2);
}
