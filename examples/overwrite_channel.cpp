#include "evc/channel.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace evc;

struct Reading {
  int sensor;
  int seq;
  double value;
};

std::ostream &operator<<(std::ostream &os, const Reading &r) {
  return os << "sensor=" << r.sensor << " seq=" << r.seq << " value=" << r.value;
}

// 生产者速度远快于消费者：旧读数被覆盖，生产者从不等待
void run_sensor(OverwriteSender<Reading> tx, int sensor) {
  for (int seq = 0; seq < 20; ++seq) {
    auto result = tx.send_overwrite(Reading{sensor, seq, seq * 0.5});
    if (!result) {
      std::cerr << "[Sensor " << sensor << "] Receiver gone: dropped "
                << result.error().value << std::endl;
      return;
    }
    if (*result) {
      for (const auto &old : **result) {
        std::cout << "[Sensor " << sensor << "] Evicted: " << old << std::endl;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  std::cout << "[Sensor " << sensor << "] Done." << std::endl;
}

void run_display(OverwriteReceiver<Reading> rx) {
  while (auto r = rx.receive()) {
    std::cout << "[Display]  Shown: " << *r << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
  }
  std::cout << "[Display]  All sensors gone. Exiting." << std::endl;
}

int main() {
  std::cout << "=== Overwrite Channel Demo ===" << std::endl;

  // 1. 最基本的覆盖语义
  {
    auto [tx, rx] = bounded_overwrite<std::string>(2);
    (void)tx.send_overwrite("first");
    (void)tx.send_overwrite("second");

    auto result = tx.send_overwrite("third");
    if (result && *result) {
      std::cout << "Evicted " << (*result)->size() << " item(s): "
                << (*result)->front() << std::endl;
    }

    while (auto item = rx.try_receive()) {
      std::cout << "Received: " << *item << std::endl;
    }
  }

  // 2. 两个快速生产者 + 一个慢速消费者
  {
    auto [tx, rx] = bounded_overwrite<Reading>(3);

    std::thread display([rx = std::move(rx)]() mutable {
      run_display(std::move(rx));
    });
    std::thread sensor_a([tx = tx]() mutable { run_sensor(std::move(tx), 1); });
    std::thread sensor_b([tx = std::move(tx)]() mutable {
      run_sensor(std::move(tx), 2);
    });

    sensor_a.join();
    sensor_b.join();
    display.join();
  }

  std::cout << "=== Demo Finished ===" << std::endl;
  return 0;
}
