#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <vector>

namespace evc {

namespace config {
constexpr std::size_t CACHE_LINE_SIZE = 64;
constexpr std::size_t DEFAULT_CAPACITY = 1024;
/// 驱逐锁在让出时间片之前的自旋次数
constexpr std::size_t SPIN_BEFORE_YIELD = 64;
} // namespace config

/**
 * @brief [数据约束] 通道元素 Concept
 *
 * 与共享内存版本不同，进程内通道只移动元素，不做 memcpy：
 * 1. **Movable**: 入队/出队/驱逐都通过移动转移所有权。
 * 2. **Destructible**: 队列析构时会销毁尚未取走的元素。
 * 不要求 TriviallyCopyable，`std::string` 之类的类型可以直接传递。
 */
template <typename T>
concept ChannelItem = std::movable<T> && std::is_nothrow_destructible_v<T>;

/**
 * @brief 一次覆盖写入被驱逐出队列的元素批次
 *
 * - `std::nullopt`: 有空位，未驱逐任何元素
 * - 非空 vector: 按入队顺序 (最旧在前) 排列的被驱逐元素
 */
template <typename T> using Evicted = std::optional<std::vector<T>>;

} // namespace evc
