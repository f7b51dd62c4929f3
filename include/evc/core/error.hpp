#pragma once

#include "evc/types.hpp"
#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace evc {

// =========================================================
// 错误码 (与 std::system_error 互通)
// =========================================================

enum class errc {
  disconnected = 1, // 对端句柄已全部释放
  full,             // 队列已满 (仅非阻塞发送)
  empty,            // 队列为空 (仅非阻塞接收)
  timeout,          // 等待超时
};

inline std::string_view to_string(errc e) noexcept {
  switch (e) {
  case errc::disconnected:
    return "channel disconnected";
  case errc::full:
    return "channel full";
  case errc::empty:
    return "channel empty";
  case errc::timeout:
    return "channel operation timed out";
  }
  return "unknown channel error";
}

class ChannelCategory final : public std::error_category {
public:
  const char *name() const noexcept override { return "evc.channel"; }

  std::string message(int ev) const override {
    return std::string(to_string(static_cast<errc>(ev)));
  }
};

inline const std::error_category &channel_category() noexcept {
  static const ChannelCategory category;
  return category;
}

inline std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), channel_category()};
}

// =========================================================
// 发送错误：失败时总是把元素交还给调用方
// =========================================================

/**
 * @brief 阻塞发送 / 覆盖发送失败：所有接收端都已释放
 *
 * 这是覆盖发送唯一可能的失败，容量不足永远不会成为错误。
 */
template <typename T> struct SendError {
  T value;

  [[nodiscard]] T into_inner() && { return std::move(value); }
  [[nodiscard]] std::error_code code() const noexcept {
    return make_error_code(errc::disconnected);
  }
};

template <typename T> struct TrySendError {
  enum class Kind { Full, Disconnected };

  Kind kind;
  T value;

  [[nodiscard]] bool is_full() const noexcept { return kind == Kind::Full; }
  [[nodiscard]] bool is_disconnected() const noexcept {
    return kind == Kind::Disconnected;
  }
  [[nodiscard]] T into_inner() && { return std::move(value); }
  [[nodiscard]] std::error_code code() const noexcept {
    return make_error_code(is_full() ? errc::full : errc::disconnected);
  }
};

template <typename T> struct SendTimeoutError {
  enum class Kind { Timeout, Disconnected };

  Kind kind;
  T value;

  [[nodiscard]] bool is_timeout() const noexcept {
    return kind == Kind::Timeout;
  }
  [[nodiscard]] bool is_disconnected() const noexcept {
    return kind == Kind::Disconnected;
  }
  [[nodiscard]] T into_inner() && { return std::move(value); }
  [[nodiscard]] std::error_code code() const noexcept {
    return make_error_code(is_timeout() ? errc::timeout : errc::disconnected);
  }
};

// =========================================================
// 接收错误：不携带数据，直接用枚举
// =========================================================

enum class RecvError { Disconnected };
enum class TryRecvError { Empty, Disconnected };
enum class RecvTimeoutError { Timeout, Disconnected };

inline std::error_code make_error_code(RecvError) noexcept {
  return make_error_code(errc::disconnected);
}

inline std::error_code make_error_code(TryRecvError e) noexcept {
  return make_error_code(e == TryRecvError::Empty ? errc::empty
                                                  : errc::disconnected);
}

inline std::error_code make_error_code(RecvTimeoutError e) noexcept {
  return make_error_code(e == RecvTimeoutError::Timeout ? errc::timeout
                                                        : errc::disconnected);
}

inline std::string_view to_string(RecvError) noexcept {
  return to_string(errc::disconnected);
}

inline std::string_view to_string(TryRecvError e) noexcept {
  return to_string(e == TryRecvError::Empty ? errc::empty
                                            : errc::disconnected);
}

inline std::string_view to_string(RecvTimeoutError e) noexcept {
  return to_string(e == RecvTimeoutError::Timeout ? errc::timeout
                                                  : errc::disconnected);
}

// gtest / 日志打印
inline std::ostream &operator<<(std::ostream &os, RecvError e) {
  return os << to_string(e);
}
inline std::ostream &operator<<(std::ostream &os, TryRecvError e) {
  return os << to_string(e);
}
inline std::ostream &operator<<(std::ostream &os, RecvTimeoutError e) {
  return os << to_string(e);
}

// =========================================================
// 结果类型
// =========================================================

/// 覆盖发送的结果：成功时附带被驱逐的批次
template <typename T> using SendResult = std::expected<Evicted<T>, SendError<T>>;

template <typename T> using RecvResult = std::expected<T, RecvError>;

} // namespace evc

template <> struct std::is_error_code_enum<evc::errc> : std::true_type {};
