#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace ttyecho::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - runtime 层接口统一返回 std::error_code，避免异常路径；
 * - init_failed ~ runtime 对应会话层的错误分类（见 Error::kind()）；
 * - loop_busy/loop_closed/double_release 描述 runtime 与缓冲区记账的状态错误。
 */
enum class errc : int {
  ok = 0,
  init_failed = 1,
  mode_failed = 2,
  start_failed = 3,
  busy = 4,
  write_rejected = 5,
  runtime = 6,
  loop_busy = 7,
  loop_closed = 8,
  double_release = 9,
  invalid_argument = 10,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 错误码的符号名（类似 errno 宏名）。
 *
 * - generic/system 分类：EPERM、EIO、ENOTTY ...
 * - asio 的文件结束：EOF
 * - ttyecho.core 分类：枚举名（例如 busy）
 * - 其他：<category>:<value>
 */
[[nodiscard]] std::string error_name(const std::error_code& ec);

/**
 * @brief 会话层错误：分类 + 出错的调用点 + 底层原因。
 *
 * kind 为 errc::ok 时表示“无错误”，此时 operator bool 为 false。
 */
class Error final {
 public:
  Error() = default;
  Error(errc kind, std::string func, std::error_code cause)
    : kind_(kind), func_(std::move(func)), cause_(cause) {}

  [[nodiscard]] errc kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& func() const noexcept { return func_; }
  [[nodiscard]] const std::error_code& cause() const noexcept { return cause_; }

  // 分类对应的 error_code（便于与 errc 比较）。
  [[nodiscard]] std::error_code code() const noexcept { return make_error_code(kind_); }

  // 形如 "Error calling read_cb: Operation not permitted (EPERM)"。
  [[nodiscard]] std::string describe() const;

  explicit operator bool() const noexcept { return kind_ != errc::ok; }

 private:
  errc kind_{errc::ok};
  std::string func_{};
  std::error_code cause_{};
};

}  // namespace ttyecho::core

namespace std {
template <>
struct is_error_code_enum<ttyecho::core::errc> : true_type {};
}  // namespace std
