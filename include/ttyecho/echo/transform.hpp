#pragma once

#include "ttyecho/core/buffer.hpp"
#include "ttyecho/core/common.hpp"

#include <cstddef>

namespace ttyecho::echo {

inline constexpr core::byte kCtrlC = 0x03;
inline constexpr core::byte kSentinel = 0x00;

/**
 * @brief 回显变换结果。
 *
 * - output：转义后的字节，最后一个字节固定为 kSentinel（随同一次写出）；
 * - terminate：输入中出现过 Ctrl-C（0x03），调用方应结束会话。
 */
struct EchoResult final {
    core::BufferCell output{};
    bool terminate{false};
};

/**
 * @brief 单字节转义（caret 表示法）。
 *
 * 映射规则：
 * - 0x0D -> 0x0A（回车键换行显示）
 * - 0x00..0x1A（0x09 除外） -> '^', 0x40 | b
 * - 0x1B..0x1F -> '^', 0x50 | b
 * - 0x7F -> '\\', 'd'
 * - 其他字节原样输出
 *
 * @param out 至少 2 字节的输出位置
 * @return 写入的字节数（1 或 2）
 */
std::size_t escape_byte(core::byte b, core::byte *out) noexcept;

/**
 * @brief 纯函数：把原始输入映射为可见的回显字节。
 *
 * 输出容量为 2 * n + 1（每个字节最多展开为 2 字节，外加哨兵），
 * 输出长度满足 n + 1 <= size <= 2 * n + 1。
 */
[[nodiscard]] EchoResult echo_transform(core::bytes_view input);

} // namespace ttyecho::echo
