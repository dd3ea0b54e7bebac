#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace ttyecho::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 读回调的建议缓冲区大小（与常见事件循环的 64KB 读取块一致）。
inline constexpr std::size_t kDefaultReadBufferSize = 64 * 1024;

inline constexpr int kStdinFd = 0;
inline constexpr int kStdoutFd = 1;

}  // namespace ttyecho::core
