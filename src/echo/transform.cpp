#include "ttyecho/echo/transform.hpp"

namespace ttyecho::echo {

std::size_t escape_byte(core::byte b, core::byte *out) noexcept {
    if (b == '\r') {
        out[0] = '\n';
        return 1;
    }
    if (b <= 0x1A && b != '\t') {
        out[0] = '^';
        out[1] = static_cast<core::byte>(0x40 | b);
        return 2;
    }
    if (b >= 0x1B && b <= 0x1F) {
        out[0] = '^';
        out[1] = static_cast<core::byte>(0x50 | b);
        return 2;
    }
    if (b == 0x7F) {
        out[0] = '\\';
        out[1] = 'd';
        return 2;
    }
    out[0] = b;
    return 1;
}

EchoResult echo_transform(core::bytes_view input) {
    EchoResult result;
    result.output = core::BufferCell::allocate(input.size() * 2 + 1);
    if (!result.output.valid()) {
        // 分配失败：没有输出，但 Ctrl-C 的结束信号不能丢。
        for (const auto b : input) {
            result.terminate = result.terminate || b == kCtrlC;
        }
        return result;
    }

    auto dst = result.output.writable_bytes();
    std::size_t n = 0;
    for (const auto b : input) {
        if (b == kCtrlC) {
            result.terminate = true;
        }
        n += escape_byte(b, dst.data() + n);
    }
    dst[n++] = kSentinel;

    // n <= capacity 恒成立（见容量计算）。
    (void)result.output.commit(n);
    return result;
}

} // namespace ttyecho::echo
