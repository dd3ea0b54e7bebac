#pragma once

/*
 * POSIX 终端辅助：fd RAII、errno -> error_code、raw 模式 termios 配置。
 *
 * 说明：
 * - 仅在 POSIX 平台可用（依赖 termios/ttyname）；
 * - raw 模式的标志位与常见事件循环库的 TTY raw 模式一致：
 *   关闭输入转换/回显/规范模式/信号，保留输出的 NL -> CRNL 转换。
 */

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace ttyecho::posix {

/**
 * @brief 简单的 fd RAII（关闭时调用 close）。
 */
struct UniqueFd final {
    int fd{-1};

    UniqueFd() = default;
    explicit UniqueFd(int v) : fd(v) {}

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    UniqueFd(UniqueFd &&o) noexcept : fd(o.fd) { o.fd = -1; }
    UniqueFd &operator=(UniqueFd &&o) noexcept {
        if (this == &o) {
            return *this;
        }
        reset();
        fd = o.fd;
        o.fd = -1;
        return *this;
    }

    ~UniqueFd() { reset(); }

    void reset(int new_fd = -1) noexcept {
        if (fd >= 0) {
            ::close(fd);
        }
        fd = new_fd;
    }

    [[nodiscard]] int release() noexcept {
        const int out = fd;
        fd = -1;
        return out;
    }

    [[nodiscard]] bool valid() const noexcept { return fd >= 0; }
};

[[nodiscard]] inline std::error_code make_errno_ec() noexcept {
    return std::error_code(errno, std::generic_category());
}

/**
 * @brief 复制 fd（CLOEXEC）。原 fd 的生命周期不受影响。
 */
[[nodiscard]] inline std::pair<std::error_code, UniqueFd>
duplicate_fd(int fd) noexcept {
    errno = 0;
    const int out = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (out < 0) {
        return {make_errno_ec(), UniqueFd{}};
    }
    return {std::error_code{}, UniqueFd(out)};
}

/**
 * @brief 为终端句柄打开一个独立的 fd（输入、输出共用）。
 *
 * fd 是 tty 时按设备路径重新打开，使后续设置的 O_NONBLOCK 只作用于新的
 * 打开文件描述，不影响父 shell 共享的 stdin/stdout；重新打开失败或不是 tty 时退化为 dup。
 */
[[nodiscard]] inline std::pair<std::error_code, UniqueFd>
open_terminal(int fd) noexcept {
    if (::isatty(fd) == 1) {
        const char *path = ::ttyname(fd);
        if (path != nullptr) {
            const int reopened = ::open(path, O_RDWR | O_NOCTTY | O_CLOEXEC);
            if (reopened >= 0) {
                return {std::error_code{}, UniqueFd(reopened)};
            }
        }
    }
    return duplicate_fd(fd);
}

/**
 * @brief 读取文件状态标志（F_GETFL）。
 */
[[nodiscard]] inline std::pair<std::error_code, int> status_flags(int fd) noexcept {
    errno = 0;
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0) {
        return {make_errno_ec(), -1};
    }
    return {std::error_code{}, flags};
}

[[nodiscard]] inline std::error_code set_status_flags(int fd, int flags) noexcept {
    errno = 0;
    if (::fcntl(fd, F_SETFL, flags) != 0) {
        return make_errno_ec();
    }
    return {};
}

/**
 * @brief 在 base 的基础上得到 raw 模式设置。
 */
[[nodiscard]] inline termios make_raw_termios(const termios &base) noexcept {
    termios tio = base;
    tio.c_iflag &= static_cast<tcflag_t>(~(BRKINT | ICRNL | INPCK | ISTRIP | IXON));
    tio.c_oflag |= static_cast<tcflag_t>(ONLCR);
    tio.c_cflag |= static_cast<tcflag_t>(CS8);
    tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON | IEXTEN | ISIG));
    tio.c_cc[VMIN] = 1;
    tio.c_cc[VTIME] = 0;
    return tio;
}

} // namespace ttyecho::posix
