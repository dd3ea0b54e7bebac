#include "ttyecho/core/error.hpp"
#include "ttyecho/loop/asio_runtime.hpp"
#include "ttyecho/loop/event_loop.hpp"
#include "ttyecho/loop/posix_tty.hpp"
#include "ttyecho/session/echo_app.hpp"
#include "ttyecho/session/tty_session.hpp"

#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace {

using ttyecho::loop::AsioRuntime;
using ttyecho::loop::EventLoop;
using ttyecho::posix::UniqueFd;
using ttyecho::posix::make_errno_ec;
using ttyecho::session::SessionOptions;
using ttyecho::session::TtySession;

int g_failures = 0;

void check(bool ok, const char *what) {
    if (!ok) {
        ++g_failures;
        std::cerr << "FAIL: " << what << "\n";
    }
}

static std::pair<std::error_code, std::pair<UniqueFd, UniqueFd>> create_pty() noexcept {
    errno = 0;
    const int master = ::posix_openpt(O_RDWR | O_NOCTTY);
    if (master < 0) {
        return {make_errno_ec(), std::pair<UniqueFd, UniqueFd>{}};
    }
    UniqueFd master_fd(master);
    if (::grantpt(master_fd.fd) != 0 || ::unlockpt(master_fd.fd) != 0) {
        return {make_errno_ec(), std::pair<UniqueFd, UniqueFd>{}};
    }
    const char *slave_name = ::ptsname(master_fd.fd);
    if (!slave_name) {
        return {make_errno_ec(), std::pair<UniqueFd, UniqueFd>{}};
    }
    const int slave = ::open(slave_name, O_RDWR | O_NOCTTY);
    if (slave < 0) {
        return {make_errno_ec(), std::pair<UniqueFd, UniqueFd>{}};
    }
    return {std::error_code{}, std::pair<UniqueFd, UniqueFd>{std::move(master_fd), UniqueFd(slave)}};
}

static bool write_all(int fd, std::string_view data) {
    std::size_t total = 0;
    while (total < data.size()) {
        const auto n = ::write(fd, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        total += static_cast<std::size_t>(n);
    }
    return true;
}

// pty 的数据搬运是异步的：poll 读取直到拿到 expected_size 字节或超时。
static std::string read_until(int fd, std::size_t expected_size, std::chrono::milliseconds timeout) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.size() < expected_size) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            break;
        }
        pollfd pfd{fd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc <= 0) {
            if (rc < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        char buf[256];
        const auto n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

static bool is_non_blocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL);
    return flags >= 0 && (flags & O_NONBLOCK) != 0;
}

static std::string echo_of(std::string_view s) {
    std::string out(s);
    out.push_back('\0');
    return out;
}

// 在 pty 上完整跑一次：问候语 + 回显 + Ctrl-C 退出，并验证终端设置被恢复。
static bool test_pty_echo_session() {
    auto [ec, pair] = create_pty();
    if (ec) {
        std::cout << "SKIP pty: " << ec.message() << "\n";
        return true;
    }
    auto &[master, slave] = pair;

    termios before{};
    check(::tcgetattr(slave.fd, &before) == 0, "tcgetattr before");
    check(!is_non_blocking(slave.fd), "slave blocking before");

    EventLoop loop(std::make_unique<AsioRuntime>());
    SessionOptions opt;
    opt.input_fd = slave.fd;
    opt.output_fd = slave.fd;

    auto [err, session] = TtySession::create(loop, opt);
    check(!err, "create");
    if (!session) {
        return false;
    }
    check(!session->enter_raw_mode(), "enter_raw_mode");

    termios raw{};
    check(::tcgetattr(slave.fd, &raw) == 0, "tcgetattr raw");
    check((raw.c_lflag & ICANON) == 0, "raw: ICANON off");
    check((raw.c_lflag & ECHO) == 0, "raw: ECHO off");
    check((raw.c_lflag & ISIG) == 0, "raw: ISIG off");
    check((raw.c_oflag & ONLCR) != 0, "raw: ONLCR kept");

    check(!session->start(), "start");
    check(!session->submit_greeting(), "greeting");

    // 一次写入全部输入：raw 模式下 slave 侧逐字节可读，Ctrl-C 不再产生信号。
    check(write_all(master.fd, "hi\r\x03"), "write input");

    check(!loop.run_until_stopped(), "main run");
    const auto report = TtySession::shutdown_sequence(std::move(session), loop);
    check(!report.error.has_value(), "no error");
    if (report.error) {
        std::cerr << "  " << report.error->describe() << "\n";
    }
    check(report.handles_closed == 2, "both handles closed");
    check(report.outstanding_buffers == 0, "no outstanding buffers");
    check(loop.closed(), "loop closed");

    termios after{};
    check(::tcgetattr(slave.fd, &after) == 0, "tcgetattr after");
    check(after.c_lflag == before.c_lflag, "lflag restored");
    check(after.c_iflag == before.c_iflag, "iflag restored");
    // 同一个 slave fd 既做输入又做输出，会话结束后不能留下 O_NONBLOCK。
    check(!is_non_blocking(slave.fd), "slave still blocking after shutdown");

    // 输出经过 ONLCR："\n" 在 master 侧读到 "\r\n"。输入可能被分成多次读取，这里只比较拼接结果。
    const std::string greeting(ttyecho::session::kDefaultGreeting);
    const std::string got = read_until(master.fd, greeting.size() + 8, std::chrono::milliseconds(2000));
    check(got.rfind(greeting, 0) == 0, "greeting first");
    std::string echoed = got.substr(std::min(got.size(), greeting.size()));
    std::string compact;
    for (char c : echoed) {
        if (c != '\0') {
            compact.push_back(c);
        }
    }
    check(compact == "hi\r\n^C", "echo content");
    check(!echoed.empty() && echoed.back() == '\0', "sentinel last");
    return true;
}

// 非 tty 输入：切换 raw 模式失败，会话报告 ENOTTY 并照常关闭。
static bool test_pipe_input_is_not_a_tty() {
    int in_fds[2]{-1, -1};
    int out_fds[2]{-1, -1};
    if (::pipe(in_fds) != 0 || ::pipe(out_fds) != 0) {
        check(false, "pipe");
        return false;
    }
    UniqueFd in_r(in_fds[0]), in_w(in_fds[1]), out_r(out_fds[0]), out_w(out_fds[1]);

    EventLoop loop(std::make_unique<AsioRuntime>());
    SessionOptions opt;
    opt.input_fd = in_r.fd;
    opt.output_fd = out_w.fd;

    const auto report = ttyecho::session::run_echo_session(loop, opt);
    check(report.error.has_value(), "pipe: error reported");
    if (report.error) {
        check(report.error->kind() == ttyecho::core::errc::mode_failed, "pipe: mode_failed");
        const auto text = report.error->describe();
        check(text.rfind("Error calling tty_set_mode: ", 0) == 0, "pipe: func name");
        check(text.size() >= 8 && text.compare(text.size() - 8, 8, "(ENOTTY)") == 0, "pipe: ENOTTY");
    }
    check(report.handles_closed == 2, "pipe: handles closed");
    check(loop.closed(), "pipe: loop closed");
    return true;
}

// 管道写端关闭后读到 EOF：回显已读数据，然后以 EOF 结束。
static bool test_pipe_eof_after_data() {
    int in_fds[2]{-1, -1};
    int out_fds[2]{-1, -1};
    if (::pipe(in_fds) != 0 || ::pipe(out_fds) != 0) {
        check(false, "pipe");
        return false;
    }
    UniqueFd in_r(in_fds[0]), in_w(in_fds[1]), out_r(out_fds[0]), out_w(out_fds[1]);

    EventLoop loop(std::make_unique<AsioRuntime>());
    SessionOptions opt;
    opt.input_fd = in_r.fd;
    opt.output_fd = out_w.fd;
    opt.greeting_enabled = false;

    auto [err, session] = TtySession::create(loop, opt);
    check(!err, "eof: create");
    if (!session) {
        return false;
    }
    check(!session->start(), "eof: start");
    check(write_all(in_w.fd, "abc"), "eof: write input");
    in_w.reset();

    check(!loop.run_until_stopped(), "eof: main run");
    const auto report = TtySession::shutdown_sequence(std::move(session), loop);
    check(report.error.has_value(), "eof: error reported");
    if (report.error) {
        check(report.error->func() == "read_cb", "eof: read_cb");
        const auto text = report.error->describe();
        check(text.size() >= 5 && text.compare(text.size() - 5, 5, "(EOF)") == 0, "eof: EOF name");
    }
    check(report.outstanding_buffers == 0, "eof: no outstanding buffers");
    // 管道走 dup 路径，与原 fd 共享打开文件描述：状态标志必须在关闭前还原。
    check(!is_non_blocking(in_r.fd), "eof: input still blocking after shutdown");
    check(!is_non_blocking(out_w.fd), "eof: output still blocking after shutdown");

    out_w.reset();
    const std::string got = read_until(out_r.fd, 4, std::chrono::milliseconds(1000));
    check(got == echo_of("abc"), "eof: echo content");
    return true;
}

} // namespace

int main() {
    check(test_pty_echo_session(), "pty echo session");
    check(test_pipe_input_is_not_a_tty(), "pipe not a tty");
    check(test_pipe_eof_after_data(), "pipe eof");
    if (g_failures != 0) {
        std::cerr << "FAILED: " << g_failures << " checks\n";
        return 1;
    }
    std::cout << "PASS\n";
    return 0;
}
