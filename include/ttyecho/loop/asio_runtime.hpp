#pragma once

/*
 * 基于 standalone Asio 的 Runtime 实现（POSIX 终端）。
 *
 * 设计要点：
 * - 单个 asio::io_context，run() 在调用线程上派发全部回调；
 * - 每个句柄对应一个 asio::posix::stream_descriptor（fd 为 dup/重新打开的副本）；
 * - 读路径采用“就绪通知”模型：async_wait(wait_read) -> 分配回调 -> 非阻塞 read_some -> 读回调；
 * - 关闭句柄时立即关闭 descriptor（在途操作以 operation_aborted 完成），
 *   close 通知 post 到下一次 run()。
 */

#include <asio/detail/config.hpp>

#if !defined(ASIO_HAS_POSIX_STREAM_DESCRIPTOR)
#error "ttyecho::loop::AsioRuntime 仅支持 POSIX（需要 ASIO_HAS_POSIX_STREAM_DESCRIPTOR）"
#endif

#include "ttyecho/loop/posix_tty.hpp"
#include "ttyecho/loop/runtime.hpp"

#include <asio/io_context.hpp>

#include <termios.h>

#include <cstdint>
#include <system_error>
#include <vector>

namespace ttyecho::loop {

class AsioRuntime final : public Runtime {
public:
    AsioRuntime();
    ~AsioRuntime() override;

    AsioRuntime(const AsioRuntime &) = delete;
    AsioRuntime &operator=(const AsioRuntime &) = delete;

    [[nodiscard]] asio::io_context &context() noexcept { return io_; }

    std::error_code bind_terminal_input(Handle &handle, int fd) override;
    std::error_code bind_terminal_output(Handle &handle, int fd) override;

    std::error_code set_raw_mode(Handle &handle) override;
    std::error_code restore_mode() override;

    std::error_code start_reading(Handle &handle, AllocCallback alloc_cb, ReadCallback read_cb) override;
    std::error_code stop_reading(Handle &handle) override;

    std::error_code submit_write(WriteRequest &req,
                                 Handle &handle,
                                 core::BufferCell &&buffer,
                                 WriteCallback cb) override;

    std::error_code run() override;
    void walk(const WalkCallback &visit) override;
    void close_handle(Handle &handle, CloseCallback cb = {}) override;
    std::error_code close_loop() override;

    [[nodiscard]] bool loop_closed() const noexcept override { return closed_; }

protected:
    void forget(Handle &handle) noexcept override;

private:
    struct Registered final {
        Handle *handle{nullptr};
        std::uint64_t id{0};
    };

    std::error_code bind(Handle &handle, HandleKind kind, int fd, posix::UniqueFd owned);
    void arm_read(Handle &handle);
    void on_readable(std::uint64_t id, std::error_code ec);
    [[nodiscard]] Handle *find(std::uint64_t id) const noexcept;
    void unregister(const Handle *handle) noexcept;

    asio::io_context io_;
    std::vector<Registered> handles_{};
    std::uint64_t next_id_{1};
    bool closed_{false};

    // 首次 set_raw_mode 时保存的终端设置；saved_fd_ 为独立副本，句柄关闭后仍可恢复。
    posix::UniqueFd saved_fd_{};
    termios saved_mode_{};
    bool raw_active_{false};
};

} // namespace ttyecho::loop
