#pragma once

#include "ttyecho/core/buffer.hpp"
#include "ttyecho/core/common.hpp"
#include "ttyecho/loop/runtime.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string_view>
#include <system_error>
#include <vector>

namespace ttyecho::loop {

/**
 * @brief 内存脚本 runtime（用于单元测试）。
 *
 * 特性：
 * - feed_input/feed_status/feed_error 预置输入事件，run() 时按顺序投递给读回调；
 * - fail_next 注入同步失败（下一次对应调用返回指定错误）；
 * - set_write_status 让后续写操作以指定状态完成（模拟异步写失败）；
 * - run() 按“写完成 -> 一段输入 -> 关闭通知”的顺序循环派发，脚本耗尽即返回。
 */
class MemoryRuntime final : public Runtime {
public:
    enum class Op : std::uint8_t {
        bind_input = 0,
        bind_output = 1,
        set_raw_mode = 2,
        restore_mode = 3,
        start_reading = 4,
        stop_reading = 5,
        submit_write = 6,
        run = 7,
        close_loop = 8,
    };

    enum class TtyMode : std::uint8_t {
        normal = 0,
        raw = 1,
    };

    MemoryRuntime() = default;
    ~MemoryRuntime() override;

    MemoryRuntime(const MemoryRuntime &) = delete;
    MemoryRuntime &operator=(const MemoryRuntime &) = delete;

    void feed_input(core::bytes_view data);
    void feed_input(std::string_view text);
    // status < 0：按 -status 作为 errno 投递读错误；否则投递一次 nread == 0（暂无数据）。
    void feed_status(int status);
    void feed_error(std::error_code ec);

    void fail_next(Op op, std::error_code ec);
    void set_write_status(std::error_code ec) noexcept { write_status_ = ec; }

    [[nodiscard]] std::vector<core::byte> output() const;
    [[nodiscard]] const std::vector<std::vector<core::byte>> &writes() const noexcept { return written_; }
    [[nodiscard]] TtyMode tty_mode() const noexcept { return mode_; }
    [[nodiscard]] std::size_t restore_count() const noexcept { return restore_count_; }
    [[nodiscard]] std::size_t run_count() const noexcept { return run_count_; }
    [[nodiscard]] std::size_t handle_count() const noexcept { return handles_.size(); }
    [[nodiscard]] std::size_t pending_input() const noexcept { return input_.size(); }
    [[nodiscard]] std::size_t pending_writes() const noexcept { return writes_.size(); }

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

    struct InputEvent final {
        std::vector<core::byte> bytes{};
        std::error_code ec{};
    };

    struct PendingWrite final {
        WriteRequest *req{nullptr};
        std::uint64_t handle_id{0};
        core::BufferCell cell{};
        WriteCallback cb{};
        std::error_code status{};
    };

    struct PendingClose final {
        std::uint64_t handle_id{0};
        CloseCallback cb{};
    };

    std::error_code take_failure(Op op) noexcept;
    std::error_code bind(Handle &handle, HandleKind kind, int fd, Op op);
    bool deliver_input();
    [[nodiscard]] Handle *find(std::uint64_t id) const noexcept;
    [[nodiscard]] std::uint64_t id_of(const Handle &handle) const noexcept;
    void unregister(const Handle *handle) noexcept;

    std::vector<Registered> handles_{};
    std::uint64_t next_id_{1};
    bool closed_{false};

    std::map<Op, std::error_code> failures_{};
    std::error_code write_status_{};

    std::deque<InputEvent> input_{};
    std::deque<PendingWrite> writes_{};
    std::deque<PendingClose> closes_{};

    std::vector<std::vector<core::byte>> written_{};
    TtyMode mode_{TtyMode::normal};
    bool mode_saved_{false};
    std::size_t restore_count_{0};
    std::size_t run_count_{0};
};

} // namespace ttyecho::loop
