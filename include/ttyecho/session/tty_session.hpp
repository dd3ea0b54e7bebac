#pragma once

#include "ttyecho/core/buffer.hpp"
#include "ttyecho/core/common.hpp"
#include "ttyecho/core/error.hpp"
#include "ttyecho/core/error_slot.hpp"
#include "ttyecho/loop/event_loop.hpp"
#include "ttyecho/loop/runtime.hpp"
#include "ttyecho/session/state_machine.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ttyecho::session {

inline constexpr std::string_view kDefaultGreeting =
    "This program echoes anything you type! Try it out (Ctrl+C to quit): ";

struct SessionOptions final {
    int input_fd{core::kStdinFd};
    int output_fd{core::kStdoutFd};
    bool greeting_enabled{true};
    std::string greeting{kDefaultGreeting};
};

/**
 * @brief 关闭流程的结果（会话对象已释放，这里保留需要对外报告的信息）。
 */
struct ShutdownReport final {
    std::optional<core::Error> error{};
    std::size_t handles_closed{0};
    std::size_t outstanding_buffers{0};
    std::size_t double_releases{0};
    State final_state{State::idle};
};

/**
 * @brief 原始模式终端回显会话。
 *
 * 职责：
 * - 持有输入/输出两个终端句柄与唯一的写请求槽位；
 * - 读回调：转义输入 -> 提交回显写；遇到 Ctrl-C 或读错误时停止读取；
 * - 写完成回调：回收写出的缓冲区（失败只记日志，不结束会话）；
 * - 异步回调里的错误记录到 ErrorSlot（先到先得），关闭流程结束时统一报告。
 *
 * 注意：
 * - 只能通过 create() 在堆上创建，且不可移动：已注册的回调捕获了 this；
 * - 同一时刻最多一个写在途（单个可复用的写请求）；
 * - 默认假设在事件循环所在线程上使用，不做加锁。
 */
class TtySession final {
public:
    // 依次绑定输入、输出句柄；任一失败返回 init_failed 且不返回会话（已绑定的句柄随会话析构释放）。
    [[nodiscard]] static std::pair<core::Error, std::unique_ptr<TtySession>>
    create(loop::EventLoop &loop, SessionOptions options = {});

    /**
     * @brief 完整关闭流程（七步，按顺序执行且不提前退出）。
     *
     * 1) 停止读取；2) 恢复终端模式（即使第 1 步失败）；3) 运行事件循环；
     * 4) 标记所有未关闭句柄；5) 再运行一次事件循环派发 close 通知；
     * 6) 关闭事件循环；7) 释放会话。
     * 每一步的错误仅在此前没有记录过错误时写入 ErrorSlot。
     */
    static ShutdownReport shutdown_sequence(std::unique_ptr<TtySession> session,
                                            loop::EventLoop &loop);

    ~TtySession();

    TtySession(const TtySession &) = delete;
    TtySession &operator=(const TtySession &) = delete;
    TtySession(TtySession &&) = delete;
    TtySession &operator=(TtySession &&) = delete;

    core::Error enter_raw_mode();
    core::Error start();
    // 已有写在途时返回 busy，bytes 与在途缓冲区都不受影响；runtime 同步拒绝时返回 write_rejected，所有权留在调用方。
    core::Error submit_write(core::BufferCell &&bytes);
    // 提交 options.greeting（禁用或为空时直接成功）。
    core::Error submit_greeting();
    // 幂等：停止后再次调用直接成功。
    core::Error stop();

    // 记录同步路径上的错误（例如启动失败），遵循先到先得。
    bool record(core::Error err) { return errors_.record(std::move(err)); }

    [[nodiscard]] State state() const noexcept { return fsm_.state(); }
    [[nodiscard]] bool running() const noexcept { return fsm_.running(); }
    [[nodiscard]] bool write_pending() const noexcept { return write_req_.pending(); }
    [[nodiscard]] const core::ErrorSlot &errors() const noexcept { return errors_; }
    [[nodiscard]] const core::BufferLedger &ledger() const noexcept { return ledger_; }
    [[nodiscard]] const loop::Handle &input() const noexcept { return input_; }
    [[nodiscard]] const loop::Handle &output() const noexcept { return output_; }
    [[nodiscard]] const SessionOptions &options() const noexcept { return options_; }

private:
    TtySession(loop::EventLoop &loop, SessionOptions options);

    core::BufferCell on_alloc(std::size_t suggested_size);
    void on_read(std::error_code ec, std::size_t nread, core::BufferCell buffer);
    void on_write(std::error_code status, core::BufferCell buffer);

    void reclaim(const char *where);
    void transition(Event ev);

    loop::EventLoop &loop_;
    SessionOptions options_;

    loop::Handle input_{};
    loop::Handle output_{};
    loop::WriteRequest write_req_{};

    core::ErrorSlot errors_{};
    core::BufferLedger ledger_{};
    StateMachine fsm_{};
};

} // namespace ttyecho::session
