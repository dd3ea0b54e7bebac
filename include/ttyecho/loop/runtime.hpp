#pragma once

#include "ttyecho/core/buffer.hpp"
#include "ttyecho/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <system_error>

namespace ttyecho::loop {

class Runtime;

enum class HandleKind : std::uint8_t {
    tty_input = 0,
    tty_output = 1,
};

enum class HandleState : std::uint8_t {
    unbound = 0,
    active = 1,
    closing = 2,
    closed = 3,
};

/**
 * @brief runtime 私有的句柄状态（asio descriptor、脚本队列等）。
 */
struct HandleImpl {
    virtual ~HandleImpl() = default;
};

/**
 * @brief 终端 I/O 句柄（由使用方持有，runtime 负责初始化与关闭）。
 *
 * 注意：
 * - 句柄绑定后其地址会被 runtime 记录（walk/回调），因此不可复制、不可移动；
 * - 析构时若仍未关闭，会直接释放 runtime 资源并从 runtime 注销，
 *   用于“初始化中途失败”等无法再跑一轮事件循环的场景。
 */
class Handle final {
public:
    Handle() = default;
    ~Handle();

    Handle(const Handle &) = delete;
    Handle &operator=(const Handle &) = delete;

    [[nodiscard]] HandleKind kind() const noexcept { return kind_; }
    [[nodiscard]] HandleState state() const noexcept { return state_; }
    [[nodiscard]] int fd() const noexcept { return fd_; }

    [[nodiscard]] bool is_active() const noexcept { return state_ == HandleState::active; }
    [[nodiscard]] bool is_closing() const noexcept {
        return state_ == HandleState::closing || state_ == HandleState::closed;
    }
    [[nodiscard]] bool is_closed() const noexcept { return state_ == HandleState::closed; }

private:
    friend class Runtime;

    HandleKind kind_{HandleKind::tty_input};
    HandleState state_{HandleState::unbound};
    int fd_{-1};
    Runtime *owner_{nullptr};
    std::unique_ptr<HandleImpl> impl_{};
};

/**
 * @brief 写请求槽位：同一时刻最多一个写操作在途。
 */
class WriteRequest final {
public:
    WriteRequest() = default;

    WriteRequest(const WriteRequest &) = delete;
    WriteRequest &operator=(const WriteRequest &) = delete;

    [[nodiscard]] bool pending() const noexcept { return pending_; }
    [[nodiscard]] Handle *handle() const noexcept { return handle_; }

private:
    friend class Runtime;

    bool pending_{false};
    Handle *handle_{nullptr};
};

// 分配回调：仅在输入就绪时调用；返回空 cell 表示没有可用缓冲区。
using AllocCallback = std::function<core::BufferCell(Handle &, std::size_t suggested_size)>;
// 读回调：ec 非空表示错误/EOF；nread == 0 且无错误表示暂无数据。buffer 为分配回调给出的 cell。
using ReadCallback =
    std::function<void(Handle &, std::error_code ec, std::size_t nread, core::BufferCell buffer)>;
// 写完成回调：无论成功与否都会交还写出的 cell。
using WriteCallback =
    std::function<void(WriteRequest &, std::error_code status, core::BufferCell buffer)>;
using CloseCallback = std::function<void(Handle &)>;
using WalkCallback = std::function<void(Handle &)>;

/**
 * @brief 异步 I/O runtime 抽象（事件循环 + 终端句柄 + 读写原语）。
 *
 * 说明：
 * - 会话层只依赖该接口的语义，不关心底层是 asio 还是内存脚本；
 * - 生产环境使用 AsioRuntime；单元测试注入 MemoryRuntime；
 * - 所有回调都在 run() 的调用线程上串行执行。
 */
class Runtime {
public:
    virtual ~Runtime() = default;

    virtual std::error_code bind_terminal_input(Handle &handle, int fd) = 0;
    virtual std::error_code bind_terminal_output(Handle &handle, int fd) = 0;

    // 首次调用时保存终端原始设置，restore_mode() 恢复它（runtime 级别，不区分句柄）。
    virtual std::error_code set_raw_mode(Handle &handle) = 0;
    virtual std::error_code restore_mode() = 0;

    virtual std::error_code start_reading(Handle &handle, AllocCallback alloc_cb, ReadCallback read_cb) = 0;
    // 未在读取时返回成功（幂等）。
    virtual std::error_code stop_reading(Handle &handle) = 0;

    // 仅在接受提交时才从 buffer 移走；失败时所有权留在调用方。
    virtual std::error_code submit_write(WriteRequest &req,
                                         Handle &handle,
                                         core::BufferCell &&buffer,
                                         WriteCallback cb) = 0;

    // 阻塞直到没有活跃的 I/O 与待派发的回调。
    virtual std::error_code run() = 0;
    virtual void walk(const WalkCallback &visit) = 0;
    // 异步关闭：句柄立即进入 closing，下一次 run() 时变为 closed 并回调 cb。
    virtual void close_handle(Handle &handle, CloseCallback cb = {}) = 0;
    // 仍有未关闭句柄时返回 loop_busy。
    virtual std::error_code close_loop() = 0;

    [[nodiscard]] virtual bool loop_closed() const noexcept = 0;

protected:
    // 子类通过以下辅助函数访问 Handle/WriteRequest 的私有状态。
    void attach(Handle &handle, HandleKind kind, int fd, std::unique_ptr<HandleImpl> impl) noexcept;
    static HandleImpl *impl_of(Handle &handle) noexcept { return handle.impl_.get(); }
    static void mark_closing(Handle &handle) noexcept;
    // 释放 impl 并标记 closed（注销由子类自行完成）。
    static void mark_closed(Handle &handle) noexcept;
    // runtime 先于句柄析构时调用：释放 impl 并断开 owner，句柄析构时不再回调 forget。
    static void detach(Handle &handle) noexcept;

    static void mark_pending(WriteRequest &req, Handle &handle) noexcept;
    static void mark_done(WriteRequest &req) noexcept;

    // Handle 析构且未关闭时回调；子类需从自身的句柄表中移除它。
    virtual void forget(Handle &handle) noexcept = 0;

private:
    friend class Handle;
};

} // namespace ttyecho::loop
