#pragma once

#include "ttyecho/loop/runtime.hpp"

#include <cstddef>
#include <memory>
#include <system_error>

namespace ttyecho::loop {

/**
 * @brief 事件循环门面：只暴露会话关闭流程需要的三个操作。
 *
 * 说明：
 * - run_until_stopped() 阻塞到 runtime 没有活跃的 I/O；
 * - 关闭句柄本身是异步的：walk_and_close_all() 之后必须再 run_until_stopped() 一次，
 *   close 通知才会派发；
 * - close() 在仍有未关闭句柄时返回 loop_busy。
 */
class EventLoop final {
public:
    explicit EventLoop(std::unique_ptr<Runtime> runtime);

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    [[nodiscard]] Runtime &runtime() noexcept { return *runtime_; }

    std::error_code run_until_stopped();
    // 返回本次标记关闭的句柄数（已在关闭中的句柄不重复计数）。
    std::size_t walk_and_close_all();
    std::error_code close();

    [[nodiscard]] bool closed() const noexcept { return runtime_->loop_closed(); }

private:
    std::unique_ptr<Runtime> runtime_;
};

} // namespace ttyecho::loop
