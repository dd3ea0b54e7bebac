#pragma once

#include "ttyecho/loop/event_loop.hpp"
#include "ttyecho/session/tty_session.hpp"

namespace ttyecho::session {

/**
 * @brief 完整跑一次回显会话：创建 -> 原始模式 -> 开始读取 -> 问候语 -> 主循环 -> 关闭流程。
 *
 * 说明：
 * - 初始化失败时没有可关闭的句柄，直接关闭事件循环并返回该错误；
 * - 初始化之后的任一步失败：记录错误、跳过主循环，仍然完整执行关闭流程；
 * - 返回后 loop 已关闭，不能再次使用。
 */
ShutdownReport run_echo_session(loop::EventLoop &loop, SessionOptions options = {});

} // namespace ttyecho::session
