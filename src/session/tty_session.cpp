#include "ttyecho/session/tty_session.hpp"

#include "ttyecho/echo/transform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ttyecho::session {

/*
 * 缓冲区所有权在会话与 runtime 之间的流转：
 * - on_alloc 交出一块新缓冲区（lend），同一块在 on_read 里交还（reclaim）；
 * - submit_write 被接受时交出（lend），在 on_write 里交还（reclaim）；
 * - BufferCell 只可移动，交还后随局部变量析构释放；ledger_ 负责检测泄漏/重复释放。
 */
TtySession::TtySession(loop::EventLoop &loop, SessionOptions options)
    : loop_(loop), options_(std::move(options)) {}

TtySession::~TtySession() {
    if (!input_.is_closed() || !output_.is_closed()) {
        spdlog::debug("TtySession: released with handle(s) not closed by the loop");
    }
}

std::pair<core::Error, std::unique_ptr<TtySession>>
TtySession::create(loop::EventLoop &loop, SessionOptions options) {
    std::unique_ptr<TtySession> session(new TtySession(loop, std::move(options)));
    auto &rt = loop.runtime();

    if (auto ec = rt.bind_terminal_input(session->input_, session->options_.input_fd); ec) {
        return {core::Error(core::errc::init_failed, "tty_init", ec), nullptr};
    }
    if (auto ec = rt.bind_terminal_output(session->output_, session->options_.output_fd); ec) {
        // 输入句柄已绑定：随 session 析构释放并从 runtime 注销。
        return {core::Error(core::errc::init_failed, "tty_init", ec), nullptr};
    }

    spdlog::debug("TtySession: bound input fd={} output fd={}",
                  session->options_.input_fd,
                  session->options_.output_fd);
    return {core::Error{}, std::move(session)};
}

core::Error TtySession::enter_raw_mode() {
    if (auto ec = loop_.runtime().set_raw_mode(input_); ec) {
        return core::Error(core::errc::mode_failed, "tty_set_mode", ec);
    }
    return {};
}

core::Error TtySession::start() {
    if (fsm_.state() != State::idle) {
        return core::Error(core::errc::start_failed,
                           "read_start",
                           core::make_error_code(core::errc::invalid_argument));
    }
    auto ec = loop_.runtime().start_reading(
        input_,
        [this](loop::Handle &, std::size_t suggested_size) { return on_alloc(suggested_size); },
        [this](loop::Handle &, std::error_code read_ec, std::size_t nread, core::BufferCell buffer) {
            on_read(read_ec, nread, std::move(buffer));
        });
    if (ec) {
        return core::Error(core::errc::start_failed, "read_start", ec);
    }
    transition(Event::read_started);
    return {};
}

core::Error TtySession::submit_write(core::BufferCell &&bytes) {
    if (write_req_.pending() || fsm_.write_pending()) {
        return core::Error(core::errc::busy, "submit_write", core::make_error_code(core::errc::busy));
    }

    ledger_.lend();
    auto ec = loop_.runtime().submit_write(
        write_req_,
        output_,
        std::move(bytes),
        [this](loop::WriteRequest &, std::error_code status, core::BufferCell buffer) {
            on_write(status, std::move(buffer));
        });
    if (ec) {
        // 未被接受：所有权仍在调用方，撤销本次借出。
        reclaim("submit_write");
        return core::Error(core::errc::write_rejected, "write", ec);
    }
    transition(Event::write_submitted);
    return {};
}

core::Error TtySession::submit_greeting() {
    if (!options_.greeting_enabled || options_.greeting.empty()) {
        return {};
    }
    auto cell = core::BufferCell::copy_of(core::bytes_view{
        reinterpret_cast<const core::byte *>(options_.greeting.data()), options_.greeting.size()});
    if (!cell.valid()) {
        return core::Error(core::errc::write_rejected,
                           "write",
                           std::make_error_code(std::errc::not_enough_memory));
    }
    return submit_write(std::move(cell));
}

core::Error TtySession::stop() {
    const auto s = fsm_.state();
    if (s == State::stopping || s == State::closing_handles || s == State::closing_loop ||
        s == State::done) {
        return {};
    }
    transition(Event::stop_requested);

    if (!input_.is_active()) {
        return {};
    }
    if (auto ec = loop_.runtime().stop_reading(input_); ec) {
        return core::Error(core::errc::runtime, "read_stop", ec);
    }
    spdlog::debug("TtySession: reading stopped");
    return {};
}

core::BufferCell TtySession::on_alloc(std::size_t suggested_size) {
    auto cell = core::BufferCell::allocate(suggested_size);
    if (cell.valid()) {
        ledger_.lend();
    }
    return cell;
}

void TtySession::on_read(std::error_code ec, std::size_t nread, core::BufferCell buffer) {
    // 读缓冲区在本函数结束时随 buffer 析构释放。
    if (buffer.valid()) {
        reclaim("on_read");
    }

    if (ec) {
        spdlog::debug("TtySession: read error: {}", ec.message());
        errors_.record(core::errc::runtime, "read_cb", ec);
        errors_.record(stop());
        return;
    }
    if (nread == 0) {
        return;
    }

    const auto input = buffer.readable_bytes().first(std::min(nread, buffer.size()));
    auto result = echo::echo_transform(input);
    spdlog::trace("TtySession: read {} byte(s), echo {} byte(s)", input.size(), result.output.size());

    if (!result.output.valid()) {
        errors_.record(core::errc::runtime,
                       "echo_transform",
                       std::make_error_code(std::errc::not_enough_memory));
    } else {
        // 提交失败只记录，不结束会话。
        errors_.record(submit_write(std::move(result.output)));
    }

    if (result.terminate) {
        spdlog::debug("TtySession: Ctrl-C received");
        errors_.record(stop());
    }
}

void TtySession::on_write(std::error_code status, core::BufferCell buffer) {
    reclaim("on_write");
    transition(Event::write_completed);
    if (status) {
        spdlog::warn("TtySession: write of {} byte(s) failed: {}", buffer.size(), status.message());
    }
}

void TtySession::reclaim(const char *where) {
    if (auto ec = ledger_.reclaim(); ec) {
        spdlog::error("TtySession: {} reclaimed a buffer that was not lent", where);
    }
}

void TtySession::transition(Event ev) {
    const auto from = fsm_.state();
    if (auto ec = fsm_.on_event(ev); ec) {
        spdlog::error("TtySession: invalid transition {} in state {}", to_string(ev), to_string(from));
        return;
    }
    spdlog::trace("TtySession: {} -> {} ({})", to_string(from), to_string(fsm_.state()), to_string(ev));
}

ShutdownReport TtySession::shutdown_sequence(std::unique_ptr<TtySession> session,
                                             loop::EventLoop &loop) {
    ShutdownReport report;
    if (!session) {
        return report;
    }
    auto &errors = session->errors_;

    // 1) 停止读取
    errors.record(session->stop());

    // 2) 恢复终端模式：无论第 1 步是否失败都要执行，避免留下不可用的终端。
    errors.record(core::errc::mode_failed, "tty_reset_mode", loop.runtime().restore_mode());

    // 3) 运行事件循环，派发剩余的写完成回调
    errors.record(core::errc::runtime, "run", loop.run_until_stopped());

    // 4) 标记所有未关闭的句柄
    session->transition(Event::handles_closing);
    loop.walk_and_close_all();

    // 5) 再运行一次，close 通知在这一轮派发
    errors.record(core::errc::runtime, "run", loop.run_until_stopped());

    // 6) 关闭事件循环
    session->transition(Event::loop_closing);
    errors.record(core::errc::runtime, "loop_close", loop.close());

    // 7) 释放会话
    session->transition(Event::released);
    report.error = errors.first();
    report.handles_closed = static_cast<std::size_t>(session->input_.is_closed()) +
                            static_cast<std::size_t>(session->output_.is_closed());
    report.outstanding_buffers = session->ledger_.outstanding();
    report.double_releases = session->ledger_.double_releases();
    report.final_state = session->fsm_.state();
    if (report.outstanding_buffers != 0) {
        spdlog::warn("TtySession: {} buffer(s) still outstanding at release", report.outstanding_buffers);
    }
    session.reset();

    spdlog::debug("TtySession: shutdown complete ({} handle(s) closed)", report.handles_closed);
    return report;
}

} // namespace ttyecho::session
