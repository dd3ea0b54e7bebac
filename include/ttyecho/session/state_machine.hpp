#pragma once

#include <cstdint>
#include <system_error>

namespace ttyecho::session {

enum class State : std::uint8_t {
    idle = 0,
    reading = 1,
    writing = 2,
    stopping = 3,
    closing_handles = 4,
    closing_loop = 5,
    done = 6,
};

enum class Event : std::uint8_t {
    read_started = 0,
    write_submitted = 1,
    write_completed = 2,
    stop_requested = 3,
    handles_closing = 4,
    loop_closing = 5,
    released = 6,
};

[[nodiscard]] const char *to_string(State s) noexcept;
[[nodiscard]] const char *to_string(Event e) noexcept;

/**
 * @brief 回显会话状态机（每个回调/关闭步骤对应一次 on_event）。
 *
 * 转移：
 * - idle --read_started--> reading
 * - reading --write_submitted--> writing --write_completed--> reading
 * - idle/reading/writing --stop_requested--> stopping（stopping 下重复 stop 视为成功）
 * - stopping --handles_closing--> closing_handles --loop_closing--> closing_loop --released--> done
 *
 * 写请求在途标志与状态正交：idle/stopping/closing_* 下同样可能有一个写在途，
 * 同一时刻最多一个（第二次 write_submitted 返回 busy）。
 * 非法转移返回 invalid_argument，状态保持不变。
 */
class StateMachine final {
public:
    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool write_pending() const noexcept { return write_pending_; }
    [[nodiscard]] bool running() const noexcept {
        return state_ == State::reading || state_ == State::writing;
    }

    std::error_code on_event(Event ev) noexcept;

private:
    State state_{State::idle};
    bool write_pending_{false};
};

} // namespace ttyecho::session
