#include "ttyecho/session/state_machine.hpp"

#include "ttyecho/core/error.hpp"

namespace ttyecho::session {
namespace {

std::error_code invalid() noexcept { return core::make_error_code(core::errc::invalid_argument); }

} // namespace

const char *to_string(State s) noexcept {
    switch (s) {
        case State::idle:
            return "idle";
        case State::reading:
            return "reading";
        case State::writing:
            return "writing";
        case State::stopping:
            return "stopping";
        case State::closing_handles:
            return "closing_handles";
        case State::closing_loop:
            return "closing_loop";
        case State::done:
            return "done";
    }
    return "unknown";
}

const char *to_string(Event e) noexcept {
    switch (e) {
        case Event::read_started:
            return "read_started";
        case Event::write_submitted:
            return "write_submitted";
        case Event::write_completed:
            return "write_completed";
        case Event::stop_requested:
            return "stop_requested";
        case Event::handles_closing:
            return "handles_closing";
        case Event::loop_closing:
            return "loop_closing";
        case Event::released:
            return "released";
    }
    return "unknown";
}

std::error_code StateMachine::on_event(Event ev) noexcept {
    switch (ev) {
        case Event::read_started:
            if (state_ != State::idle) {
                return invalid();
            }
            state_ = write_pending_ ? State::writing : State::reading;
            return {};

        case Event::write_submitted:
            if (write_pending_) {
                return core::make_error_code(core::errc::busy);
            }
            if (state_ == State::done) {
                return invalid();
            }
            write_pending_ = true;
            if (state_ == State::reading) {
                state_ = State::writing;
            }
            return {};

        case Event::write_completed:
            if (!write_pending_) {
                return invalid();
            }
            write_pending_ = false;
            if (state_ == State::writing) {
                state_ = State::reading;
            }
            return {};

        case Event::stop_requested:
            if (state_ == State::idle || state_ == State::reading || state_ == State::writing ||
                    state_ == State::stopping) {
                state_ = State::stopping;
                return {};
            }
            return invalid();

        case Event::handles_closing:
            if (state_ != State::stopping) {
                return invalid();
            }
            state_ = State::closing_handles;
            return {};

        case Event::loop_closing:
            if (state_ != State::closing_handles) {
                return invalid();
            }
            state_ = State::closing_loop;
            return {};

        case Event::released:
            if (state_ != State::closing_loop) {
                return invalid();
            }
            state_ = State::done;
            return {};
    }
    return invalid();
}

} // namespace ttyecho::session
