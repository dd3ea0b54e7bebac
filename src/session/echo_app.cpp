#include "ttyecho/session/echo_app.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace ttyecho::session {

ShutdownReport run_echo_session(loop::EventLoop &loop, SessionOptions options) {
    auto [err, session] = TtySession::create(loop, std::move(options));
    if (err) {
        spdlog::debug("echo session: init failed: {}", err.describe());
        if (auto ec = loop.close(); ec) {
            spdlog::warn("echo session: close loop after init failure: {}", ec.message());
        }
        ShutdownReport report;
        report.error = std::move(err);
        return report;
    }

    auto setup = session->enter_raw_mode();
    if (!setup) {
        setup = session->start();
    }
    if (!setup) {
        setup = session->submit_greeting();
    }

    if (setup) {
        spdlog::debug("echo session: setup failed, skip main loop: {}", setup.describe());
        session->record(std::move(setup));
    } else {
        spdlog::info("echo session: running");
        if (auto ec = loop.run_until_stopped(); ec) {
            session->record(core::Error(core::errc::runtime, "run", ec));
        }
    }

    return TtySession::shutdown_sequence(std::move(session), loop);
}

} // namespace ttyecho::session
