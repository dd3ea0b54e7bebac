#include "ttyecho/loop/event_loop.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace ttyecho::loop {

EventLoop::EventLoop(std::unique_ptr<Runtime> runtime) : runtime_(std::move(runtime)) {}

std::error_code EventLoop::run_until_stopped() {
    auto ec = runtime_->run();
    if (ec) {
        spdlog::debug("EventLoop: run failed: {}", ec.message());
    }
    return ec;
}

std::size_t EventLoop::walk_and_close_all() {
    std::size_t marked = 0;
    runtime_->walk([this, &marked](Handle &handle) {
        if (!handle.is_closing()) {
            runtime_->close_handle(handle);
            ++marked;
        }
    });
    spdlog::debug("EventLoop: marked {} handle(s) for closing", marked);
    return marked;
}

std::error_code EventLoop::close() { return runtime_->close_loop(); }

} // namespace ttyecho::loop
