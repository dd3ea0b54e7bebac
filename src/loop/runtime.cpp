#include "ttyecho/loop/runtime.hpp"

#include <utility>

namespace ttyecho::loop {

Handle::~Handle() {
    // 未经 close_handle 流程就析构：交给 owner 注销，然后直接释放底层资源。
    if (owner_ != nullptr && state_ != HandleState::closed) {
        owner_->forget(*this);
    }
    impl_.reset();
}

void Runtime::attach(Handle &handle,
                     HandleKind kind,
                     int fd,
                     std::unique_ptr<HandleImpl> impl) noexcept {
    handle.kind_ = kind;
    handle.fd_ = fd;
    handle.owner_ = this;
    handle.impl_ = std::move(impl);
    handle.state_ = HandleState::active;
}

void Runtime::mark_closing(Handle &handle) noexcept {
    if (handle.state_ == HandleState::active) {
        handle.state_ = HandleState::closing;
    }
}

void Runtime::mark_closed(Handle &handle) noexcept {
    handle.impl_.reset();
    handle.state_ = HandleState::closed;
}

void Runtime::detach(Handle &handle) noexcept {
    handle.impl_.reset();
    handle.owner_ = nullptr;
    handle.state_ = HandleState::closed;
}

void Runtime::mark_pending(WriteRequest &req, Handle &handle) noexcept {
    req.pending_ = true;
    req.handle_ = &handle;
}

void Runtime::mark_done(WriteRequest &req) noexcept {
    req.pending_ = false;
    req.handle_ = nullptr;
}

} // namespace ttyecho::loop
