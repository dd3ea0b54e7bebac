#include "ttyecho/loop/memory_runtime.hpp"

#include "ttyecho/core/error.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <utility>

namespace ttyecho::loop {
namespace {

struct ScriptedImpl final : HandleImpl {
    explicit ScriptedImpl(std::uint64_t handle_id) : id(handle_id) {}

    std::uint64_t id{0};
    bool reading{false};
    AllocCallback alloc_cb{};
    ReadCallback read_cb{};
};

[[nodiscard]] ScriptedImpl *scripted(HandleImpl *impl) noexcept {
    return static_cast<ScriptedImpl *>(impl);
}

} // namespace

MemoryRuntime::~MemoryRuntime() {
    for (const auto &r : handles_) {
        detach(*r.handle);
    }
    handles_.clear();
}

void MemoryRuntime::feed_input(core::bytes_view data) {
    input_.push_back(InputEvent{std::vector<core::byte>(data.begin(), data.end()), {}});
}

void MemoryRuntime::feed_input(std::string_view text) {
    feed_input(core::bytes_view{reinterpret_cast<const core::byte *>(text.data()), text.size()});
}

void MemoryRuntime::feed_status(int status) {
    if (status < 0) {
        feed_error(std::error_code(-status, std::generic_category()));
        return;
    }
    input_.push_back(InputEvent{});
}

void MemoryRuntime::feed_error(std::error_code ec) { input_.push_back(InputEvent{{}, ec}); }

void MemoryRuntime::fail_next(Op op, std::error_code ec) { failures_[op] = ec; }

std::error_code MemoryRuntime::take_failure(Op op) noexcept {
    auto it = failures_.find(op);
    if (it == failures_.end()) {
        return {};
    }
    const auto ec = it->second;
    failures_.erase(it);
    return ec;
}

std::vector<core::byte> MemoryRuntime::output() const {
    std::vector<core::byte> out;
    for (const auto &w : written_) {
        out.insert(out.end(), w.begin(), w.end());
    }
    return out;
}

std::error_code MemoryRuntime::bind_terminal_input(Handle &handle, int fd) {
    return bind(handle, HandleKind::tty_input, fd, Op::bind_input);
}

std::error_code MemoryRuntime::bind_terminal_output(Handle &handle, int fd) {
    return bind(handle, HandleKind::tty_output, fd, Op::bind_output);
}

std::error_code MemoryRuntime::bind(Handle &handle, HandleKind kind, int fd, Op op) {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    if (auto ec = take_failure(op); ec) {
        return ec;
    }
    if (handle.state() != HandleState::unbound || fd < 0) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    const auto id = next_id_++;
    attach(handle, kind, fd, std::make_unique<ScriptedImpl>(id));
    handles_.push_back(Registered{&handle, id});
    return {};
}

std::error_code MemoryRuntime::set_raw_mode(Handle &handle) {
    if (auto ec = take_failure(Op::set_raw_mode); ec) {
        return ec;
    }
    if (!handle.is_active()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    mode_saved_ = true;
    mode_ = TtyMode::raw;
    return {};
}

std::error_code MemoryRuntime::restore_mode() {
    if (auto ec = take_failure(Op::restore_mode); ec) {
        return ec;
    }
    if (!mode_saved_) {
        return {};
    }
    mode_ = TtyMode::normal;
    ++restore_count_;
    return {};
}

std::error_code MemoryRuntime::start_reading(Handle &handle,
                                             AllocCallback alloc_cb,
                                             ReadCallback read_cb) {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    if (auto ec = take_failure(Op::start_reading); ec) {
        return ec;
    }
    auto *impl = scripted(impl_of(handle));
    if (impl == nullptr || !handle.is_active() || handle.kind() != HandleKind::tty_input ||
        !alloc_cb || !read_cb) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (impl->reading) {
        return std::make_error_code(std::errc::connection_already_in_progress);
    }
    impl->alloc_cb = std::move(alloc_cb);
    impl->read_cb = std::move(read_cb);
    impl->reading = true;
    return {};
}

std::error_code MemoryRuntime::stop_reading(Handle &handle) {
    if (auto ec = take_failure(Op::stop_reading); ec) {
        return ec;
    }
    auto *impl = scripted(impl_of(handle));
    if (impl == nullptr) {
        return handle.is_closing() ? std::error_code{}
                                   : std::make_error_code(std::errc::invalid_argument);
    }
    impl->reading = false;
    return {};
}

std::error_code MemoryRuntime::submit_write(WriteRequest &req,
                                            Handle &handle,
                                            core::BufferCell &&buffer,
                                            WriteCallback cb) {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    if (req.pending()) {
        return core::make_error_code(core::errc::busy);
    }
    if (auto ec = take_failure(Op::submit_write); ec) {
        return ec;
    }
    auto *impl = scripted(impl_of(handle));
    if (impl == nullptr || !handle.is_active()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    if (!buffer.valid() || !cb) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    mark_pending(req, handle);
    writes_.push_back(PendingWrite{&req, impl->id, std::move(buffer), std::move(cb), write_status_});
    return {};
}

std::error_code MemoryRuntime::run() {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    if (auto ec = take_failure(Op::run); ec) {
        return ec;
    }
    ++run_count_;

    for (;;) {
        if (!writes_.empty()) {
            auto w = std::move(writes_.front());
            writes_.pop_front();
            mark_done(*w.req);
            if (!w.status) {
                const auto bytes = w.cell.readable_bytes();
                written_.emplace_back(bytes.begin(), bytes.end());
            }
            w.cb(*w.req, w.status, std::move(w.cell));
            continue;
        }
        if (deliver_input()) {
            continue;
        }
        if (!closes_.empty()) {
            auto c = std::move(closes_.front());
            closes_.pop_front();
            Handle *h = find(c.handle_id);
            if (h == nullptr) {
                continue;
            }
            unregister(h);
            mark_closed(*h);
            if (c.cb) {
                c.cb(*h);
            }
            continue;
        }
        break;
    }
    return {};
}

bool MemoryRuntime::deliver_input() {
    if (input_.empty()) {
        return false;
    }

    Handle *handle = nullptr;
    for (const auto &r : handles_) {
        auto *impl = scripted(impl_of(*r.handle));
        if (r.handle->kind() == HandleKind::tty_input && r.handle->is_active() && impl != nullptr &&
            impl->reading) {
            handle = r.handle;
            break;
        }
    }
    if (handle == nullptr) {
        return false;
    }
    auto *impl = scripted(impl_of(*handle));
    auto read_cb = impl->read_cb;

    auto ev = std::move(input_.front());
    input_.pop_front();

    if (ev.ec) {
        impl->reading = false;
        read_cb(*handle, ev.ec, 0, core::BufferCell{});
        return true;
    }

    auto buffer = impl->alloc_cb(*handle, core::kDefaultReadBufferSize);
    if (!buffer.valid()) {
        impl->reading = false;
        read_cb(*handle, std::make_error_code(std::errc::no_buffer_space), 0, std::move(buffer));
        return true;
    }

    // 超出缓冲区容量的部分留到下一次投递。
    const std::size_t n = std::min(ev.bytes.size(), buffer.capacity());
    if (n > 0) {
        std::memcpy(buffer.writable_bytes().data(), ev.bytes.data(), n);
    }
    (void)buffer.commit(n);
    if (n < ev.bytes.size()) {
        input_.push_front(InputEvent{std::vector<core::byte>(ev.bytes.begin() + static_cast<std::ptrdiff_t>(n),
                                                             ev.bytes.end()),
                                     {}});
    }
    read_cb(*handle, std::error_code{}, n, std::move(buffer));
    return true;
}

void MemoryRuntime::walk(const WalkCallback &visit) {
    std::vector<std::uint64_t> ids;
    ids.reserve(handles_.size());
    for (const auto &r : handles_) {
        ids.push_back(r.id);
    }
    for (const auto id : ids) {
        if (Handle *h = find(id); h != nullptr) {
            visit(*h);
        }
    }
}

void MemoryRuntime::close_handle(Handle &handle, CloseCallback cb) {
    auto *impl = scripted(impl_of(handle));
    if (impl == nullptr || !handle.is_active()) {
        return;
    }
    mark_closing(handle);
    impl->reading = false;

    // 与真实 descriptor 一致：关闭时在途写操作以“已取消”完成。
    for (auto &w : writes_) {
        if (w.handle_id == impl->id) {
            w.status = std::make_error_code(std::errc::operation_canceled);
        }
    }
    closes_.push_back(PendingClose{impl->id, std::move(cb)});
}

std::error_code MemoryRuntime::close_loop() {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    if (auto ec = take_failure(Op::close_loop); ec) {
        return ec;
    }
    if (!handles_.empty()) {
        return core::make_error_code(core::errc::loop_busy);
    }
    closed_ = true;
    return {};
}

void MemoryRuntime::forget(Handle &handle) noexcept {
    const auto id = id_of(handle);
    unregister(&handle);
    // 句柄已不存在：丢弃引用它的关闭通知。
    closes_.erase(std::remove_if(closes_.begin(),
                                 closes_.end(),
                                 [id](const PendingClose &c) { return c.handle_id == id; }),
                  closes_.end());
}

Handle *MemoryRuntime::find(std::uint64_t id) const noexcept {
    for (const auto &r : handles_) {
        if (r.id == id) {
            return r.handle;
        }
    }
    return nullptr;
}

std::uint64_t MemoryRuntime::id_of(const Handle &handle) const noexcept {
    for (const auto &r : handles_) {
        if (r.handle == &handle) {
            return r.id;
        }
    }
    return 0;
}

void MemoryRuntime::unregister(const Handle *handle) noexcept {
    handles_.erase(std::remove_if(handles_.begin(),
                                  handles_.end(),
                                  [handle](const Registered &r) { return r.handle == handle; }),
                   handles_.end());
}

} // namespace ttyecho::loop
