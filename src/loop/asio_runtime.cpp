#include "ttyecho/loop/asio_runtime.hpp"

#include "ttyecho/core/error.hpp"

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/write.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

namespace ttyecho::loop {
namespace {

struct DescriptorImpl final : HandleImpl {
    DescriptorImpl(asio::io_context &io, std::uint64_t handle_id)
        : sd(io), id(handle_id) {}

    ~DescriptorImpl() override { restore_status_flags(); }

    // asio 在读写时会设置 O_NONBLOCK；dup 得到的 fd 与原 fd 共享打开文件描述，
    // 关闭前必须还原绑定时的状态标志，否则父进程的 stdin/stdout 会留在非阻塞模式。
    void restore_status_flags() {
        if (saved_flags < 0 || !sd.is_open()) {
            return;
        }
        if (auto ec = posix::set_status_flags(sd.native_handle(), saved_flags); ec) {
            spdlog::warn("AsioRuntime: restore status flags of id={} failed: {}", id, ec.message());
        }
        saved_flags = -1;
    }

    asio::posix::stream_descriptor sd;
    std::uint64_t id{0};
    int saved_flags{-1};

    bool reading{false};
    bool wait_pending{false};
    AllocCallback alloc_cb{};
    ReadCallback read_cb{};
};

[[nodiscard]] const char *kind_name(HandleKind kind) noexcept {
    return kind == HandleKind::tty_input ? "tty_input" : "tty_output";
}

} // namespace

/*
 * 读路径（与就绪通知型事件循环一致）：
 * - async_wait(wait_read) 只等待“可读”，不占用缓冲区；
 * - 就绪后才调用 alloc_cb 取得缓冲区，并用非阻塞 read_some 读取；
 * - stop_reading 只需 cancel 等待，不会有缓冲区滞留在 runtime 内部。
 */
AsioRuntime::AsioRuntime() = default;

AsioRuntime::~AsioRuntime() {
    if (raw_active_) {
        if (auto ec = restore_mode(); ec) {
            spdlog::warn("AsioRuntime: restore terminal mode on destruction failed: {}", ec.message());
        }
    }
    // 句柄由使用方持有：这里先释放 descriptor（必须早于 io_ 析构），并断开 owner。
    for (const auto &r : handles_) {
        detach(*r.handle);
    }
    handles_.clear();
}

std::error_code AsioRuntime::bind_terminal_input(Handle &handle, int fd) {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    auto [ec, owned] = posix::open_terminal(fd);
    if (ec) {
        return ec;
    }
    return bind(handle, HandleKind::tty_input, fd, std::move(owned));
}

std::error_code AsioRuntime::bind_terminal_output(Handle &handle, int fd) {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    auto [ec, owned] = posix::open_terminal(fd);
    if (ec) {
        return ec;
    }
    return bind(handle, HandleKind::tty_output, fd, std::move(owned));
}

std::error_code AsioRuntime::bind(Handle &handle,
                                  HandleKind kind,
                                  int fd,
                                  posix::UniqueFd owned) {
    if (handle.state() != HandleState::unbound) {
        return core::make_error_code(core::errc::invalid_argument);
    }

    auto [flags_ec, flags] = posix::status_flags(owned.fd);
    if (flags_ec) {
        return flags_ec;
    }

    const auto id = next_id_++;
    auto impl = std::make_unique<DescriptorImpl>(io_, id);
    impl->saved_flags = flags;

    std::error_code ec;
    impl->sd.assign(owned.fd, ec);
    if (ec) {
        return ec;
    }
    // 已交给 descriptor 管理。
    (void)owned.release();

    attach(handle, kind, fd, std::move(impl));
    handles_.push_back(Registered{&handle, id});
    spdlog::debug("AsioRuntime: bound {} fd={} id={}", kind_name(kind), fd, id);
    return {};
}

std::error_code AsioRuntime::set_raw_mode(Handle &handle) {
    auto *impl = static_cast<DescriptorImpl *>(impl_of(handle));
    if (impl == nullptr || !handle.is_active()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    const int fd = impl->sd.native_handle();

    if (!saved_fd_.valid()) {
        termios original{};
        if (::tcgetattr(fd, &original) != 0) {
            return posix::make_errno_ec();
        }
        auto [ec, copy] = posix::duplicate_fd(fd);
        if (ec) {
            return ec;
        }
        saved_mode_ = original;
        saved_fd_ = std::move(copy);
    }

    const termios raw = posix::make_raw_termios(saved_mode_);
    if (::tcsetattr(fd, TCSADRAIN, &raw) != 0) {
        return posix::make_errno_ec();
    }
    raw_active_ = true;
    spdlog::debug("AsioRuntime: raw mode on fd={}", handle.fd());
    return {};
}

std::error_code AsioRuntime::restore_mode() {
    if (!saved_fd_.valid()) {
        return {};
    }
    if (::tcsetattr(saved_fd_.fd, TCSANOW, &saved_mode_) != 0) {
        return posix::make_errno_ec();
    }
    raw_active_ = false;
    spdlog::debug("AsioRuntime: terminal mode restored");
    return {};
}

std::error_code AsioRuntime::start_reading(Handle &handle,
                                           AllocCallback alloc_cb,
                                           ReadCallback read_cb) {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    auto *impl = static_cast<DescriptorImpl *>(impl_of(handle));
    if (impl == nullptr || !handle.is_active() || handle.kind() != HandleKind::tty_input ||
        !alloc_cb || !read_cb) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (impl->reading) {
        return std::make_error_code(std::errc::connection_already_in_progress);
    }

    // 用户级非阻塞：就绪后 read_some 不会阻塞；无数据时返回 would_block。
    std::error_code ec;
    impl->sd.non_blocking(true, ec);
    if (ec) {
        return ec;
    }

    impl->alloc_cb = std::move(alloc_cb);
    impl->read_cb = std::move(read_cb);
    impl->reading = true;
    arm_read(handle);
    return {};
}

std::error_code AsioRuntime::stop_reading(Handle &handle) {
    auto *impl = static_cast<DescriptorImpl *>(impl_of(handle));
    if (impl == nullptr) {
        // 已关闭的句柄不会再有读回调。
        return handle.is_closing() ? std::error_code{}
                                   : std::make_error_code(std::errc::invalid_argument);
    }
    if (!impl->reading) {
        return {};
    }
    impl->reading = false;

    std::error_code ec;
    if (impl->wait_pending) {
        impl->sd.cancel(ec);
    }
    return ec;
}

void AsioRuntime::arm_read(Handle &handle) {
    auto *impl = static_cast<DescriptorImpl *>(impl_of(handle));
    if (impl == nullptr || impl->wait_pending) {
        return;
    }
    impl->wait_pending = true;
    const auto id = impl->id;
    impl->sd.async_wait(asio::posix::stream_descriptor::wait_read,
                        [this, id](std::error_code ec) { on_readable(id, ec); });
}

void AsioRuntime::on_readable(std::uint64_t id, std::error_code ec) {
    Handle *handle = find(id);
    if (handle == nullptr) {
        return;
    }
    auto *impl = static_cast<DescriptorImpl *>(impl_of(*handle));
    if (impl == nullptr) {
        return;
    }
    impl->wait_pending = false;

    if (!impl->reading || ec == asio::error::operation_aborted) {
        return;
    }

    // 回调可能调用 stop_reading/close_handle；先复制一份回调对象。
    auto read_cb = impl->read_cb;

    if (ec) {
        impl->reading = false;
        read_cb(*handle, ec, 0, core::BufferCell{});
        return;
    }

    auto buffer = impl->alloc_cb(*handle, core::kDefaultReadBufferSize);
    if (!buffer.valid()) {
        // 分配失败时停止读取，避免就绪通知反复触发。
        impl->reading = false;
        read_cb(*handle, std::make_error_code(std::errc::no_buffer_space), 0, std::move(buffer));
        return;
    }

    auto dst = buffer.writable_bytes();
    std::error_code read_ec;
    const std::size_t n = impl->sd.read_some(asio::buffer(dst.data(), dst.size()), read_ec);

    std::size_t nread = 0;
    if (read_ec == asio::error::would_block || read_ec == asio::error::try_again) {
        read_ec.clear();
    } else if (read_ec) {
        // EOF 与读错误都结束读取。
        impl->reading = false;
    } else {
        (void)buffer.commit(n);
        nread = n;
    }

    spdlog::trace("AsioRuntime: read id={} n={} ec={}", id, nread, read_ec.message());
    read_cb(*handle, read_ec, nread, std::move(buffer));

    if (find(id) == handle && impl->reading && handle->is_active()) {
        arm_read(*handle);
    }
}

std::error_code AsioRuntime::submit_write(WriteRequest &req,
                                          Handle &handle,
                                          core::BufferCell &&buffer,
                                          WriteCallback cb) {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    if (req.pending()) {
        return core::make_error_code(core::errc::busy);
    }
    auto *impl = static_cast<DescriptorImpl *>(impl_of(handle));
    if (impl == nullptr || !handle.is_active()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    if (!buffer.valid() || !cb) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    mark_pending(req, handle);

    // 先取出缓冲区视图，再把 cell 移入完成回调（堆内存地址不随移动改变）。
    const auto bytes = buffer.readable_bytes();
    const auto view = asio::buffer(bytes.data(), bytes.size());
    asio::async_write(impl->sd,
                      view,
                      [&req, cell = std::move(buffer), cb = std::move(cb)](
                          std::error_code ec, std::size_t n) mutable {
                          mark_done(req);
                          spdlog::trace("AsioRuntime: write done n={} ec={}", n, ec.message());
                          cb(req, ec, std::move(cell));
                      });
    return {};
}

std::error_code AsioRuntime::run() {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    if (io_.stopped()) {
        io_.restart();
    }
    try {
        io_.run();
    } catch (const std::system_error &e) {
        return e.code();
    }
    return {};
}

void AsioRuntime::walk(const WalkCallback &visit) {
    // 回调里可能 close_handle（不会修改 handles_，但保持快照更稳妥）。
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

void AsioRuntime::close_handle(Handle &handle, CloseCallback cb) {
    auto *impl = static_cast<DescriptorImpl *>(impl_of(handle));
    if (impl == nullptr || !handle.is_active()) {
        return;
    }
    mark_closing(handle);
    impl->reading = false;

    // 立即关闭：在途的 wait/write 以 operation_aborted 完成，它们的回调仍会在 run() 中执行。
    impl->restore_status_flags();
    std::error_code ec;
    impl->sd.close(ec);
    if (ec) {
        spdlog::warn("AsioRuntime: close fd={} failed: {}", handle.fd(), ec.message());
    }

    const auto id = impl->id;
    asio::post(io_, [this, id, cb = std::move(cb)]() {
        Handle *h = find(id);
        if (h == nullptr) {
            return;
        }
        unregister(h);
        mark_closed(*h);
        spdlog::debug("AsioRuntime: handle id={} closed", id);
        if (cb) {
            cb(*h);
        }
    });
}

std::error_code AsioRuntime::close_loop() {
    if (closed_) {
        return core::make_error_code(core::errc::loop_closed);
    }
    if (!handles_.empty()) {
        return core::make_error_code(core::errc::loop_busy);
    }
    closed_ = true;
    return {};
}

void AsioRuntime::forget(Handle &handle) noexcept { unregister(&handle); }

Handle *AsioRuntime::find(std::uint64_t id) const noexcept {
    for (const auto &r : handles_) {
        if (r.id == id) {
            return r.handle;
        }
    }
    return nullptr;
}

void AsioRuntime::unregister(const Handle *handle) noexcept {
    handles_.erase(std::remove_if(handles_.begin(),
                                  handles_.end(),
                                  [handle](const Registered &r) { return r.handle == handle; }),
                   handles_.end());
}

} // namespace ttyecho::loop
