#include "ttyecho/core/buffer.hpp"

#include <cstddef>
#include <cstring>
#include <new>
#include <utility>

namespace ttyecho::core {

BufferCell::BufferCell(std::unique_ptr<byte[]> data, std::size_t capacity) noexcept
    : data_(std::move(data)), capacity_(data_ ? capacity : 0) {}

BufferCell BufferCell::allocate(std::size_t capacity) {
    if (capacity == 0) {
        return BufferCell{};
    }
    // nothrow：分配失败时返回空 cell，由调用方按“无缓冲区”处理（读路径报告 ENOBUFS）。
    std::unique_ptr<byte[]> data(new (std::nothrow) byte[capacity]);
    return BufferCell(std::move(data), capacity);
}

BufferCell BufferCell::copy_of(bytes_view data) {
    auto cell = allocate(data.size());
    if (!cell.valid()) {
        return cell;
    }
    std::memcpy(cell.data_.get(), data.data(), data.size());
    cell.size_ = data.size();
    return cell;
}

BufferCell::BufferCell(BufferCell &&other) noexcept
    : data_(std::move(other.data_)), size_(other.size_),
      capacity_(other.capacity_) {
    other.size_ = 0;
    other.capacity_ = 0;
}

BufferCell &BufferCell::operator=(BufferCell &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    data_ = std::move(other.data_);
    size_ = other.size_;
    capacity_ = other.capacity_;
    other.size_ = 0;
    other.capacity_ = 0;
    return *this;
}

bytes_view BufferCell::readable_bytes() const noexcept {
    return bytes_view{data_.get(), size_};
}

mutable_bytes_view BufferCell::writable_bytes() noexcept {
    return mutable_bytes_view{data_.get(), capacity_};
}

std::error_code BufferCell::commit(std::size_t n) noexcept {
    if (n > capacity_) {
        return make_error_code(errc::invalid_argument);
    }
    size_ = n;
    return {};
}

std::error_code BufferCell::push_back(byte b) noexcept {
    if (size_ >= capacity_) {
        return make_error_code(errc::invalid_argument);
    }
    data_[size_++] = b;
    return {};
}

void BufferCell::reset() noexcept {
    data_.reset();
    size_ = 0;
    capacity_ = 0;
}

std::error_code BufferLedger::reclaim() noexcept {
    if (reclaimed_ >= lent_) {
        ++double_releases_;
        return make_error_code(errc::double_release);
    }
    ++reclaimed_;
    return {};
}

} // namespace ttyecho::core
