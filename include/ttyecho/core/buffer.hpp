#pragma once

#include "ttyecho/core/common.hpp"
#include "ttyecho/core/error.hpp"

#include <cstddef>
#include <memory>
#include <system_error>

namespace ttyecho::core {

/**
 * @brief 单块堆内存字节缓冲区（仅可移动）。
 *
 * 所有权模型：
 * - 任一时刻只有一个持有者（会话或 runtime），转移只通过 std::move 发生；
 * - 被移走的对象变为空（valid() == false），因此同一块内存不可能被释放两次；
 * - size() 表示已提交（可读/待写出）的字节数，capacity() 为分配的总容量。
 *
 * 注意：
 * - 本类不做线程安全保证。
 */
class BufferCell final {
public:
    BufferCell() = default;

    // capacity == 0 时返回空 cell（不分配内存）。
    [[nodiscard]] static BufferCell allocate(std::size_t capacity);
    [[nodiscard]] static BufferCell copy_of(bytes_view data);

    BufferCell(BufferCell &&other) noexcept;
    BufferCell &operator=(BufferCell &&other) noexcept;

    BufferCell(const BufferCell &) = delete;
    BufferCell &operator=(const BufferCell &) = delete;

    ~BufferCell() = default;

    [[nodiscard]] bool valid() const noexcept { return data_ != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] bytes_view readable_bytes() const noexcept;
    // 整个容量区间（读操作直接写入这里，然后 commit）。
    [[nodiscard]] mutable_bytes_view writable_bytes() noexcept;

    // 设置已提交字节数；n > capacity() 返回 invalid_argument 且不修改状态。
    std::error_code commit(std::size_t n) noexcept;
    // 在已提交区之后追加一个字节；容量不足返回 invalid_argument。
    std::error_code push_back(byte b) noexcept;

    void reset() noexcept;

private:
    BufferCell(std::unique_ptr<byte[]> data, std::size_t capacity) noexcept;

    std::unique_ptr<byte[]> data_{};
    std::size_t size_{0};
    std::size_t capacity_{0};
};

/**
 * @brief 缓冲区借出/归还的记账（动态检测泄漏与重复释放）。
 *
 * 约定：
 * - lend()：缓冲区所有权交给 runtime（分配回调返回、写请求被接受）；
 * - reclaim()：runtime 在完成回调里把所有权交还；
 * - 没有未归还的借出时调用 reclaim() 视为重复释放，返回 double_release 并计数。
 */
class BufferLedger final {
public:
    void lend() noexcept { ++lent_; }
    std::error_code reclaim() noexcept;

    [[nodiscard]] std::size_t lent() const noexcept { return lent_; }
    [[nodiscard]] std::size_t reclaimed() const noexcept { return reclaimed_; }
    [[nodiscard]] std::size_t outstanding() const noexcept { return lent_ - reclaimed_; }
    [[nodiscard]] std::size_t double_releases() const noexcept { return double_releases_; }

private:
    std::size_t lent_{0};
    std::size_t reclaimed_{0};
    std::size_t double_releases_{0};
};

} // namespace ttyecho::core
