#pragma once

#include "ttyecho/core/error.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace ttyecho::core {

/**
 * @brief 只保留“第一个”错误的槽位。
 *
 * 异步回调里发现的错误没有调用者可以返回，统一记录到这里；
 * 关闭流程结束时读取一次（读取不会清空）。
 */
class ErrorSlot final {
public:
    // 已有错误或 err 为空时不修改，返回 false。
    bool record(Error err) {
        if (first_.has_value() || !err) {
            return false;
        }
        first_ = std::move(err);
        return true;
    }

    bool record(errc kind, std::string func, std::error_code cause) {
        if (!cause) {
            return false;
        }
        return record(Error(kind, std::move(func), cause));
    }

    [[nodiscard]] bool has_error() const noexcept { return first_.has_value(); }
    [[nodiscard]] const std::optional<Error> &first() const noexcept { return first_; }

private:
    std::optional<Error> first_{};
};

} // namespace ttyecho::core
