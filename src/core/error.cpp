#include "ttyecho/core/error.hpp"

#include <asio/error.hpp>

#include <cerrno>
#include <cstring>
#include <string>

namespace ttyecho::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（便于调试与日志；最终会打印给用户）
class ttyecho_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ttyecho.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::init_failed:
        return "terminal handle initialization failed";
      case errc::mode_failed:
        return "terminal mode switch failed";
      case errc::start_failed:
        return "read registration failed";
      case errc::busy:
        return "a write is already pending";
      case errc::write_rejected:
        return "write submission rejected";
      case errc::runtime:
        return "runtime error";
      case errc::loop_busy:
        return "loop still has open handles";
      case errc::loop_closed:
        return "loop is closed";
      case errc::double_release:
        return "buffer released twice";
      case errc::invalid_argument:
        return "invalid argument";
      default:
        return "unknown ttyecho.core error";
    }
  }
};

const char* core_errc_name(int ev) noexcept {
  switch (static_cast<errc>(ev)) {
    case errc::ok:
      return "ok";
    case errc::init_failed:
      return "init_failed";
    case errc::mode_failed:
      return "mode_failed";
    case errc::start_failed:
      return "start_failed";
    case errc::busy:
      return "busy";
    case errc::write_rejected:
      return "write_rejected";
    case errc::runtime:
      return "runtime";
    case errc::loop_busy:
      return "loop_busy";
    case errc::loop_closed:
      return "loop_closed";
    case errc::double_release:
      return "double_release";
    case errc::invalid_argument:
      return "invalid_argument";
  }
  return nullptr;
}

// 只覆盖终端/事件循环场景里会出现的 errno；其余走兜底格式。
const char* errno_name(int ev) noexcept {
  switch (ev) {
    case EPERM:
      return "EPERM";
    case ENOENT:
      return "ENOENT";
    case EINTR:
      return "EINTR";
    case EIO:
      return "EIO";
    case ENXIO:
      return "ENXIO";
    case EBADF:
      return "EBADF";
    case EAGAIN:
      return "EAGAIN";
    case ENOMEM:
      return "ENOMEM";
    case EACCES:
      return "EACCES";
    case EBUSY:
      return "EBUSY";
    case EEXIST:
      return "EEXIST";
    case ENODEV:
      return "ENODEV";
    case EINVAL:
      return "EINVAL";
    case EMFILE:
      return "EMFILE";
    case ENOTTY:
      return "ENOTTY";
    case ENOSPC:
      return "ENOSPC";
    case EPIPE:
      return "EPIPE";
    case ENOBUFS:
      return "ENOBUFS";
    case EALREADY:
      return "EALREADY";
    case ECANCELED:
      return "ECANCELED";
    case ECONNRESET:
      return "ECONNRESET";
    default:
      return nullptr;
  }
}

}  // namespace

const std::error_category& error_category() noexcept {
  static ttyecho_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::string error_name(const std::error_code& ec) {
  const auto& cat = ec.category();
  if (cat == std::generic_category() || cat == std::system_category()) {
    if (const char* n = errno_name(ec.value()); n != nullptr) {
      return n;
    }
  } else if (ec == asio::error::eof) {
    return "EOF";
  } else if (cat == error_category()) {
    if (const char* n = core_errc_name(ec.value()); n != nullptr) {
      return n;
    }
  }
  return std::string(cat.name()) + ":" + std::to_string(ec.value());
}

std::string Error::describe() const {
  std::string out = "Error calling ";
  out += func_;
  out += ": ";
  out += cause_.message();
  out += " (";
  out += error_name(cause_);
  out += ")";
  return out;
}

}  // namespace ttyecho::core
