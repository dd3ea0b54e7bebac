#include "ttyecho/core/buffer.hpp"
#include "ttyecho/core/error.hpp"
#include "ttyecho/loop/event_loop.hpp"
#include "ttyecho/loop/memory_runtime.hpp"

#include "test_main.hpp"

#include <cerrno>
#include <cstddef>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace {

using ttyecho::core::BufferCell;
using ttyecho::core::errc;
using ttyecho::core::make_error_code;
using ttyecho::loop::EventLoop;
using ttyecho::loop::Handle;
using ttyecho::loop::HandleKind;
using ttyecho::loop::HandleState;
using ttyecho::loop::MemoryRuntime;
using ttyecho::loop::WriteRequest;
using ttyecho::tests::as_bytes;

struct ReadLog final {
  std::vector<std::string> chunks;
  std::vector<std::error_code> errors;
  std::size_t zero_reads{0};
  std::size_t allocs{0};
};

void start_logging_reads(MemoryRuntime &rt, Handle &in, ReadLog &log) {
  auto ec = rt.start_reading(
    in,
    [&log](Handle &, std::size_t suggested) {
      ++log.allocs;
      return BufferCell::allocate(suggested);
    },
    [&log](Handle &, std::error_code ec, std::size_t nread, BufferCell buf) {
      if (ec) {
        log.errors.push_back(ec);
        return;
      }
      if (nread == 0) {
        ++log.zero_reads;
        return;
      }
      const auto bytes = buf.readable_bytes();
      log.chunks.emplace_back(reinterpret_cast<const char *>(bytes.data()), nread);
    });
  TEST_EXPECT_OK(ec);
}

void test_bind_and_handle_state() {
  MemoryRuntime rt;
  Handle in;
  Handle out;
  TEST_EXPECT_EQ(in.state(), HandleState::unbound);

  TEST_EXPECT_OK(rt.bind_terminal_input(in, 0));
  TEST_EXPECT_OK(rt.bind_terminal_output(out, 1));
  TEST_EXPECT(in.is_active());
  TEST_EXPECT_EQ(in.kind(), HandleKind::tty_input);
  TEST_EXPECT_EQ(out.kind(), HandleKind::tty_output);
  TEST_EXPECT_EQ(out.fd(), 1);
  TEST_EXPECT_EQ(rt.handle_count(), 2u);

  // 同一个句柄不能重复绑定
  TEST_EXPECT_EQ(rt.bind_terminal_input(in, 0), std::make_error_code(std::errc::invalid_argument));
}

void test_bind_failure_injection() {
  MemoryRuntime rt;
  Handle in;
  rt.fail_next(MemoryRuntime::Op::bind_input, std::make_error_code(std::errc::inappropriate_io_control_operation));
  TEST_EXPECT_EQ(rt.bind_terminal_input(in, 0), std::make_error_code(std::errc::inappropriate_io_control_operation));
  TEST_EXPECT_EQ(in.state(), HandleState::unbound);
  // 注入只生效一次
  TEST_EXPECT_OK(rt.bind_terminal_input(in, 0));
}

void test_raw_mode_and_restore() {
  MemoryRuntime rt;
  Handle in;
  // 未设置过原始模式时恢复是空操作
  TEST_EXPECT_OK(rt.restore_mode());
  TEST_EXPECT_EQ(rt.restore_count(), 0u);

  TEST_EXPECT_OK(rt.bind_terminal_input(in, 0));
  TEST_EXPECT_OK(rt.set_raw_mode(in));
  TEST_EXPECT(rt.tty_mode() == MemoryRuntime::TtyMode::raw);
  TEST_EXPECT_OK(rt.restore_mode());
  TEST_EXPECT(rt.tty_mode() == MemoryRuntime::TtyMode::normal);
  TEST_EXPECT_EQ(rt.restore_count(), 1u);
}

void test_input_delivery_order() {
  MemoryRuntime rt;
  Handle in;
  TEST_EXPECT_OK(rt.bind_terminal_input(in, 0));

  ReadLog log;
  start_logging_reads(rt, in, log);
  // 重复开始读取被拒绝
  TEST_EXPECT_EQ(rt.start_reading(
                   in,
                   [](Handle &, std::size_t) { return BufferCell{}; },
                   [](Handle &, std::error_code, std::size_t, BufferCell) {}),
                 std::make_error_code(std::errc::connection_already_in_progress));

  rt.feed_input("ab");
  rt.feed_status(0);
  rt.feed_input("c");
  rt.feed_status(-EIO);

  TEST_EXPECT_OK(rt.run());
  TEST_EXPECT_EQ(rt.run_count(), 1u);
  TEST_EXPECT_EQ(log.chunks.size(), 2u);
  TEST_EXPECT_EQ(log.chunks[0], std::string("ab"));
  TEST_EXPECT_EQ(log.chunks[1], std::string("c"));
  TEST_EXPECT_EQ(log.zero_reads, 1u);
  TEST_EXPECT_EQ(log.errors.size(), 1u);
  TEST_EXPECT_EQ(log.errors[0], std::error_code(EIO, std::generic_category()));
  // 错误事件不分配缓冲区
  TEST_EXPECT_EQ(log.allocs, 3u);
  TEST_EXPECT_EQ(rt.pending_input(), 0u);
}

void test_stop_reading_leaves_input_queued() {
  MemoryRuntime rt;
  Handle in;
  TEST_EXPECT_OK(rt.bind_terminal_input(in, 0));

  ReadLog log;
  start_logging_reads(rt, in, log);
  TEST_EXPECT_OK(rt.stop_reading(in));
  // 幂等
  TEST_EXPECT_OK(rt.stop_reading(in));

  rt.feed_input("x");
  TEST_EXPECT_OK(rt.run());
  TEST_EXPECT(log.chunks.empty());
  TEST_EXPECT_EQ(rt.pending_input(), 1u);
}

void test_alloc_failure_reports_enobufs() {
  MemoryRuntime rt;
  Handle in;
  TEST_EXPECT_OK(rt.bind_terminal_input(in, 0));

  std::vector<std::error_code> errors;
  TEST_EXPECT_OK(rt.start_reading(
    in,
    [](Handle &, std::size_t) { return BufferCell{}; },
    [&errors](Handle &, std::error_code ec, std::size_t, BufferCell) { errors.push_back(ec); }));

  rt.feed_input("a");
  rt.feed_input("b");
  TEST_EXPECT_OK(rt.run());
  // 第一次失败后停止读取，后续输入不再投递
  TEST_EXPECT_EQ(errors.size(), 1u);
  TEST_EXPECT_EQ(errors[0], std::make_error_code(std::errc::no_buffer_space));
  TEST_EXPECT_EQ(rt.pending_input(), 1u);
}

void test_write_completion_and_busy_slot() {
  MemoryRuntime rt;
  Handle out;
  TEST_EXPECT_OK(rt.bind_terminal_output(out, 1));

  WriteRequest req;
  std::vector<std::error_code> statuses;
  auto on_done = [&statuses](WriteRequest &r, std::error_code status, BufferCell cell) {
    TEST_EXPECT(!r.pending());
    TEST_EXPECT(cell.valid());
    statuses.push_back(status);
  };

  auto first = BufferCell::copy_of(as_bytes("hello"));
  TEST_EXPECT_OK(rt.submit_write(req, out, std::move(first), on_done));
  TEST_EXPECT(!first.valid());
  TEST_EXPECT(req.pending());
  TEST_EXPECT(req.handle() == &out);

  // 槽位被占用：拒绝且不移走调用方的缓冲区
  auto second = BufferCell::copy_of(as_bytes("world"));
  TEST_EXPECT_EQ(rt.submit_write(req, out, std::move(second), on_done), make_error_code(errc::busy));
  TEST_EXPECT(second.valid());

  TEST_EXPECT_OK(rt.run());
  TEST_EXPECT_EQ(statuses.size(), 1u);
  TEST_EXPECT_OK(statuses[0]);
  TEST_EXPECT(!req.pending());

  TEST_EXPECT_OK(rt.submit_write(req, out, std::move(second), on_done));
  TEST_EXPECT_OK(rt.run());
  TEST_EXPECT_EQ(rt.writes().size(), 2u);
  TEST_EXPECT_BYTES(as_bytes(rt.output()), as_bytes("helloworld"));
}

void test_write_failure_status_and_rejection() {
  MemoryRuntime rt;
  Handle out;
  TEST_EXPECT_OK(rt.bind_terminal_output(out, 1));
  WriteRequest req;

  rt.fail_next(MemoryRuntime::Op::submit_write, std::make_error_code(std::errc::broken_pipe));
  auto cell = BufferCell::copy_of(as_bytes("x"));
  TEST_EXPECT_EQ(rt.submit_write(req, out, std::move(cell), [](WriteRequest &, std::error_code, BufferCell) {}),
                 std::make_error_code(std::errc::broken_pipe));
  TEST_EXPECT(cell.valid());
  TEST_EXPECT(!req.pending());

  rt.set_write_status(std::make_error_code(std::errc::io_error));
  std::error_code status;
  TEST_EXPECT_OK(rt.submit_write(req, out, std::move(cell), [&status](WriteRequest &, std::error_code s, BufferCell) {
    status = s;
  }));
  TEST_EXPECT_OK(rt.run());
  TEST_EXPECT_EQ(status, std::make_error_code(std::errc::io_error));
  // 失败的写不计入输出
  TEST_EXPECT(rt.output().empty());
}

void test_close_cancels_pending_write() {
  MemoryRuntime rt;
  Handle out;
  TEST_EXPECT_OK(rt.bind_terminal_output(out, 1));
  WriteRequest req;

  std::error_code status;
  TEST_EXPECT_OK(rt.submit_write(req, out, BufferCell::copy_of(as_bytes("late")),
                                 [&status](WriteRequest &, std::error_code s, BufferCell) { status = s; }));

  bool closed_cb = false;
  rt.close_handle(out, [&closed_cb](Handle &h) {
    closed_cb = true;
    TEST_EXPECT(h.is_closed());
  });
  TEST_EXPECT_EQ(out.state(), HandleState::closing);
  TEST_EXPECT(out.is_closing());
  TEST_EXPECT_EQ(rt.close_loop(), make_error_code(errc::loop_busy));

  TEST_EXPECT_OK(rt.run());
  TEST_EXPECT_EQ(status, std::make_error_code(std::errc::operation_canceled));
  TEST_EXPECT(closed_cb);
  TEST_EXPECT(out.is_closed());
  TEST_EXPECT_EQ(rt.handle_count(), 0u);

  TEST_EXPECT_OK(rt.close_loop());
  TEST_EXPECT(rt.loop_closed());
  TEST_EXPECT_EQ(rt.run(), make_error_code(errc::loop_closed));
  TEST_EXPECT_EQ(rt.close_loop(), make_error_code(errc::loop_closed));
}

void test_handle_destroyed_before_close() {
  MemoryRuntime rt;
  {
    Handle in;
    TEST_EXPECT_OK(rt.bind_terminal_input(in, 0));
    rt.close_handle(in);
    TEST_EXPECT_EQ(rt.handle_count(), 1u);
  }
  // 句柄析构后自动注销，关闭通知被丢弃
  TEST_EXPECT_EQ(rt.handle_count(), 0u);
  TEST_EXPECT_OK(rt.run());
  TEST_EXPECT_OK(rt.close_loop());
}

void test_event_loop_walk_and_close_all() {
  auto owned = std::make_unique<MemoryRuntime>();
  auto *rt = owned.get();
  EventLoop loop(std::move(owned));

  Handle in;
  Handle out;
  TEST_EXPECT_OK(rt->bind_terminal_input(in, 0));
  TEST_EXPECT_OK(rt->bind_terminal_output(out, 1));

  rt->close_handle(in);
  // 已在关闭中的句柄不重复计数
  TEST_EXPECT_EQ(loop.walk_and_close_all(), 1u);
  TEST_EXPECT(in.is_closing());
  TEST_EXPECT(out.is_closing());
  TEST_EXPECT_EQ(loop.close(), make_error_code(errc::loop_busy));
  TEST_EXPECT(!loop.closed());

  TEST_EXPECT_OK(loop.run_until_stopped());
  TEST_EXPECT(in.is_closed());
  TEST_EXPECT(out.is_closed());
  TEST_EXPECT_EQ(loop.walk_and_close_all(), 0u);

  TEST_EXPECT_OK(loop.close());
  TEST_EXPECT(loop.closed());
}

void test_event_loop_run_failure() {
  auto owned = std::make_unique<MemoryRuntime>();
  owned->fail_next(MemoryRuntime::Op::run, std::make_error_code(std::errc::interrupted));
  EventLoop loop(std::move(owned));
  TEST_EXPECT_EQ(loop.run_until_stopped(), std::make_error_code(std::errc::interrupted));
  TEST_EXPECT_OK(loop.run_until_stopped());
}

}  // namespace

int main() {
  test_bind_and_handle_state();
  test_bind_failure_injection();
  test_raw_mode_and_restore();
  test_input_delivery_order();
  test_stop_reading_leaves_input_queued();
  test_alloc_failure_reports_enobufs();
  test_write_completion_and_busy_slot();
  test_write_failure_status_and_rejection();
  test_close_cancels_pending_write();
  test_handle_destroyed_before_close();
  test_event_loop_walk_and_close_all();
  test_event_loop_run_failure();
  return ::ttyecho::tests::run_and_report();
}
