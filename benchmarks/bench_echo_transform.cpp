#include "bench_main.hpp"

#include "ttyecho/echo/transform.hpp"
#include "ttyecho/loop/event_loop.hpp"
#include "ttyecho/loop/memory_runtime.hpp"
#include "ttyecho/session/echo_app.hpp"

#include <cstddef>
#include <iostream>
#include <memory>
#include <random>
#include <utility>
#include <vector>

using namespace ttyecho;
using namespace ttyecho::core;

static void bench_transform_printable() {
    // 全部可打印字符：输出长度 n + 1
    constexpr std::size_t size = 1024 * 1024;
    std::vector<byte> input(size, 'a');

    std::size_t sink = 0;
    BENCH_RUN("Echo: transform 1MB printable", size, 10, {
        auto r = echo::echo_transform(bytes_view{input.data(), input.size()});
        sink += r.output.size();
    });
    if (sink == 0) {
        std::cerr << "unexpected empty output\n";
    }
}

static void bench_transform_control() {
    // 全部控制字符：每字节展开为 2 字节
    constexpr std::size_t size = 1024 * 1024;
    std::vector<byte> input(size, 0x01);

    std::size_t sink = 0;
    BENCH_RUN("Echo: transform 1MB control bytes", size, 10, {
        auto r = echo::echo_transform(bytes_view{input.data(), input.size()});
        sink += r.output.size();
    });
    if (sink == 0) {
        std::cerr << "unexpected empty output\n";
    }
}

static void bench_transform_random_keystrokes() {
    // 模拟交互输入：大量 1~8 字节的小块
    constexpr std::size_t chunks = 100000;
    std::mt19937 rng(42u);
    std::uniform_int_distribution<int> len_dist(1, 8);
    std::uniform_int_distribution<int> byte_dist(0x04, 0xFF);

    std::vector<std::vector<byte>> inputs(chunks);
    std::size_t total = 0;
    for (auto &in : inputs) {
        in.resize(static_cast<std::size_t>(len_dist(rng)));
        for (auto &b : in) {
            b = static_cast<byte>(byte_dist(rng));
        }
        total += in.size();
    }

    BENCH_RUN("Echo: transform 100k small chunks", total, 5, {
        for (const auto &in : inputs) {
            auto r = echo::echo_transform(bytes_view{in.data(), in.size()});
            if (r.terminate) {
                std::cerr << "unexpected terminate\n";
            }
        }
    });
}

static void bench_session_memory_runtime() {
    // 整个会话（读 -> 转义 -> 写 -> 关闭流程）走内存 runtime
    constexpr std::size_t keys = 10000;

    BENCH_RUN("Session: 10k keystrokes via MemoryRuntime", keys, 3, {
        auto owned = std::make_unique<loop::MemoryRuntime>();
        auto *rt = owned.get();
        for (std::size_t i = 0; i < keys; ++i) {
            rt->feed_input("k");
        }
        rt->feed_input("\x03");
        loop::EventLoop loop(std::move(owned));
        const auto report = session::run_echo_session(loop);
        if (report.error) {
            std::cerr << report.error->describe() << "\n";
        }
    });
}

int main() {
    bench_transform_printable();
    bench_transform_control();
    bench_transform_random_keystrokes();
    bench_session_memory_runtime();

    ttyecho::benchmarks::print_results();
    return 0;
}
