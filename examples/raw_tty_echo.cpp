/**
 * @file raw_tty_echo.cpp
 * @brief 原始模式终端回显：把键入的每个字节转义后回显，Ctrl+C 退出
 *
 * 用法示例：
 *   ./raw_tty_echo
 *   ./raw_tty_echo --log-level debug 2>echo.log
 *
 * 日志写到 stderr；stdout 只输出问候语、回显数据和（异常退出时的）一行错误信息。
 */

#include "ttyecho/core/log.hpp"
#include "ttyecho/loop/asio_runtime.hpp"
#include "ttyecho/loop/event_loop.hpp"
#include "ttyecho/session/echo_app.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace ttyecho;

namespace {

struct Options final {
    core::LogLevel log_level{core::LogLevel::off};
    bool greeting_enabled{true};
    std::optional<std::string> greeting{};
    bool help{false};
};

static void print_usage(const char *prog) {
    std::cerr << "用法:\n";
    std::cerr << "  " << prog << " [options]\n\n";
    std::cerr << "选项:\n";
    std::cerr << "  --log-level <lvl>   日志级别 trace|debug|info|warn|error|critical|off（默认 off）\n";
    std::cerr << "  --no-greeting       不输出问候语\n";
    std::cerr << "  --greeting <text>   自定义问候语\n";
    std::cerr << "  -h, --help          显示帮助\n";
}

static std::optional<Options> parse_args(int argc, char **argv) {
    Options opt;

    for (int i = 1; i < argc; ++i) {
        const std::string_view a = argv[i];

        auto need_value = [&](const char *name) -> const char * {
            if (i + 1 >= argc) {
                std::cerr << "缺少参数值: " << name << "\n";
                return nullptr;
            }
            ++i;
            return argv[i];
        };

        if (a == "-h" || a == "--help") {
            opt.help = true;
            return opt;
        }
        if (a == "--log-level") {
            const char *v = need_value("--log-level");
            if (!v) {
                return std::nullopt;
            }
            const auto lvl = core::parse_log_level(v);
            if (!lvl) {
                std::cerr << "非法 log-level: " << v << "\n";
                return std::nullopt;
            }
            opt.log_level = *lvl;
            continue;
        }
        if (a == "--no-greeting") {
            opt.greeting_enabled = false;
            continue;
        }
        if (a == "--greeting") {
            const char *v = need_value("--greeting");
            if (!v) {
                return std::nullopt;
            }
            opt.greeting = std::string(v);
            continue;
        }

        std::cerr << "未知参数: " << a << "\n";
        return std::nullopt;
    }

    return opt;
}

} // namespace

int main(int argc, char **argv) {
    const auto opt = parse_args(argc, argv);
    if (!opt) {
        print_usage(argv[0]);
        return 2;
    }
    if (opt->help) {
        print_usage(argv[0]);
        return 0;
    }

    core::log_to_stderr();
    core::set_log_level(opt->log_level);

    session::SessionOptions session_opt;
    session_opt.greeting_enabled = opt->greeting_enabled;
    if (opt->greeting) {
        session_opt.greeting = *opt->greeting;
    }

    loop::EventLoop loop(std::make_unique<loop::AsioRuntime>());
    const auto report = session::run_echo_session(loop, std::move(session_opt));

    if (report.error) {
        std::cout << report.error->describe() << std::endl;
        return 1;
    }
    return 0;
}
