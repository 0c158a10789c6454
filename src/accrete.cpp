#include "accrete/cli.hpp"
#include "accrete/commands.hpp"

#include <filesystem>
#include <iostream>
#include <print>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

int main(const int argc, const char *const *argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);

    auto inv = accrete::parse_args(args);
    if (!inv) {
        std::println(std::cerr, "{}", inv.error().message);
        std::print(std::cerr, "{}", accrete::usage());
        return accrete::exit_code(inv.error());
    }

    const accrete::Config &config = inv->config;
    if (config.work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(config.work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", config.work_dir.string(), ec.message());
            return 1;
        }
    }

    return std::visit(
        [&](const auto &action) -> int {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, accrete::ShowHelp>) {
                std::print("{}", accrete::usage());
                return 0;
            } else if constexpr (std::is_same_v<T, accrete::ShowVersion>) {
                std::println("accrete {}", ACCRETE_PROJ_VER);
                return 0;
            } else if constexpr (std::is_same_v<T, accrete::AddJobOptions>) {
                if (auto res = accrete::add_job(config, action); !res) {
                    std::println(std::cerr, "add-job failed: {}", res.error());
                    return accrete::exit_code(res.error());
                }
                return 0;
            } else {
                if (auto res = accrete::run_build(config); !res) {
                    std::println(std::cerr, "run-build failed: {}", res.error());
                    return accrete::exit_code(res.error());
                }
                return 0;
            }
        },
        inv->action);
}
