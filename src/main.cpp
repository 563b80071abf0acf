#include <iostream>

#include "cli/app/app.hpp"
#include "adapters/fs.hpp"
#include "adapters/terminal.hpp"
#include "adapters/http/beast_transport.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

int main(int argc, char** argv)
{
    try {
        // Диагностика в stderr, stdout остаётся для вывода прогресса
        spdlog::set_default_logger(spdlog::stderr_color_mt("nexus-upload"));
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        const nxup::adapters::fs::InputSource source{
            .stdin_is_pipe = nxup::adapters::fs::stdin_is_pipe(),
            .stdin_stream = &std::cin
        };
        nxup::adapters::http::BeastTransport transport;

        return nxup::cli::run(argc, argv, source, transport,
                              nxup::adapters::terminal::read_secret, std::cout);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
