/// @file main.cpp
/// @brief Uptime entry point: visibility schedule of sources for a network of stations.

#include "app/application.hpp"
#include "app/config.hpp"
#include "core/logger.hpp"

#include <iostream>
#include <string_view>
#include <utility>
#include <vector>

int main(int argc, char* argv[])
{
    uptime::core::Logger::init();
    UPT_INFO("Uptime starting...");

    const std::vector<std::string_view> args(argv + 1, argv + argc);
    auto command_line = uptime::app::parse_command_line(args);
    if (!command_line)
    {
        UPT_ERROR("{}", command_line.error().message);
        std::cerr << uptime::app::usage();
        uptime::core::Logger::shutdown();
        return 2;
    }
    if (command_line->show_help)
    {
        std::cout << uptime::app::usage();
        uptime::core::Logger::shutdown();
        return 0;
    }

    uptime::app::AppConfig config;
    if (command_line->config_path)
    {
        auto loaded = uptime::app::load_config(*command_line->config_path);
        if (!loaded)
        {
            UPT_CRITICAL("Invalid configuration {}", command_line->config_path->string());
            uptime::core::Logger::shutdown();
            return 1;
        }
        config = std::move(*loaded);
    }
    uptime::app::apply_overrides(config, *command_line);

    int exit_code = 0;
    {
        uptime::app::Application app(std::move(config));
        exit_code = app.run();
    }

    UPT_INFO("Uptime shut down {}", exit_code == 0 ? "cleanly" : "with errors");
    uptime::core::Logger::shutdown();
    return exit_code;
}
