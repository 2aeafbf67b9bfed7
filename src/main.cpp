/// @file main.cpp
/// @brief slantcol entry point: slantcol <config.yaml>

#include "core/application.hpp"
#include "core/logger.hpp"
#include "io/run_config.hpp"

#include <atomic>
#include <csignal>
#include <utility>

namespace
{

std::atomic<bool> g_cancel{false};

void on_interrupt(int /*signal*/)
{
    g_cancel.store(true);
}

} // anonymous namespace

int main(int argc, char** argv)
{
    slantcol::core::Logger::init();

    if (argc != 2)
    {
        SLC_ERROR("Usage: {} <config.yaml>", argc > 0 ? argv[0] : "slantcol");
        slantcol::core::Logger::shutdown();
        return 1;
    }

    SLC_INFO("slantcol starting with {}", argv[1]);

    int exit_code = 1;
    if (auto config = slantcol::io::ConfigLoader::load_file(argv[1]))
    {
        if (std::signal(SIGINT, on_interrupt) == SIG_ERR)
        {
            SLC_WARN("Cannot install SIGINT handler; Ctrl-C will not stop the run cleanly");
        }

        slantcol::core::Application app(std::move(*config), &g_cancel);
        exit_code = app.run();
    }
    else
    {
        SLC_CRITICAL("Invalid configuration, nothing to do");
    }

    SLC_INFO("slantcol exiting with code {}", exit_code);
    slantcol::core::Logger::shutdown();
    return exit_code;
}
