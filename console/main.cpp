#include "console.hpp"
#include "precompiled.hpp"
#include <argh.h>

auto main(int32_t argc, char** argv) -> int32_t
{
    argh::parser command_line;
    currex::register_settings(command_line);
    command_line.parse(argc, argv);

    currex::Settings settings;
    if (command_line[{"-?", "--help"}] || !currex::parse_settings(command_line, settings))
    {
        std::cerr << "Usage: " << argv[0] << " [options]\n" << currex::settings_usage() << std::endl;
        return EXIT_FAILURE;
    }

    if (settings.trace)
    {
        spdlog::set_level(spdlog::level::trace);
    }
    else
    {
#ifndef NDEBUG
        spdlog::set_level(spdlog::level::debug);
#else
        spdlog::set_level(spdlog::level::info);
#endif
    }

    try
    {
        currex::Core engine(settings);
        // One timeout per bounded step of a refresh (connect, handshake, write, read) plus one for name resolution.
        currex::Console console(engine, std::cin, std::cout, settings.timeout * 5);
        console.run();
        return EXIT_SUCCESS;
    }
    catch (std::exception const& e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
