#include "engine/core.hpp"
#include "precompiled.hpp"
#include <argh.h>

auto main(int32_t argc, char** argv) -> int32_t
{
    argh::parser command_line;
    currex::register_settings(command_line);
    command_line.parse(argc, argv);

    currex::Settings settings;
    if (command_line.pos_args().size() != 4 || !currex::parse_settings(command_line, settings))
    {
        std::cerr << "Usage: " << argv[0] << " [options] <amount> <from> <to>\n"
                  << currex::settings_usage() << "  -j, --json               print the result as JSON\n"
                  << std::endl;
        return EXIT_FAILURE;
    }

    spdlog::set_level(settings.trace ? spdlog::level::trace : spdlog::level::warn);

    double amount;
    if (currex::modules::parse_amount(command_line[1], amount) != core::ErrorCode::Success)
    {
        std::cerr << "Error: " << core::error_message(core::ErrorCode::InvalidAmount) << std::endl;
        return EXIT_FAILURE;
    }

    bool const json = command_line[{"-j", "--json"}];

    try
    {
        std::promise<bool> done;
        auto future = done.get_future();
        auto claim = std::make_shared<std::atomic<bool>>(false);

        currex::Core engine(settings);
        engine.async_convert({.amount = amount, .source = command_line[2], .target = command_line[3]},
                             [&done, json](currex::Conversion const& conversion) {
                                 if (conversion.error_code != core::ErrorCode::Success)
                                 {
                                     std::cerr << "Error: " << core::error_message(conversion.error_code) << std::endl;
                                     done.set_value(false);
                                     return;
                                 }

                                 auto const& result = conversion.result;
                                 if (json)
                                 {
                                     std::cout << nlohmann::json(result).dump() << std::endl;
                                 }
                                 else
                                 {
                                     std::cout << fmt::format("{} {} = {} {}", result.amount, result.source,
                                                              result.result, result.target)
                                               << std::endl;
                                 }
                                 done.set_value(true);
                             },
                             claim);

        if (future.wait_for(settings.timeout * 5) != std::future_status::ready && !claim->exchange(true))
        {
            std::cerr << "Error: " << core::error_message(core::ErrorCode::NetworkError) << std::endl;
            return EXIT_FAILURE;
        }
        return future.get() ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (std::exception const& e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
