#pragma once

namespace core
{
    enum class ErrorCode : uint16_t
    {
        Success = 0,
        InvalidAmount = 1,
        UnknownCurrency = 2,
        NetworkError = 3,
        ParseError = 4,
        PersistenceError = 5
    };

    inline auto error_message(ErrorCode const error_code) -> std::string_view
    {
        switch (error_code)
        {
            case ErrorCode::Success:
                return "Success";
            case ErrorCode::InvalidAmount:
                return "Invalid amount: enter a positive number";
            case ErrorCode::UnknownCurrency:
                return "Invalid currency code";
            case ErrorCode::NetworkError:
            case ErrorCode::ParseError:
                return "Failed to fetch live rates, please try again";
            case ErrorCode::PersistenceError:
                return "Failed to save the conversion";
        }
        return "Unknown error";
    }

    // Stderr sink keeps log lines apart from the interactive output on stdout.
    inline auto initialize_logger(std::string const& name, std::optional<std::filesystem::path> const& log_path)
        -> void
    {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
        if (log_path)
        {
            sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.value().string()));
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        spdlog::initialize_logger(logger);
    }
} // namespace core
