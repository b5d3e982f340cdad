#include "console.hpp"
#include "precompiled.hpp"

namespace currex
{
    Console::Console(Core& core, std::istream& input, std::ostream& output, std::chrono::seconds const timeout)
        : m_core(&core), m_input(&input), m_output(&output), m_timeout(timeout)
    {
    }

    auto Console::run() -> void
    {
        *m_output << "===== LIVE CURRENCY CONVERTER =====" << std::endl;

        while (true)
        {
            std::string text;
            if (!this->read_token("\nEnter amount (or 0 to exit): ", text))
            {
                break;
            }

            double amount;
            if (modules::parse_amount(text, amount) != core::ErrorCode::Success)
            {
                *m_output << "\nError: " << core::error_message(core::ErrorCode::InvalidAmount) << std::endl;
                continue;
            }

            if (amount == 0.0)
            {
                break;
            }

            std::string source;
            if (!this->read_currency("From currency (? lists the codes): ", source))
            {
                break;
            }

            std::string target;
            if (!this->read_currency("To currency (? lists the codes): ", target))
            {
                break;
            }

            auto promise = std::make_shared<std::promise<Conversion>>();
            auto future = promise->get_future();
            auto claim = std::make_shared<std::atomic<bool>>(false);
            m_core->async_convert({.amount = amount, .source = source, .target = target},
                                  [promise](Conversion const& conversion) { promise->set_value(conversion); }, claim);

            *m_output << "\nFetching live rates... please wait\n" << std::endl;

            // Once the claim is ours the late result is dropped unsaved; otherwise it is already on its way.
            if (future.wait_for(m_timeout) != std::future_status::ready && !claim->exchange(true))
            {
                *m_output << "Error: " << core::error_message(core::ErrorCode::NetworkError) << std::endl;
                continue;
            }

            auto const conversion = future.get();
            if (conversion.error_code != core::ErrorCode::Success)
            {
                *m_output << "Error: " << core::error_message(conversion.error_code) << std::endl;
                continue;
            }

            auto const& result = conversion.result;
            *m_output << "----------------------------------\n"
                      << fmt::format("{} {} = {} {}", result.amount, result.source, result.result, result.target)
                      << "\n----------------------------------" << std::endl;
        }

        *m_output << "Program ended. Thank you!" << std::endl;
    }

    auto Console::read_token(std::string_view const prompt, std::string& token) -> bool
    {
        *m_output << prompt << std::flush;
        return static_cast<bool>(*m_input >> token);
    }

    auto Console::read_currency(std::string_view const prompt, std::string& code) -> bool
    {
        while (this->read_token(prompt, code))
        {
            if (code != "?")
            {
                code = modules::normalize_currency(code);
                return true;
            }
            this->print_currencies();
        }
        return false;
    }

    auto Console::print_currencies() -> void
    {
        std::vector<std::string> codes;
        auto const error_code = m_core->currencies(codes);
        if (error_code != core::ErrorCode::Success)
        {
            *m_output << "Error: " << core::error_message(error_code) << std::endl;
            return;
        }
        *m_output << boost::join(codes, " ") << std::endl;
    }
} // namespace currex
