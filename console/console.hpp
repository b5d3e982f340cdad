#pragma once

#include "engine/core.hpp"

namespace currex
{
    class Console
    {
      public:
        Console(Core& core, std::istream& input, std::ostream& output, std::chrono::seconds const timeout);

        auto run() -> void;

      private:
        Core* m_core;
        std::istream* m_input;
        std::ostream* m_output;
        std::chrono::seconds m_timeout;

        auto read_token(std::string_view const prompt, std::string& token) -> bool;

        auto read_currency(std::string_view const prompt, std::string& code) -> bool;

        auto print_currencies() -> void;
    };
} // namespace currex
