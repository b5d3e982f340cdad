#pragma once

#include <argh.h>

namespace currex
{
    struct Settings
    {
        std::string host = "https://api.exchangerate.host";
        std::string base_currency = "USD";
        std::string access_key;
        std::filesystem::path database_path = "currex.db";
        std::optional<std::filesystem::path> log_path;
        std::chrono::seconds cache_ttl{600};
        std::chrono::seconds timeout{10};
        size_t history_limit = 100;
        bool trace = false;
    };

    auto register_settings(argh::parser& command_line) -> void;

    auto parse_settings(argh::parser const& command_line, Settings& settings) -> bool;

    auto settings_usage() -> std::string_view;
} // namespace currex
