#include "settings.hpp"
#include "precompiled.hpp"

namespace currex
{
    namespace
    {
        // Upper bounds keep every duration well inside steady_clock's nanosecond range.
        constexpr long long max_cache_ttl = 7 * 24 * 60 * 60;
        constexpr long long max_timeout = 60 * 60;
        constexpr long long max_history = 1'000'000;

        template <typename Type>
        auto read_positive(argh::parser const& command_line, std::initializer_list<char const* const> const names,
                           long long const max, Type& value) -> bool
        {
            auto stream = command_line(names);
            if (stream.str().empty())
            {
                return true;
            }

            long long parsed;
            if (!(stream >> parsed) || !stream.eof() || parsed <= 0 || parsed > max)
            {
                return false;
            }
            value = Type(parsed);
            return true;
        }
    } // namespace

    auto register_settings(argh::parser& command_line) -> void
    {
        command_line.add_params({"-H", "--host", "-b", "--base", "-k", "--access-key", "-d", "--database", "-l",
                                 "--log", "--ttl", "--timeout", "--history"});
    }

    auto parse_settings(argh::parser const& command_line, Settings& settings) -> bool
    {
        std::string value;
        if (command_line({"-H", "--host"}) >> value)
        {
            boost::trim_right_if(value, boost::is_any_of("/"));
            settings.host = value;
        }

        if (command_line({"-b", "--base"}) >> value)
        {
            settings.base_currency = boost::to_upper_copy(value);
        }

        if (command_line({"-k", "--access-key"}) >> value)
        {
            settings.access_key = value;
        }

        if (command_line({"-d", "--database"}) >> value)
        {
            settings.database_path = std::filesystem::path(value).make_preferred();
        }

        if (command_line({"-l", "--log"}) >> value)
        {
            settings.log_path = std::filesystem::path(value).make_preferred();
        }

        if (!read_positive(command_line, {"--ttl"}, max_cache_ttl, settings.cache_ttl) ||
            !read_positive(command_line, {"--timeout"}, max_timeout, settings.timeout) ||
            !read_positive(command_line, {"--history"}, max_history, settings.history_limit))
        {
            return false;
        }

        settings.trace = command_line[{"-t", "--trace"}];

        return !settings.host.empty() && !settings.base_currency.empty();
    }

    auto settings_usage() -> std::string_view
    {
        return "Options:\n"
               "  -H, --host <url>         rate endpoint (default https://api.exchangerate.host)\n"
               "  -b, --base <code>        base currency (default USD)\n"
               "  -k, --access-key <key>   endpoint access key\n"
               "  -d, --database <path>    SQLite database (default currex.db)\n"
               "  -l, --log <path>         log file\n"
               "      --ttl <seconds>      rate cache lifetime (default 600, at most 604800)\n"
               "      --timeout <seconds>  network timeout (default 10, at most 3600)\n"
               "      --history <count>    conversions kept in the history log (default 100, at most 1000000)\n"
               "  -t, --trace              trace logging\n";
    }
} // namespace currex
