#pragma once

#include "core/common.hpp"
#include <boost/asio/ssl/context.hpp>

namespace currex::modules
{
    // Rates of every known currency against the base currency; the base itself maps to 1.
    using RateTable = std::unordered_map<std::string, double>;

    using RateFetcher = std::function<core::ErrorCode(std::string_view const, RateTable&)>;

    struct Endpoint
    {
        std::string scheme;
        std::string host;
        std::string port;
        std::string path;
    };

    auto parse_endpoint(std::string_view const url, Endpoint& endpoint) -> bool;

    auto parse_rates(std::string_view const body, std::string_view const base_currency, RateTable& table)
        -> core::ErrorCode;

    class HttpRateSource
    {
      public:
        HttpRateSource(Endpoint endpoint, std::string_view const access_key, std::chrono::seconds const timeout,
                       std::optional<std::filesystem::path> const log_path);

        ~HttpRateSource();

        auto fetch(std::string_view const base_currency, RateTable& table, std::string_view const symbols = {})
            -> core::ErrorCode;

        auto request_target(std::string_view const base_currency, std::string_view const symbols) const
            -> std::string;

      private:
        Endpoint m_endpoint;
        std::string m_access_key;
        std::chrono::seconds m_timeout;
        boost::asio::ssl::context m_ssl_context;

        auto query(std::string const& target, unsigned& status, std::string& body) -> boost::system::error_code;
    };
} // namespace currex::modules
