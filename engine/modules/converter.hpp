#pragma once

#include "rate_cache.hpp"
#include <nlohmann/json.hpp>

namespace currex::modules
{
    struct ConversionRequest
    {
        double amount;
        std::string source;
        std::string target;
    };

    struct ConversionResult
    {
        double amount;
        std::string source;
        std::string target;
        double result;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(currex::modules::ConversionResult, amount, source, target, result)

    // Accepts any finite number; the sign is checked by Converter::convert.
    auto parse_amount(std::string_view const text, double& amount) -> core::ErrorCode;

    auto normalize_currency(std::string_view const currency) -> std::string;

    class Converter
    {
      public:
        using Handler = std::function<void(core::ErrorCode const, ConversionResult const&)>;

        Converter(RateCache& rate_cache, std::optional<std::filesystem::path> const log_path);

        ~Converter();

        auto convert(ConversionRequest const& request, ConversionResult& result) -> core::ErrorCode;

        auto async_convert(ConversionRequest request, Handler handler) -> void;

      private:
        RateCache* m_rate_cache;

        // Conversions are dispatched to one pool and their source lookup to the other, so a dispatched
        // conversion never waits on a task queued behind itself.
        boost::asio::thread_pool m_dispatch_pool;
        boost::asio::thread_pool m_lookup_pool;
    };
} // namespace currex::modules
