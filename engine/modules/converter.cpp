#include "converter.hpp"
#include "precompiled.hpp"
#include <boost/lexical_cast.hpp>

namespace currex::modules
{
    auto parse_amount(std::string_view const text, double& amount) -> core::ErrorCode
    {
        auto const trimmed = boost::trim_copy(std::string(text));

        double parsed;
        if (trimmed.empty() || !boost::conversion::try_lexical_convert(trimmed, parsed) || !std::isfinite(parsed))
        {
            return core::ErrorCode::InvalidAmount;
        }

        amount = parsed;
        return core::ErrorCode::Success;
    }

    auto normalize_currency(std::string_view const currency) -> std::string
    {
        return boost::to_upper_copy(boost::trim_copy(std::string(currency)));
    }

    Converter::Converter(RateCache& rate_cache, std::optional<std::filesystem::path> const log_path)
        : m_rate_cache(&rate_cache), m_dispatch_pool(1), m_lookup_pool(1)
    {
        core::initialize_logger("converter", log_path);
    }

    Converter::~Converter()
    {
        m_dispatch_pool.join();
        m_lookup_pool.join();
        spdlog::drop("converter");
    }

    auto Converter::convert(ConversionRequest const& request, ConversionResult& result) -> core::ErrorCode
    {
        if (!std::isfinite(request.amount) || request.amount <= 0.0)
        {
            spdlog::get("converter")->log(spdlog::level::debug, "Rejected amount {}", request.amount);
            return core::ErrorCode::InvalidAmount;
        }

        auto const source = normalize_currency(request.source);
        auto const target = normalize_currency(request.target);

        // Both lookups share whatever refresh either of them triggers
        auto const generation = m_rate_cache->generation();

        double source_rate = 0.0;
        auto source_future = boost::asio::post(m_lookup_pool, std::packaged_task<core::ErrorCode()>([&]() {
                                                   return m_rate_cache->get_rate(source, source_rate, generation);
                                               }));

        double target_rate = 0.0;
        auto const target_error = m_rate_cache->get_rate(target, target_rate, generation);
        auto const source_error = source_future.get();

        if (source_error != core::ErrorCode::Success)
        {
            return source_error;
        }
        if (target_error != core::ErrorCode::Success)
        {
            return target_error;
        }

        result = ConversionResult{.amount = request.amount,
                                  .source = source,
                                  .target = target,
                                  .result = request.amount / source_rate * target_rate};

        spdlog::get("converter")
            ->log(spdlog::level::debug, "Converted {} {} to {} {} (rates {} / {})", result.amount, result.source,
                  result.result, result.target, source_rate, target_rate);
        return core::ErrorCode::Success;
    }

    auto Converter::async_convert(ConversionRequest request, Handler handler) -> void
    {
        boost::asio::post(m_dispatch_pool, [this, request = std::move(request), handler = std::move(handler)]() {
            ConversionResult result{.amount = request.amount,
                                    .source = normalize_currency(request.source),
                                    .target = normalize_currency(request.target),
                                    .result = 0.0};
            auto const error_code = this->convert(request, result);
            handler(error_code, result);
        });
    }
} // namespace currex::modules
