#include "core.hpp"
#include "precompiled.hpp"

namespace currex
{
    namespace
    {
        auto make_rate_source(Settings const& settings) -> std::unique_ptr<modules::HttpRateSource>
        {
            modules::Endpoint endpoint;
            if (!modules::parse_endpoint(settings.host, endpoint))
            {
                throw std::invalid_argument(fmt::format("Invalid rate endpoint: {}", settings.host));
            }
            return std::make_unique<modules::HttpRateSource>(std::move(endpoint), settings.access_key,
                                                             settings.timeout, settings.log_path);
        }
    } // namespace

    Core::Core(Settings const& settings) : Core(settings, nullptr)
    {
    }

    Core::Core(Settings const& settings, modules::RateFetcher fetcher)
        : m_rate_source(fetcher ? std::unique_ptr<modules::HttpRateSource>() : make_rate_source(settings)),
          m_database(settings.database_path.string(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
          m_rate_cache(fetcher ? std::move(fetcher)
                               : modules::RateFetcher([this](std::string_view const base_currency,
                                                             modules::RateTable& table) {
                                     return m_rate_source->fetch(base_currency, table);
                                 }),
                       settings.base_currency, settings.cache_ttl, settings.log_path),
          m_record_store(m_database, settings.log_path), m_history_log(settings.history_limit, settings.log_path),
          m_unsaved(0), m_converter(m_rate_cache, settings.log_path)
    {
        core::initialize_logger("core", settings.log_path);

        spdlog::get("core")->log(spdlog::level::info, "Converting through {} (database: {}, cache ttl: {}s)",
                                 m_rate_source ? settings.host : std::string("a local rate table"),
                                 settings.database_path.string(), settings.cache_ttl.count());
    }

    Core::~Core()
    {
        spdlog::drop("core");
    }

    auto Core::convert(modules::ConversionRequest const& request) -> Conversion
    {
        Conversion conversion{.error_code = core::ErrorCode::Success,
                              .result = {.amount = request.amount,
                                         .source = modules::normalize_currency(request.source),
                                         .target = modules::normalize_currency(request.target),
                                         .result = 0.0}};

        conversion.error_code = m_converter.convert(request, conversion.result);
        if (conversion.error_code != core::ErrorCode::Success)
        {
            spdlog::get("core")->log(spdlog::level::info, "Conversion {} {} -> {} failed: {}", request.amount,
                                     conversion.result.source, conversion.result.target,
                                     core::error_message(conversion.error_code));
        }

        this->record(conversion);
        return conversion;
    }

    auto Core::async_convert(modules::ConversionRequest request, Handler handler, Claim claim) -> void
    {
        m_converter.async_convert(std::move(request), [this, handler = std::move(handler), claim = std::move(claim)](
                                                           core::ErrorCode const error_code,
                                                           modules::ConversionResult const& result) {
            if (claim && claim->exchange(true))
            {
                return;
            }

            Conversion const conversion{.error_code = error_code, .result = result};
            this->record(conversion);
            handler(conversion);
        });
    }

    auto Core::currencies(std::vector<std::string>& codes) -> core::ErrorCode
    {
        return m_rate_cache.currencies(codes);
    }

    auto Core::history() const -> std::vector<modules::ConversionResult>
    {
        return m_history_log.snapshot();
    }

    auto Core::unsaved() const -> size_t
    {
        return m_unsaved;
    }

    auto Core::flush_history() -> void
    {
        m_history_log.flush();
    }

    auto Core::record(Conversion const& conversion) -> void
    {
        if (conversion.error_code != core::ErrorCode::Success)
        {
            return;
        }

        // A failed save is logged by the store and never reaches the caller.
        if (m_record_store.save(conversion.result) != core::ErrorCode::Success)
        {
            ++m_unsaved;
        }
        m_history_log.append(conversion.result);
    }
} // namespace currex
