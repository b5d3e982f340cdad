#pragma once

#include "modules/converter.hpp"
#include "modules/history_log.hpp"
#include "modules/rate_cache.hpp"
#include "modules/rate_source.hpp"
#include "modules/record_store.hpp"
#include "settings.hpp"

namespace currex
{
    struct Conversion
    {
        core::ErrorCode error_code;
        modules::ConversionResult result;
    };

    class Core
    {
      public:
        using Handler = std::function<void(Conversion const&)>;

        // Set by whichever side settles the request first: the completion, or a caller that stopped waiting.
        using Claim = std::shared_ptr<std::atomic<bool>>;

        Core(Settings const& settings);

        // Rates come from the given fetcher instead of the HTTP endpoint.
        Core(Settings const& settings, modules::RateFetcher fetcher);

        ~Core();

        auto convert(modules::ConversionRequest const& request) -> Conversion;

        // A conversion whose claim was taken by the caller is neither recorded nor delivered.
        auto async_convert(modules::ConversionRequest request, Handler handler, Claim claim = nullptr) -> void;

        auto currencies(std::vector<std::string>& codes) -> core::ErrorCode;

        auto history() const -> std::vector<modules::ConversionResult>;

        auto flush_history() -> void;

        // Successful conversions whose record could not be written.
        auto unsaved() const -> size_t;

      private:
        std::unique_ptr<modules::HttpRateSource> m_rate_source;
        SQLite::Database m_database;

        modules::RateCache m_rate_cache;
        modules::RecordStore m_record_store;
        modules::HistoryLog m_history_log;
        std::atomic<size_t> m_unsaved;

        // Declared last so its workers are joined while everything they touch is still alive.
        modules::Converter m_converter;

        auto record(Conversion const& conversion) -> void;
    };
} // namespace currex
