#pragma once

#include "rate_source.hpp"

namespace currex::modules
{
    class RateCache
    {
      public:
        using Clock = std::chrono::steady_clock;

        RateCache(RateFetcher fetcher, std::string_view const base_currency, Clock::duration const ttl,
                  std::optional<std::filesystem::path> const log_path,
                  std::function<Clock::time_point()> now = Clock::now);

        ~RateCache();

        auto get_rate(std::string_view const currency, double& rate) -> core::ErrorCode;

        // Lookups that observed the same generation share one refresh, failed or not.
        auto get_rate(std::string_view const currency, double& rate, uint64_t const generation) -> core::ErrorCode;

        // Number of refreshes completed so far.
        auto generation() -> uint64_t;

        auto currencies(std::vector<std::string>& codes) -> core::ErrorCode;

        auto base_currency() const -> std::string const&;

      private:
        RateFetcher m_fetcher;
        std::string m_base_currency;
        Clock::duration m_ttl;
        std::function<Clock::time_point()> m_now;

        // Guards the published snapshot, its timestamp and the last refresh outcome.
        std::mutex m_mutex;
        std::shared_ptr<RateTable const> m_table;
        Clock::time_point m_fetched_at;
        uint64_t m_generation;
        core::ErrorCode m_last_error;

        // Held for the whole fetch so racing callers share one request.
        std::mutex m_refresh_mutex;

        auto fresh_table() -> std::shared_ptr<RateTable const>;

        auto refresh(std::shared_ptr<RateTable const>& table, uint64_t const generation) -> core::ErrorCode;

        auto active_table(std::shared_ptr<RateTable const>& table, uint64_t const generation) -> core::ErrorCode;
    };
} // namespace currex::modules
