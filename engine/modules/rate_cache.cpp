#include "rate_cache.hpp"
#include "precompiled.hpp"

namespace currex::modules
{
    RateCache::RateCache(RateFetcher fetcher, std::string_view const base_currency, Clock::duration const ttl,
                         std::optional<std::filesystem::path> const log_path,
                         std::function<Clock::time_point()> now)
        : m_fetcher(std::move(fetcher)), m_base_currency(boost::to_upper_copy(std::string(base_currency))),
          m_ttl(ttl), m_now(std::move(now)), m_generation(0), m_last_error(core::ErrorCode::Success)
    {
        core::initialize_logger("cache", log_path);
    }

    RateCache::~RateCache()
    {
        spdlog::drop("cache");
    }

    auto RateCache::base_currency() const -> std::string const&
    {
        return m_base_currency;
    }

    auto RateCache::generation() -> uint64_t
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_generation;
    }

    auto RateCache::get_rate(std::string_view const currency, double& rate) -> core::ErrorCode
    {
        return this->get_rate(currency, rate, this->generation());
    }

    auto RateCache::get_rate(std::string_view const currency, double& rate, uint64_t const generation)
        -> core::ErrorCode
    {
        auto const code = boost::to_upper_copy(boost::trim_copy(std::string(currency)));
        if (code.empty())
        {
            return core::ErrorCode::UnknownCurrency;
        }

        std::shared_ptr<RateTable const> table;
        if (auto const error_code = this->active_table(table, generation); error_code != core::ErrorCode::Success)
        {
            return error_code;
        }

        auto const it = table->find(code);
        if (it == table->end())
        {
            spdlog::get("cache")->log(spdlog::level::warn, "Currency {} is not quoted against {}", code,
                                      m_base_currency);
            return core::ErrorCode::UnknownCurrency;
        }

        rate = it->second;
        return core::ErrorCode::Success;
    }

    auto RateCache::currencies(std::vector<std::string>& codes) -> core::ErrorCode
    {
        std::shared_ptr<RateTable const> table;
        if (auto const error_code = this->active_table(table, this->generation());
            error_code != core::ErrorCode::Success)
        {
            return error_code;
        }

        codes.clear();
        codes.reserve(table->size());
        for (auto const& [code, rate] : *table)
        {
            codes.emplace_back(code);
        }
        std::ranges::sort(codes);
        return core::ErrorCode::Success;
    }

    auto RateCache::active_table(std::shared_ptr<RateTable const>& table, uint64_t const generation)
        -> core::ErrorCode
    {
        table = this->fresh_table();
        if (table)
        {
            return core::ErrorCode::Success;
        }
        return this->refresh(table, generation);
    }

    auto RateCache::fresh_table() -> std::shared_ptr<RateTable const>
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_table && m_now() - m_fetched_at < m_ttl)
        {
            return m_table;
        }
        return nullptr;
    }

    auto RateCache::refresh(std::shared_ptr<RateTable const>& table, uint64_t const generation) -> core::ErrorCode
    {
        std::lock_guard<std::mutex> refresh_lock(m_refresh_mutex);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_table && m_now() - m_fetched_at < m_ttl)
            {
                table = m_table;
                return core::ErrorCode::Success;
            }

            // A refresh finished while this caller was waiting for it
            if (m_generation != generation && m_last_error != core::ErrorCode::Success)
            {
                return m_last_error;
            }
        }

        spdlog::get("cache")->log(spdlog::level::debug, "Rate table for {} is missing or stale, refreshing",
                                  m_base_currency);

        RateTable fetched;
        auto error_code = m_fetcher(m_base_currency, fetched);
        if (error_code != core::ErrorCode::Success)
        {
            spdlog::get("cache")->log(spdlog::level::err, "Rate refresh for {} failed: {}", m_base_currency,
                                      core::error_message(error_code));
        }
        else if (fetched.empty())
        {
            spdlog::get("cache")->log(spdlog::level::err, "Rate refresh for {} returned an empty table",
                                      m_base_currency);
            error_code = core::ErrorCode::ParseError;
        }

        std::shared_ptr<RateTable const> snapshot;
        if (error_code == core::ErrorCode::Success)
        {
            snapshot = std::make_shared<RateTable const>(std::move(fetched));
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_generation;
            m_last_error = error_code;
            if (snapshot)
            {
                m_table = snapshot;
                m_fetched_at = m_now();
            }
        }

        if (!snapshot)
        {
            return error_code;
        }

        table = std::move(snapshot);
        spdlog::get("cache")->log(spdlog::level::debug, "Cached {} rates for {}", table->size(), m_base_currency);
        return core::ErrorCode::Success;
    }
} // namespace currex::modules
