#include "history_log.hpp"
#include "precompiled.hpp"

namespace currex::modules
{
    HistoryLog::HistoryLog(size_t const limit, std::optional<std::filesystem::path> const log_path)
        : m_limit(std::max<size_t>(limit, 1)), m_pool(1), m_pending(0)
    {
        core::initialize_logger("history", log_path);
    }

    HistoryLog::~HistoryLog()
    {
        m_pool.join();
        spdlog::drop("history");
    }

    auto HistoryLog::append(ConversionResult const& result) -> void
    {
        std::vector<ConversionResult> records;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_records.push_back(result);
            if (m_records.size() > m_limit)
            {
                m_records.pop_front();
            }
            records.assign(m_records.begin(), m_records.end());
            ++m_pending;
        }

        boost::asio::post(m_pool, [this, records = std::move(records)]() {
            this->dump(records);

            std::lock_guard<std::mutex> lock(m_mutex);
            --m_pending;
            m_drained.notify_all();
        });
    }

    auto HistoryLog::snapshot() const -> std::vector<ConversionResult>
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return {m_records.begin(), m_records.end()};
    }

    auto HistoryLog::flush() -> void
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_drained.wait(lock, [this]() { return m_pending == 0; });
    }

    auto HistoryLog::dump(std::vector<ConversionResult> const& records) -> void
    {
        auto logger = spdlog::get("history");
        logger->log(spdlog::level::info, "Conversion history ({} entries)", records.size());
        for (auto const& record : records)
        {
            logger->log(spdlog::level::info, "{} {} -> {} {}", record.amount, record.source, record.result,
                        record.target);
        }
    }
} // namespace currex::modules
