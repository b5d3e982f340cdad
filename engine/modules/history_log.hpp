#pragma once

#include "converter.hpp"

namespace currex::modules
{
    class HistoryLog
    {
      public:
        HistoryLog(size_t const limit, std::optional<std::filesystem::path> const log_path);

        ~HistoryLog();

        auto append(ConversionResult const& result) -> void;

        auto snapshot() const -> std::vector<ConversionResult>;

        // Blocks until every posted dump has been written.
        auto flush() -> void;

      private:
        size_t m_limit;

        mutable std::mutex m_mutex;
        std::deque<ConversionResult> m_records;

        boost::asio::thread_pool m_pool;
        size_t m_pending;
        std::condition_variable m_drained;

        auto dump(std::vector<ConversionResult> const& records) -> void;
    };
} // namespace currex::modules
