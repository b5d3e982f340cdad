#pragma once

#include "converter.hpp"
#include <SQLiteCpp/SQLiteCpp.h>

namespace currex::modules
{
    class RecordStore
    {
      public:
        RecordStore(SQLite::Database& database, std::optional<std::filesystem::path> const log_path);

        ~RecordStore();

        auto save(ConversionResult const& result) -> core::ErrorCode;

      private:
        SQLite::Database* m_database;
    };
} // namespace currex::modules
