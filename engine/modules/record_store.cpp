#include "record_store.hpp"
#include "precompiled.hpp"

namespace currex::modules
{
    RecordStore::RecordStore(SQLite::Database& database, std::optional<std::filesystem::path> const log_path)
        : m_database(&database)
    {
        core::initialize_logger("records", log_path);

        try
        {
            if (!database.tableExists("conversion_history"))
            {
                SQLite::Statement statement(*m_database, "CREATE TABLE conversion_history (amount REAL, source TEXT, "
                                                         "target TEXT, result REAL)");
                statement.exec();
            }
        }
        catch (SQLite::Exception const& e)
        {
            // Every later save reports the failure; conversions keep working.
            spdlog::get("records")->log(spdlog::level::err, "Unable to prepare conversion_history: {}", e.what());
        }
    }

    RecordStore::~RecordStore()
    {
        spdlog::drop("records");
    }

    auto RecordStore::save(ConversionResult const& result) -> core::ErrorCode
    {
        try
        {
            SQLite::Statement statement(*m_database, "INSERT INTO conversion_history (amount, source, target, "
                                                     "result) VALUES (?, ?, ?, ?)");
            statement.bind(1, result.amount);
            statement.bind(2, result.source);
            statement.bind(3, result.target);
            statement.bind(4, result.result);
            if (statement.exec() == 0)
            {
                spdlog::get("records")->log(spdlog::level::err, "Conversion {} {} -> {} was not saved", result.amount,
                                            result.source, result.target);
                return core::ErrorCode::PersistenceError;
            }

            spdlog::get("records")->log(spdlog::level::debug, "Saved conversion {} {} -> {} {}", result.amount,
                                        result.source, result.result, result.target);
            return core::ErrorCode::Success;
        }
        catch (SQLite::Exception const& e)
        {
            spdlog::get("records")->log(spdlog::level::err, "Database error: {}", e.what());
            return core::ErrorCode::PersistenceError;
        }
    }
} // namespace currex::modules
