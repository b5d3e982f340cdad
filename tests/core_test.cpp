#include "core.hpp"
#include "precompiled.hpp"
#include <SQLiteCpp/SQLiteCpp.h>
#include <gtest/gtest.h>

using namespace currex;

namespace
{
    auto test_settings() -> Settings
    {
        Settings settings;
        settings.database_path = "core_test.db";
        return settings;
    }

    auto static_rates(std::atomic<uint32_t>& fetches) -> modules::RateFetcher
    {
        return [&fetches](std::string_view const, modules::RateTable& table) {
            ++fetches;
            table = {{"USD", 1.0}, {"INR", 83.0}, {"EUR", 0.9}};
            return core::ErrorCode::Success;
        };
    }

    auto reset_database(bool const reject_writes) -> void
    {
        SQLite::Database test_db("core_test.db", SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
        test_db.exec("DROP TABLE IF EXISTS conversion_history");
        if (reject_writes)
        {
            test_db.exec("CREATE TABLE conversion_history (amount REAL, source TEXT, target TEXT, result REAL)");
            test_db.exec("CREATE TRIGGER reject_history BEFORE INSERT ON conversion_history "
                         "BEGIN SELECT RAISE(ABORT, 'disk I/O error'); END");
        }
    }

    auto saved_rows() -> int32_t
    {
        SQLite::Database test_db("core_test.db", SQLite::OPEN_READONLY);
        SQLite::Statement statement(test_db, "SELECT COUNT(*) FROM conversion_history");
        return statement.executeStep() ? statement.getColumn(0).getInt() : -1;
    }
} // namespace

TEST(Core, ConvertSavesAndLogs_Test)
{
    reset_database(false);

    std::atomic<uint32_t> fetches = 0;
    {
        Core engine(test_settings(), static_rates(fetches));

        auto const conversion = engine.convert({.amount = 100, .source = "usd", .target = "inr"});
        ASSERT_EQ(conversion.error_code, core::ErrorCode::Success);
        ASSERT_EQ(conversion.result.result, 8300.0);
        ASSERT_EQ(conversion.result.source, "USD");
        ASSERT_EQ(conversion.result.target, "INR");

        engine.flush_history();
        auto const history = engine.history();
        ASSERT_EQ(history.size(), 1u);
        ASSERT_EQ(history[0].result, 8300.0);
        ASSERT_EQ(engine.unsaved(), 0u);
    }

    ASSERT_EQ(saved_rows(), 1);
    ASSERT_EQ(fetches.load(), 1u);
}

TEST(Core, PersistenceFailureKeepsResult_Test)
{
    reset_database(true);

    std::atomic<uint32_t> fetches = 0;
    Core engine(test_settings(), static_rates(fetches));

    Conversion conversion{};
    ASSERT_NO_THROW(conversion = engine.convert({.amount = 100, .source = "USD", .target = "INR"}));
    ASSERT_EQ(conversion.error_code, core::ErrorCode::Success);
    ASSERT_EQ(conversion.result.result, 8300.0);
    ASSERT_EQ(engine.unsaved(), 1u);

    // The next interaction is unaffected.
    conversion = engine.convert({.amount = 83, .source = "INR", .target = "USD"});
    ASSERT_EQ(conversion.error_code, core::ErrorCode::Success);
    ASSERT_DOUBLE_EQ(conversion.result.result, 1.0);
    ASSERT_EQ(engine.unsaved(), 2u);

    engine.flush_history();
    ASSERT_EQ(engine.history().size(), 2u);
}

TEST(Core, FailedConversionNotRecorded_Test)
{
    reset_database(false);

    std::atomic<uint32_t> fetches = 0;
    {
        Core engine(test_settings(), static_rates(fetches));

        ASSERT_EQ(engine.convert({.amount = -5, .source = "USD", .target = "INR"}).error_code,
                  core::ErrorCode::InvalidAmount);
        ASSERT_EQ(fetches.load(), 0u);

        ASSERT_EQ(engine.convert({.amount = 5, .source = "USD", .target = "XXX"}).error_code,
                  core::ErrorCode::UnknownCurrency);

        engine.flush_history();
        ASSERT_TRUE(engine.history().empty());
    }

    ASSERT_EQ(saved_rows(), 0);
}

TEST(Core, AsyncConvert_Test)
{
    reset_database(true);

    std::atomic<uint32_t> fetches = 0;
    Core engine(test_settings(), static_rates(fetches));

    std::promise<Conversion> promise;
    auto future = promise.get_future();
    engine.async_convert({.amount = 10, .source = "EUR", .target = "USD"},
                       [&promise](Conversion const& conversion) { promise.set_value(conversion); });

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto const conversion = future.get();
    ASSERT_EQ(conversion.error_code, core::ErrorCode::Success);
    ASSERT_DOUBLE_EQ(conversion.result.result, 10 / 0.9);
    ASSERT_EQ(engine.unsaved(), 1u);
}

TEST(Core, AbandonedConversionNotRecorded_Test)
{
    reset_database(false);

    std::atomic<uint32_t> fetches = 0;
    std::atomic<bool> delivered = false;
    {
        Core engine(test_settings(), static_rates(fetches));

        auto claim = std::make_shared<std::atomic<bool>>(true);
        engine.async_convert({.amount = 100, .source = "USD", .target = "INR"},
                             [&delivered](Conversion const&) { delivered = true; }, claim);
    }

    ASSERT_FALSE(delivered.load());
    ASSERT_EQ(fetches.load(), 1u);
    ASSERT_EQ(saved_rows(), 0);
}

TEST(Core, ClaimedByCompletion_Test)
{
    reset_database(false);

    std::atomic<uint32_t> fetches = 0;
    Core engine(test_settings(), static_rates(fetches));

    std::promise<Conversion> promise;
    auto future = promise.get_future();
    auto claim = std::make_shared<std::atomic<bool>>(false);
    engine.async_convert({.amount = 100, .source = "USD", .target = "INR"},
                         [&promise](Conversion const& conversion) { promise.set_value(conversion); }, claim);

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_EQ(future.get().error_code, core::ErrorCode::Success);
    ASSERT_TRUE(claim->load());
    ASSERT_EQ(saved_rows(), 1);
}

TEST(Core, Currencies_Test)
{
    reset_database(false);

    std::atomic<uint32_t> fetches = 0;
    Core engine(test_settings(), static_rates(fetches));

    std::vector<std::string> codes;
    ASSERT_EQ(engine.currencies(codes), core::ErrorCode::Success);
    ASSERT_EQ(codes, (std::vector<std::string>{"EUR", "INR", "USD"}));
}

TEST(Core, InvalidEndpoint_Test)
{
    Settings settings = test_settings();
    settings.host = "exchangerate.host";
    ASSERT_THROW(Core engine(settings), std::invalid_argument);
}
