#include "modules/history_log.hpp"
#include "precompiled.hpp"
#include <fstream>
#include <gtest/gtest.h>

using namespace currex;

TEST(HistoryLog, Append_Test)
{
    modules::HistoryLog history_log(100, std::nullopt);
    ASSERT_TRUE(history_log.snapshot().empty());

    history_log.append({.amount = 100, .source = "USD", .target = "INR", .result = 8300});
    history_log.append({.amount = 1, .source = "EUR", .target = "USD", .result = 1.1});
    history_log.flush();

    auto const records = history_log.snapshot();
    ASSERT_EQ(records.size(), 2u);
    ASSERT_EQ(records[0].source, "USD");
    ASSERT_EQ(records[1].source, "EUR");
}

TEST(HistoryLog, KeepsMostRecent_Test)
{
    modules::HistoryLog history_log(2, std::nullopt);

    for (uint32_t const i : std::views::iota(1u, 6u))
    {
        history_log.append({.amount = double(i), .source = "USD", .target = "EUR", .result = i * 0.9});
    }
    history_log.flush();

    auto const records = history_log.snapshot();
    ASSERT_EQ(records.size(), 2u);
    ASSERT_EQ(records[0].amount, 4.0);
    ASSERT_EQ(records[1].amount, 5.0);
}

TEST(HistoryLog, SnapshotIsACopy_Test)
{
    modules::HistoryLog history_log(10, std::nullopt);
    history_log.append({.amount = 1, .source = "USD", .target = "EUR", .result = 0.9});

    auto records = history_log.snapshot();
    records.clear();

    history_log.flush();
    ASSERT_EQ(history_log.snapshot().size(), 1u);
}

TEST(HistoryLog, LoggedAtInfo_Test)
{
    std::filesystem::remove("history_test.log");
    {
        modules::HistoryLog history_log(10, "history_test.log");
        spdlog::get("history")->set_level(spdlog::level::info);

        history_log.append({.amount = 100, .source = "USD", .target = "INR", .result = 8300});
        history_log.flush();
    }

    std::ifstream file("history_test.log");
    std::stringstream contents;
    contents << file.rdbuf();
    ASSERT_NE(contents.str().find("Conversion history (1 entries)"), std::string::npos);
    ASSERT_NE(contents.str().find("100 USD -> 8300 INR"), std::string::npos);
}
