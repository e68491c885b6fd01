#include "database_manager.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using test_helpers::bar;
using test_helpers::day;

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db.connect());
        ASSERT_TRUE(db.initializeSchema());
    }

    data::DatabaseManager db{":memory:"};
};

TEST_F(DatabaseManagerTest, SchemaInitializationIsRepeatable) {
    EXPECT_TRUE(db.isConnected());
    EXPECT_TRUE(db.initializeSchema());
    EXPECT_EQ(db.getPath(), ":memory:");
}

TEST_F(DatabaseManagerTest, SavedCandlesComeBackInOrder) {
    core::TimeSeries<core::Candle> candles{bar(2, 12), bar(0, 10), bar(1, 11)};
    ASSERT_TRUE(db.saveCandles(candles, "AAPL", "day"));

    auto loaded = db.queryCandles("AAPL", "day", day(0), day(2));
    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_EQ(loaded[0].timestamp, day(0));
    EXPECT_DOUBLE_EQ(loaded[0].close, 10.0);
    EXPECT_DOUBLE_EQ(loaded[0].high, 11.0);
    EXPECT_DOUBLE_EQ(loaded[0].low, 9.0);
    EXPECT_EQ(loaded[0].volume, 1000);
    EXPECT_EQ(loaded[2].timestamp, day(2));
}

TEST_F(DatabaseManagerTest, DuplicatesAreIgnored) {
    ASSERT_TRUE(db.saveCandles({bar(0, 10)}, "AAPL", "day"));
    ASSERT_TRUE(db.saveCandles({bar(0, 99), bar(1, 11)}, "AAPL", "day"));

    auto loaded = db.queryCandles("AAPL", "day", day(0), day(5));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_DOUBLE_EQ(loaded[0].close, 10.0); // First write wins
}

TEST_F(DatabaseManagerTest, QueryRangeIsInclusiveAndScoped) {
    ASSERT_TRUE(db.saveCandles(test_helpers::series({10, 11, 12, 13, 14}), "AAPL", "day"));
    ASSERT_TRUE(db.saveCandles(test_helpers::series({50, 51}), "AAPL", "1minute"));
    ASSERT_TRUE(db.saveCandles(test_helpers::series({70}), "MSFT", "day"));

    auto middle = db.queryCandles("AAPL", "day", day(1), day(3));
    ASSERT_EQ(middle.size(), 3u);
    EXPECT_DOUBLE_EQ(middle.front().close, 11.0);
    EXPECT_DOUBLE_EQ(middle.back().close, 13.0);

    EXPECT_EQ(db.queryCandles("AAPL", "1minute", day(0), day(9)).size(), 2u);
    EXPECT_TRUE(db.queryCandles("GOOGL", "day", day(0), day(9)).empty());
}

TEST_F(DatabaseManagerTest, UnparsableTimestampRowsAreSkipped) {
    ASSERT_TRUE(db.saveCandles({bar(0, 10)}, "AAPL", "day"));
    ASSERT_TRUE(db.executeSQL(
        "INSERT INTO historical_candles (symbol, interval, timestamp, open, high, low, close, volume) "
        "VALUES ('AAPL', 'day', '2023-01-03Tbroken', 1, 1, 1, 1, 1);"));

    auto loaded = db.queryCandles("AAPL", "day", day(0), day(5));
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_DOUBLE_EQ(loaded[0].close, 10.0);
}

TEST_F(DatabaseManagerTest, LoadMarketDataLeavesOutEmptySymbols) {
    ASSERT_TRUE(db.saveCandles(test_helpers::series({10, 11, 12}), "AAPL", "day"));
    ASSERT_TRUE(db.saveCandles(test_helpers::series({20, 21}), "GOOGL", "day"));

    auto market = db.loadMarketData({"AAPL", "GOOGL", "MSFT"}, "day", day(0), day(10));
    EXPECT_EQ(market.symbols(), (std::vector<std::string>{"AAPL", "GOOGL"}));
    EXPECT_EQ(market.size(), 5u);
    EXPECT_EQ(market.timestamps().size(), 3u);
}

TEST_F(DatabaseManagerTest, InvalidSqlFails) {
    EXPECT_FALSE(db.executeSQL("SELECT * FROM no_such_table;"));
}

TEST(DatabaseManagerDisconnectedTest, OperationsFailWithoutConnection) {
    data::DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());
    EXPECT_FALSE(db.initializeSchema());
    EXPECT_FALSE(db.executeSQL("SELECT 1;"));
    EXPECT_FALSE(db.saveCandles({bar(0, 10)}, "AAPL", "day"));
    EXPECT_TRUE(db.queryCandles("AAPL", "day", day(0), day(1)).empty());

    ASSERT_TRUE(db.connect());
    db.disconnect();
    EXPECT_FALSE(db.isConnected());
}
