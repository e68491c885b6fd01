#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <map>    // For position maps
#include <optional> // For optional order prices / fill fields
#include <cstdint>

namespace core {

    // Using system_clock for time points, can be adjusted if needed
    using Timestamp = std::chrono::system_clock::time_point;
    using Duration = std::chrono::system_clock::duration;


    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    enum class OrderSide {
        Buy,
        Sell
    };

    enum class OrderType {
        Market,
        Limit,
        Stop,
        StopLimit
    };

    enum class OrderStatus {
        Pending,
        Filled,
        Rejected,
        Cancelled
    };

    // A strategy's request for an order. Validated on construction, so an
    // OrderRequest that exists is always structurally sound.
    struct OrderRequest {
        OrderRequest(std::string symbol,
                     OrderSide side,
                     double quantity,
                     OrderType order_type = OrderType::Market,
                     std::optional<double> limit_price = std::nullopt,
                     std::optional<double> stop_price = std::nullopt);

        std::string symbol;
        OrderSide side;
        double quantity;
        OrderType order_type;
        std::optional<double> limit_price; // Required for Limit / StopLimit
        std::optional<double> stop_price;  // Required for Stop / StopLimit
    };

    struct Order {
        std::uint64_t id = 0;
        std::string symbol;
        OrderSide side = OrderSide::Buy;
        OrderType order_type = OrderType::Market;
        double quantity = 0.0;
        std::optional<double> limit_price;
        std::optional<double> stop_price;
        Timestamp timestamp;              // Engine clock when the order was placed
        OrderStatus status = OrderStatus::Pending;
        bool stop_triggered = false;      // StopLimit: stop condition already hit
        // Set on fill
        std::optional<double> filled_price;
        double filled_quantity = 0.0;
        double commission = 0.0;
        double slippage = 0.0;

        bool isPending() const { return status == OrderStatus::Pending; }
    };

    struct Position {
        std::string symbol;
        double quantity = 0.0;        // Long-only, never negative
        double entry_price = 0.0;     // Volume weighted average cost
        double current_price = 0.0;   // Last mark
        Timestamp entry_time;         // First open, not updated on adds
        double unrealized_pnl = 0.0;
        double realized_pnl = 0.0;

        double marketValue() const { return quantity * current_price; }
    };

    using PositionMap = std::map<std::string, Position>;

    // One SELL fill against an open position
    struct Trade {
        std::string symbol;
        OrderSide side = OrderSide::Sell;
        Timestamp entry_time;
        Timestamp exit_time;
        double entry_price = 0.0;
        double exit_price = 0.0;
        double quantity = 0.0;
        double pnl = 0.0;           // Net of exit commission
        double pnl_percent = 0.0;   // (exit / entry - 1) * 100
        double commission = 0.0;
        Duration duration{};
    };

    // Portfolio state recorded once per simulated timestamp
    struct PortfolioSnapshot {
        Timestamp timestamp;
        double cash = 0.0;
        double portfolio_value = 0.0;
        std::size_t positions = 0;
        std::size_t num_trades = 0;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
