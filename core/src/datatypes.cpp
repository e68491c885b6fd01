#include "datatypes.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <utility>

namespace core {

    namespace {

        bool isPositiveFinite(double v) {
            return std::isfinite(v) && v > 0.0;
        }

    } // end anonymous namespace

    OrderRequest::OrderRequest(std::string symbol_,
                               OrderSide side_,
                               double quantity_,
                               OrderType order_type_,
                               std::optional<double> limit_price_,
                               std::optional<double> stop_price_)
        : symbol(std::move(symbol_)),
          side(side_),
          quantity(quantity_),
          order_type(order_type_),
          limit_price(limit_price_),
          stop_price(stop_price_)
    {
        if (symbol.empty()) {
            throw OrderValidationException("Order symbol cannot be empty.");
        }
        if (!isPositiveFinite(quantity)) {
            throw OrderValidationException(fmt::format("Order quantity must be positive, got {} for {}.", quantity, symbol));
        }

        bool needs_limit = (order_type == OrderType::Limit || order_type == OrderType::StopLimit);
        bool needs_stop = (order_type == OrderType::Stop || order_type == OrderType::StopLimit);

        if (needs_limit && (!limit_price || !isPositiveFinite(*limit_price))) {
            throw OrderValidationException(fmt::format("{} order for {} requires a positive limit price.",
                                                       utils::toString(order_type), symbol));
        }
        if (needs_stop && (!stop_price || !isPositiveFinite(*stop_price))) {
            throw OrderValidationException(fmt::format("{} order for {} requires a positive stop price.",
                                                       utils::toString(order_type), symbol));
        }
    }

} // namespace core
