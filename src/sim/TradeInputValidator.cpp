#include "sim/TradeInputValidator.hpp"

#include <utility>

#include <boost/algorithm/string.hpp>

#include "orderbook/OrderBookUtils.hpp"

namespace tcsim {
    namespace {
        void addError(std::vector<FieldError> &errors, std::string field, const std::string &label,
                      const std::string &reason) {
            errors.push_back({std::move(field), "Invalid " + label + ": " + reason});
        }
    }

    ValidationResult TradeInputValidator::validate(const TradeInputs &in) const {
        ValidationResult out;
        TradeRequest req;

        req.asset = boost::algorithm::trim_copy(in.asset);
        if (req.asset.empty())
            addError(out.errors, "asset", "asset", "Asset must not be empty");

        req.order_type = parse_order_type(in.order_type);
        if (req.order_type == OrderType::UNKNOWN)
            addError(out.errors, "order_type", "order type",
                     "Unknown order type '" + in.order_type + "'");

        if (const auto side = parse_side(in.side)) {
            req.side = *side;
        } else {
            addError(out.errors, "side", "side", "Side must be 'buy' or 'sell'");
        }

        if (const auto qty = parseDecimal(boost::algorithm::trim_copy(in.quantity))) {
            req.quantity = *qty;
            if (req.quantity <= 0.0)
                addError(out.errors, "quantity", "quantity", "Quantity must be positive");
        } else {
            addError(out.errors, "quantity", "quantity", "Quantity must be a number");
        }

        req.fee_tier = boost::algorithm::trim_copy(in.fee_tier);

        if (const auto tol = parseDecimal(boost::algorithm::trim_copy(in.slippage_tolerance))) {
            req.slippage_tolerance_pct = *tol;
            if (req.slippage_tolerance_pct < 0.0)
                addError(out.errors, "slippage_tolerance", "slippage tolerance",
                         "Slippage tolerance cannot be negative");
        } else {
            addError(out.errors, "slippage_tolerance", "slippage tolerance",
                     "Slippage tolerance must be a number");
        }

        if (const auto vol = parseDecimal(boost::algorithm::trim_copy(in.volatility))) {
            req.volatility = *vol;
            if (req.volatility < 0.0)
                addError(out.errors, "volatility", "volatility", "Volatility cannot be negative");
        } else {
            addError(out.errors, "volatility", "volatility", "Volatility must be a number");
        }

        if (out.errors.empty()) out.request = std::move(req);
        return out;
    }
} // namespace tcsim
