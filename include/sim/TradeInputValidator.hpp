#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sim/TradeTypes.hpp"

namespace tcsim {
    /// Raw user-entered fields, exactly as typed.
    struct TradeInputs {
        std::string asset{"BTC-USDT-SWAP"};
        std::string order_type{"Market"};
        std::string side{"buy"};
        std::string quantity;
        std::string fee_tier{"Tier 1"};
        std::string slippage_tolerance{"0.5"};
        std::string volatility{"0.05"};
    };

    struct FieldError {
        std::string field;
        std::string message; ///< ready for display, e.g. "Invalid quantity: Quantity must be positive"
    };

    struct ValidationResult {
        std::optional<TradeRequest> request; ///< set only when errors is empty
        std::vector<FieldError> errors;

        [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
    };

    /**
     * Checks every field and reports all problems at once.
     *
     * Numbers must parse completely ("1.5x" is rejected). Fee tiers are not
     * checked here: FeeModel falls back to its default tier with a warning.
     */
    class TradeInputValidator {
    public:
        [[nodiscard]] ValidationResult validate(const TradeInputs &in) const;
    };
} // namespace tcsim
