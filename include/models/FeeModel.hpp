#pragma once

#include <span>
#include <string>
#include <string_view>

namespace tcsim {
    /// Rates are fractions of notional (0.001 = 10 bp).
    struct FeeTier {
        std::string_view id;
        std::string_view label;
        double maker_rate;
        double taker_rate;
    };

    struct FeeBreakdown {
        std::string tier;
        double maker_rate{0.0};
        double taker_rate{0.0};
        double maker_notional{0.0};
        double taker_notional{0.0};
        double maker_fee{0.0};
        double taker_fee{0.0};
        double total{0.0};
        double fee_pct{0.0}; ///< total / notional * 100, 0 when notional is 0
    };

    /**
     * Rule-based fee schedule (OKX spot VIP 0..2 plus a custom bracket).
     *
     * A tier is found by id ("Tier 2") or display label ("Tier 2 (0.08%)").
     * Unknown identifiers fall back to kDefaultTier with a warning.
     */
    class FeeModel {
    public:
        static constexpr std::string_view kDefaultTier = "Tier 1";

        static std::span<const FeeTier> tiers() noexcept;

        /// Exact lookup; nullptr when unknown.
        static const FeeTier *find_tier(std::string_view id) noexcept;

        /// Lookup with fallback to the default tier.
        static const FeeTier &resolve_tier(std::string_view id);

        /// maker_ratio is clamped to [0, 1].
        [[nodiscard]] FeeBreakdown calculate(double notional, double maker_ratio, std::string_view tier) const;
    };
} // namespace tcsim
