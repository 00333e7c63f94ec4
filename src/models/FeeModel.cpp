#include "models/FeeModel.hpp"

#include <algorithm>
#include <array>
#include <iostream>

namespace tcsim {
    namespace {
        // https://www.okx.com/help-center/gettingStarted/spot-trading-fee-rates
        constexpr std::array<FeeTier, 4> kFeeTiers{{
            {"Tier 1", "Tier 1 (0.1%)", 0.0008, 0.0010}, // VIP 0
            {"Tier 2", "Tier 2 (0.08%)", 0.0006, 0.0008}, // VIP 1
            {"Tier 3", "Tier 3 (0.05%)", 0.0004, 0.0005}, // VIP 2
            {"Custom", "Custom", 0.0002, 0.0003},
        }};
    }

    std::span<const FeeTier> FeeModel::tiers() noexcept {
        return kFeeTiers;
    }

    const FeeTier *FeeModel::find_tier(std::string_view id) noexcept {
        for (const FeeTier &t: kFeeTiers) {
            if (t.id == id || t.label == id) return &t;
        }
        return nullptr;
    }

    const FeeTier &FeeModel::resolve_tier(std::string_view id) {
        if (const FeeTier *t = find_tier(id)) return *t;

        std::cerr << "[FeeModel] Unknown fee tier: '" << id << "'. Using " << kDefaultTier << " as default.\n";
        return *find_tier(kDefaultTier);
    }

    FeeBreakdown FeeModel::calculate(double notional, double maker_ratio, std::string_view tier) const {
        const FeeTier &t = resolve_tier(tier);
        const double ratio = std::clamp(maker_ratio, 0.0, 1.0);

        FeeBreakdown out;
        out.tier = std::string(t.id);
        out.maker_rate = t.maker_rate;
        out.taker_rate = t.taker_rate;
        out.maker_notional = notional * ratio;
        out.taker_notional = notional * (1.0 - ratio);
        out.maker_fee = out.maker_notional * t.maker_rate;
        out.taker_fee = out.taker_notional * t.taker_rate;
        out.total = out.maker_fee + out.taker_fee;
        out.fee_pct = notional > 0.0 ? out.total / notional * 100.0 : 0.0;
        return out;
    }
} // namespace tcsim
