#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <limits>

#include "md/BookFeedAdapter.hpp"
#include "orderbook/OrderBookUtils.hpp"
#include "utils/DebugConfigUtils.hpp"

using json = nlohmann::json;

namespace tcsim {
    namespace {
        std::optional<double> numberOf(const json &v) {
            if (v.is_string()) return parseDecimal(v.get_ref<const std::string &>());
            if (v.is_number()) return v.get<double>();
            return std::nullopt;
        }

        /// ["29880.0","1.5"] or [29880.0, 1.5]; OKX appends two more columns we do not use.
        bool parseLevels2col(const json &arr, BookSide &out) {
            out.clear();
            if (!arr.is_array()) return false;
            out.reserve(arr.size());
            for (const auto &lvl: arr) {
                if (!lvl.is_array() || lvl.size() < 2) continue;
                const auto px = numberOf(lvl[0]);
                const auto sz = numberOf(lvl[1]);
                if (!px || !sz) return false;
                out.push_back(PriceLevel{*px, *sz});
            }
            return true;
        }

        /// 2^63 is exact as a double; int64 max is not, so the upper bound is exclusive.
        std::optional<std::int64_t> toMillis(double v) {
            constexpr double kLo = static_cast<double>(std::numeric_limits<std::int64_t>::min());
            constexpr double kHi = -kLo;
            if (!std::isfinite(v) || v < kLo || v >= kHi) return std::nullopt;
            return static_cast<std::int64_t>(v);
        }

        std::optional<std::int64_t> timestampOf(const json &obj) {
            if (!obj.contains("ts")) return std::nullopt;
            const auto &ts = obj["ts"];
            if (ts.is_number_unsigned()) {
                const auto u = ts.get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
                return static_cast<std::int64_t>(u);
            }
            if (ts.is_number_integer()) return ts.get<std::int64_t>();
            if (ts.is_number_float()) return toMillis(ts.get<double>());
            if (ts.is_string()) {
                if (const auto v = parseDecimal(ts.get_ref<const std::string &>())) return toMillis(*v);
            }
            return std::nullopt;
        }

        const json *bookObject(const json &j) {
            if (j.contains("asks") && j.contains("bids")) return &j;

            if (j.contains("data") && j["data"].is_array() && !j["data"].empty()) {
                const auto &d0 = j["data"][0];
                if (d0.is_object() && d0.contains("asks") && d0.contains("bids")) return &d0;
            }
            return nullptr;
        }
    }

    FeedParseResult BookFeedAdapter::parse(std::string_view msg, BookFrame &out) const noexcept {
        out.reset();

        json j = json::parse(msg.begin(), msg.end(), nullptr, false);
        if (j.is_discarded()) return FeedParseResult::MALFORMED;

        if (!j.is_object()) return FeedParseResult::MISSING_FIELDS;

        try {
            const json *book = bookObject(j);
            if (!book) return FeedParseResult::MISSING_FIELDS;

            if (!parseLevels2col((*book)["asks"], out.asks)) return FeedParseResult::MALFORMED;
            if (!parseLevels2col((*book)["bids"], out.bids)) return FeedParseResult::MALFORMED;

            out.exchange_ts_ms = timestampOf(*book);
        } catch (const json::exception &e) {
            if (debug::dbg_on()) std::cerr << "[BookFeedAdapter] unexpected frame layout: " << e.what() << "\n";
            out.reset();
            return FeedParseResult::MALFORMED;
        }

        return FeedParseResult::OK;
    }
} // namespace tcsim
