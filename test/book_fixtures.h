#pragma once
#include "orderbook/OrderBookSnapshot.hpp"

namespace tcsim::test {

/// Small BTC-USDT-SWAP book used across the estimator and pipeline tests.
///   asks: 29880 x 1.5, 29881.5 x 0.75, 29883 x 2.1
///   bids: 29875 x 1.2, 29873.5 x 0.85
inline OrderBookSnapshot fixtureBook() {
    return OrderBookSnapshot(
        {{29880.0, 1.5}, {29881.5, 0.75}, {29883.0, 2.1}},
        {{29875.0, 1.2}, {29873.5, 0.85}});
}

inline OrderBookSnapshot emptyBook() {
    return OrderBookSnapshot({}, {});
}

} // namespace tcsim::test
