#pragma once

#include <memory>
#include <utility>

#include "orderbook/OrderBookSnapshot.hpp"

namespace tcsim {
    /**
     * @brief Read-only access to the most recently published order book.
     *
     * Implementations must return a fully constructed snapshot (never null) and
     * must never mutate a snapshot after handing it out.
     */
    struct ISnapshotSource {
        virtual ~ISnapshotSource() = default;

        [[nodiscard]] virtual std::shared_ptr<const OrderBookSnapshot> snapshot() const = 0;
    };

    /// Serves one fixed snapshot. Used for replaying captured books and in tests.
    class StaticSnapshotSource final : public ISnapshotSource {
    public:
        explicit StaticSnapshotSource(OrderBookSnapshot snap)
            : snap_(std::make_shared<const OrderBookSnapshot>(std::move(snap))) {
        }

        [[nodiscard]] std::shared_ptr<const OrderBookSnapshot> snapshot() const override { return snap_; }

    private:
        std::shared_ptr<const OrderBookSnapshot> snap_;
    };
} // namespace tcsim
