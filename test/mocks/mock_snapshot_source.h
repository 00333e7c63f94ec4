#pragma once
#include "abstract/SnapshotSource.hpp"
#include <gmock/gmock.h>

#include <memory>

namespace tcsim {

/// @brief GoogleMock test double for ISnapshotSource.
///        Lets a test hand the pipeline a different book per call, or count pulls.
class MockSnapshotSource : public ISnapshotSource {
public:
    /// @brief Latest published book (never null in production implementations).
    MOCK_METHOD(std::shared_ptr<const OrderBookSnapshot>, snapshot, (), (const, override));
};

} // namespace tcsim
