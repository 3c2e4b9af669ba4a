#pragma once

#include "ports/output/IPriceFeed.hpp"
#include <gmock/gmock.h>

namespace ledger::tests {

class MockPriceFeed : public ports::output::IPriceFeed {
public:
    MOCK_METHOD(std::optional<domain::Decimal>, currentPrice, (const std::string& asset), (override));
};

} // namespace ledger::tests
