// tests/data/mock_shard_store.hpp
#pragma once

#include <gmock/gmock.h>
#include "histshard/data/shard_store.hpp"

namespace histshard {
namespace testing {

class MockShardStore : public ShardStore {
public:
    explicit MockShardStore(ShardDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

    MOCK_METHOD(Result<void>, open, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, is_open, (), (const, override));
    MOCK_METHOD(Result<std::unique_ptr<BarStream>>, scan_bars,
                (const std::string& symbol, const TimeRange& range), (override));
    MOCK_METHOD(Result<std::vector<OptionContract>>, list_contracts,
                (const std::string& underlying, const Timestamp& min_expiry), (override));
    MOCK_METHOD(Result<std::optional<OptionQuote>>, latest_quote,
                (const std::string& contract_id, const TimeRange& window), (override));
    MOCK_METHOD(Result<std::optional<Greeks>>, latest_greeks,
                (const std::string& contract_id, const TimeRange& window), (override));

    const ShardDescriptor& descriptor() const override {
        return descriptor_;
    }

private:
    ShardDescriptor descriptor_;
};

}  // namespace testing
}  // namespace histshard
