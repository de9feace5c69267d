#ifndef ZAP_EVENTS_HPP
#define ZAP_EVENTS_HPP

#include <vector>
#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace zap {

// =============================================================================
// Events (the durable record of every completed operation)
// =============================================================================

struct SwapExecuted {
    Address caller;
    AssetId token;
    Amount base_spent;
    Amount token_received;
};

struct LiquidityAdded {
    Address caller;
    AssetId token;
    Amount token_deposited;
    Amount base_deposited;
    Amount liquidity_received;
};

class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void on_swap(const SwapExecuted& event) = 0;
    virtual void on_liquidity(const LiquidityAdded& event) = 0;
};

// Keeps every event in memory and logs it as a JSON line
class EventLog : public IEventSink {
public:
    void on_swap(const SwapExecuted& event) override;
    void on_liquidity(const LiquidityAdded& event) override;

    const std::vector<SwapExecuted>& swaps() const { return swaps_; }
    const std::vector<LiquidityAdded>& deposits() const { return deposits_; }

    void clear() {
        swaps_.clear();
        deposits_.clear();
    }

private:
    std::vector<SwapExecuted> swaps_;
    std::vector<LiquidityAdded> deposits_;
};

// JSON encoding: amounts as decimal strings, addresses as 0x hex
void to_json(nlohmann::json& j, const SwapExecuted& e);
void to_json(nlohmann::json& j, const LiquidityAdded& e);
void to_json(nlohmann::json& j, const SettlementResult& r);

} // namespace zap

#endif // ZAP_EVENTS_HPP
