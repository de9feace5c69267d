// =============================================================================
// events.cpp - Event recording and JSON encoding
// =============================================================================

#include "zap/events.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace zap {

void EventLog::on_swap(const SwapExecuted& event) {
    swaps_.push_back(event);
    spdlog::info("SwapExecuted {}", nlohmann::json(event).dump());
}

void EventLog::on_liquidity(const LiquidityAdded& event) {
    deposits_.push_back(event);
    spdlog::info("LiquidityAdded {}", nlohmann::json(event).dump());
}

void to_json(nlohmann::json& j, const SwapExecuted& e) {
    j = nlohmann::json{
        {"caller", to_hex(e.caller)},
        {"token", to_hex(e.token)},
        {"base_spent", to_string(e.base_spent)},
        {"token_received", to_string(e.token_received)}
    };
}

void to_json(nlohmann::json& j, const LiquidityAdded& e) {
    j = nlohmann::json{
        {"caller", to_hex(e.caller)},
        {"token", to_hex(e.token)},
        {"token_deposited", to_string(e.token_deposited)},
        {"base_deposited", to_string(e.base_deposited)},
        {"liquidity_received", to_string(e.liquidity_received)}
    };
}

void to_json(nlohmann::json& j, const SettlementResult& r) {
    j = nlohmann::json{
        {"base_spent", to_string(r.base_spent)},
        {"token_deposited", to_string(r.token_deposited)},
        {"base_deposited", to_string(r.base_deposited)},
        {"liquidity_received", to_string(r.liquidity_received)}
    };
}

} // namespace zap
