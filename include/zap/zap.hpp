#ifndef ZAP_ZAP_HPP
#define ZAP_ZAP_HPP

// =============================================================================
// LX Zap - exact-output swap and single-call liquidity deposit
//
//   pricing         constant-product formulas (0.3% fee)
//   ReserveOracle   pair lookup, reserves in requested order
//   SwapExecutor    wrap, pay in, low-level pair swap
//   QuoteService    read-only cost estimates
//   LiquidityOrchestrator
//                   swap-only and swap-and-deposit settlement
//   sim             in-memory host for dry runs and tests
//
// =============================================================================

#include "types.hpp"
#include "error.hpp"
#include "uint256.hpp"
#include "interfaces.hpp"
#include "pricing.hpp"
#include "reserve_oracle.hpp"
#include "swap_executor.hpp"
#include "quote_service.hpp"
#include "events.hpp"
#include "reentrancy.hpp"
#include "orchestrator.hpp"
#include "config.hpp"
#include "log.hpp"
#include "sim.hpp"

#endif // ZAP_ZAP_HPP
