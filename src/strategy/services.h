#pragma once

#include "exchange/exchange_client.h"
#include "strategy/clock.h"
#include "strategy/quantization.h"
#include "strategy/registry.h"
#include "strategy/validation.h"

namespace strategy {

// Collaborators every strategy engine needs. All references must outlive the
// engines built from them.
struct StrategyServices {
    exchange::ExchangeClient& client;
    const SymbolRules& rules;
    const Validator& validator;
    StrategyRegistry& registry;
    Clock& clock;
};

}  // namespace strategy
