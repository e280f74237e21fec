#pragma once

#include <string>

#include "exchange/exchange_client.h"

namespace strategy {

// Rounds to |places| decimals to strip binary floating point drift.
double roundDecimals(double value, int places = 8);

// Nearest multiple of |tickSize|, then rounded to 8 decimals. Idempotent.
// Throws std::invalid_argument when |tickSize| is not positive.
double roundToTick(double price, double tickSize);
double roundToStep(double quantity, double stepSize);

// Resolves per-symbol exchange filters. A failed lookup never fails the
// caller: the documented fallback for the symbol is used and a warning logged.
//
// Fallbacks (tick / step / minQty / maxQty / minNotional):
//   BTCUSDT  0.10 / 0.001 / 0.001 / 1000   / 100
//   ETHUSDT  0.01 / 0.001 / 0.001 / 10000  / 100
//   other    0.01 / 0.001 / 0.001 / 100000 / 100
class SymbolRules {
public:
    explicit SymbolRules(exchange::ExchangeClient& client);

    exchange::SymbolFilters filtersFor(const std::string& symbol) const;

    double quantizePrice(const std::string& symbol, double price) const;
    double quantizeQuantity(const std::string& symbol, double quantity) const;

    static exchange::SymbolFilters fallbackFilters(const std::string& symbol);

private:
    exchange::ExchangeClient& client_;
};

}  // namespace strategy
