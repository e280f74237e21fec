#pragma once

#include <string>

#include "exchange/exchange_client.h"
#include "strategy/quantization.h"

namespace strategy {

// Upper-cases and trims a user supplied symbol.
std::string normalizeSymbol(const std::string& symbol);

// Preconditions shared by every strategy. Nothing here mutates state.
class Validator {
public:
    Validator(exchange::ExchangeClient& client, const SymbolRules& rules);

    // True iff the exchange currently lists |symbol| with trading status
    // active. Metadata is fetched on every call; lookup failures yield false.
    bool validateSymbol(const std::string& symbol) const;

    // Throws ValidationError when validateSymbol() is false.
    void requireSymbol(const std::string& symbol) const;

    // Throws InvalidQuantity when |quantity| is outside [minQty, maxQty] or
    // (quantity - minQty) is not a multiple of the step size.
    void validateQuantity(const std::string& symbol, double quantity) const;

    static void checkQuantity(const exchange::SymbolFilters& filters, double quantity);

    // Throws ValidationError unless |price| > 0.
    static void requirePositivePrice(const std::string& name, double price);

private:
    exchange::ExchangeClient& client_;
    const SymbolRules& rules_;
};

}  // namespace strategy
