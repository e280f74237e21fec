#include "strategy/quantization.h"

#include <cmath>
#include <stdexcept>

#include "common/logging.h"

namespace strategy {
namespace {
double roundToIncrement(double value, double increment, const char* name) {
    if (!(increment > 0.0)) {
        throw std::invalid_argument(std::string(name) + " must be positive");
    }
    return roundDecimals(std::round(value / increment) * increment);
}
}  // namespace

double roundDecimals(double value, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

double roundToTick(double price, double tickSize) {
    return roundToIncrement(price, tickSize, "tick size");
}

double roundToStep(double quantity, double stepSize) {
    return roundToIncrement(quantity, stepSize, "step size");
}

SymbolRules::SymbolRules(exchange::ExchangeClient& client) : client_(client) {}

exchange::SymbolFilters SymbolRules::filtersFor(const std::string& symbol) const {
    try {
        const auto filters = client_.getSymbolFilters(symbol);
        if (filters && filters->tickSize > 0.0 && filters->stepSize > 0.0) {
            exchange::SymbolFilters resolved = *filters;
            const auto fallback = fallbackFilters(symbol);
            if (resolved.maxQty <= 0.0) {
                resolved.maxQty = fallback.maxQty;
            }
            if (resolved.minNotional <= 0.0) {
                resolved.minNotional = fallback.minNotional;
            }
            return resolved;
        }
        LOG_WARN("No usable exchange filters for " + symbol + "; using fallback tick/step sizes");
    } catch (const exchange::ExchangeError& ex) {
        LOG_WARN("Filter lookup for " + symbol + " failed (" + ex.what() + "); using fallback tick/step sizes");
    }
    return fallbackFilters(symbol);
}

double SymbolRules::quantizePrice(const std::string& symbol, double price) const {
    return roundToTick(price, filtersFor(symbol).tickSize);
}

double SymbolRules::quantizeQuantity(const std::string& symbol, double quantity) const {
    return roundToStep(quantity, filtersFor(symbol).stepSize);
}

exchange::SymbolFilters SymbolRules::fallbackFilters(const std::string& symbol) {
    exchange::SymbolFilters filters;
    filters.symbol = symbol;
    filters.trading = true;
    filters.stepSize = 0.001;
    filters.minQty = 0.001;
    filters.minNotional = 100.0;
    if (symbol == "BTCUSDT") {
        filters.tickSize = 0.10;
        filters.maxQty = 1000.0;
    } else if (symbol == "ETHUSDT") {
        filters.tickSize = 0.01;
        filters.maxQty = 10000.0;
    } else {
        filters.tickSize = 0.01;
        filters.maxQty = 100000.0;
    }
    return filters;
}

}  // namespace strategy
