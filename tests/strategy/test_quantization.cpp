#include "strategy/quantization.h"

#include <cmath>
#include <stdexcept>
#include <string>

#include "support/fake_exchange.h"
#include "support/test_helpers.h"

using test_support::Expect;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

bool TestRoundToTick() {
    if (!Expect(Near(strategy::roundToTick(45123.456, 0.1), 45123.5), "45123.456 should round to 45123.5")) {
        return false;
    }
    if (!Expect(Near(strategy::roundToTick(44444.444444, 0.1), 44444.4), "44444.444 should round to 44444.4")) {
        return false;
    }
    return true;
}

bool TestRoundingIsIdempotent() {
    const double increments[] = {0.1, 0.01, 0.001, 0.5, 0.25, 1.0};
    const double values[] = {0.0004, 0.0016, 0.3, 1.23456789, 3001.23456, 42000.04, 44444.444444, 45123.456,
                             99999.95, 123456.789};
    for (const double increment : increments) {
        for (const double value : values) {
            const double tick = strategy::roundToTick(value, increment);
            const double step = strategy::roundToStep(value, increment);
            if (strategy::roundToTick(tick, increment) != tick || strategy::roundToStep(step, increment) != step) {
                return Expect(false, "Rounding " + std::to_string(value) + " to " + std::to_string(increment) +
                                         " is not idempotent");
            }
        }
    }
    return true;
}

bool TestRoundToStep() {
    if (!Expect(Near(strategy::roundToStep(0.0016, 0.001), 0.002), "0.0016 should round to 0.002")) {
        return false;
    }
    // 0.1 + 0.2 == 0.30000000000000004
    const double value = strategy::roundToStep(0.1 + 0.2, 0.001);
    if (!Expect(value == strategy::roundDecimals(0.3), "Floating point drift not removed")) {
        return false;
    }
    return Expect(strategy::roundToStep(value, 0.001) == value, "roundToStep must be idempotent");
}

bool TestRejectsNonPositiveIncrement() {
    try {
        strategy::roundToTick(100.0, 0.0);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return Expect(false, "Zero tick size was accepted");
}

bool TestExchangeFiltersPreferred() {
    test_support::FakeExchange fake;
    fake.setFilters(exchange::SymbolFilters{"SOLUSDT", true, 0.001, 0.1, 0.1, 0.0, 0.0});
    strategy::SymbolRules rules(fake);

    const auto filters = rules.filtersFor("SOLUSDT");
    if (!Expect(Near(filters.tickSize, 0.001) && Near(filters.stepSize, 0.1), "Exchange filters not used")) {
        return false;
    }
    if (!Expect(Near(filters.maxQty, 100000.0), "Missing maxQty should come from the fallback")) {
        return false;
    }
    if (!Expect(Near(filters.minNotional, 100.0), "Missing minNotional should come from the fallback")) {
        return false;
    }
    return Expect(Near(rules.quantizePrice("SOLUSDT", 142.12345), 142.123), "Price not quantized to tick");
}

bool TestFallbackWhenLookupFails() {
    test_support::FakeExchange fake;
    fake.setFilterLookupFailure(true);
    strategy::SymbolRules rules(fake);

    const auto btc = rules.filtersFor("BTCUSDT");
    if (!Expect(Near(btc.tickSize, 0.10) && Near(btc.stepSize, 0.001), "BTCUSDT fallback tick/step wrong")) {
        return false;
    }
    if (!Expect(Near(rules.quantizePrice("BTCUSDT", 45000.04), 45000.0), "Fallback tick not applied")) {
        return false;
    }

    const auto eth = rules.filtersFor("ETHUSDT");
    if (!Expect(Near(eth.tickSize, 0.01), "ETHUSDT fallback tick wrong")) {
        return false;
    }
    return Expect(Near(rules.quantizeQuantity("ETHUSDT", 0.12345), 0.123), "Fallback step not applied");
}

bool TestFallbackForUnlistedSymbol() {
    test_support::FakeExchange fake;
    strategy::SymbolRules rules(fake);
    const auto filters = rules.filtersFor("DOGEUSDT");
    if (!Expect(Near(filters.tickSize, 0.01) && Near(filters.stepSize, 0.001), "Generic fallback wrong")) {
        return false;
    }
    return Expect(Near(filters.minNotional, 100.0), "Fallback minimum notional should be 100");
}

}  // namespace

int main() {
    if (!TestRoundToTick()) {
        return 1;
    }
    if (!TestRoundingIsIdempotent()) {
        return 1;
    }
    if (!TestRoundToStep()) {
        return 1;
    }
    if (!TestRejectsNonPositiveIncrement()) {
        return 1;
    }
    if (!TestExchangeFiltersPreferred()) {
        return 1;
    }
    if (!TestFallbackWhenLookupFails()) {
        return 1;
    }
    if (!TestFallbackForUnlistedSymbol()) {
        return 1;
    }
    return 0;
}
