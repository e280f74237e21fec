#include "strategy/validation.h"

#include <cctype>
#include <cmath>
#include <sstream>

#include "common/errors.h"
#include "common/logging.h"

namespace strategy {
namespace {
constexpr double kStepTolerance = 1e-6;

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}
}  // namespace

std::string normalizeSymbol(const std::string& symbol) {
    std::string result;
    result.reserve(symbol.size());
    for (unsigned char c : symbol) {
        if (!std::isspace(c)) {
            result.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    return result;
}

Validator::Validator(exchange::ExchangeClient& client, const SymbolRules& rules)
    : client_(client), rules_(rules) {}

bool Validator::validateSymbol(const std::string& symbol) const {
    try {
        const auto filters = client_.getSymbolFilters(symbol);
        const bool valid = filters && filters->trading;
        LOG_INFO("Symbol validation: " + symbol + " -> " + (valid ? "Valid" : "Invalid"));
        return valid;
    } catch (const exchange::ExchangeError& ex) {
        LOG_ERROR("Error validating symbol " + symbol + ": " + ex.what());
        return false;
    }
}

void Validator::requireSymbol(const std::string& symbol) const {
    if (symbol.empty() || !validateSymbol(symbol)) {
        throw common::ValidationError("Invalid symbol: " + symbol);
    }
}

void Validator::validateQuantity(const std::string& symbol, double quantity) const {
    try {
        checkQuantity(rules_.filtersFor(symbol), quantity);
    } catch (const common::InvalidQuantity& ex) {
        LOG_ERROR(std::string("Quantity validation failed: ") + ex.what());
        throw;
    }
    LOG_INFO("Quantity validation passed: " + formatNumber(quantity));
}

void Validator::checkQuantity(const exchange::SymbolFilters& filters, double quantity) {
    if (!(quantity > 0.0)) {
        throw common::InvalidQuantity("Invalid quantity: " + formatNumber(quantity) + " must be positive");
    }
    if (quantity < filters.minQty - kStepTolerance * filters.stepSize ||
        quantity > filters.maxQty + kStepTolerance * filters.stepSize) {
        throw common::InvalidQuantity("Invalid quantity: " + formatNumber(quantity) + " outside allowed range [" +
                                      formatNumber(filters.minQty) + ", " + formatNumber(filters.maxQty) + "]");
    }
    if (filters.stepSize > 0.0) {
        const double steps = (quantity - filters.minQty) / filters.stepSize;
        if (std::fabs(steps - std::round(steps)) > kStepTolerance) {
            throw common::InvalidQuantity("Invalid quantity: " + formatNumber(quantity) +
                                          " doesn't comply with step size " + formatNumber(filters.stepSize));
        }
    }
}

void Validator::requirePositivePrice(const std::string& name, double price) {
    if (!(price > 0.0)) {
        throw common::ValidationError(name + " must be positive, got " + formatNumber(price));
    }
}

}  // namespace strategy
