#include "strategy/types.h"

#include <algorithm>
#include <cctype>

namespace strategy {

const char* toString(GridStatus status) {
    return status == GridStatus::Active ? "ACTIVE" : "STOPPED";
}

const char* toString(GridLevelRole role) {
    switch (role) {
        case GridLevelRole::Buy:
            return "BUY";
        case GridLevelRole::Sell:
            return "SELL";
        case GridLevelRole::Reference:
        default:
            return "CURRENT";
    }
}

const char* toString(TwapStatus status) {
    switch (status) {
        case TwapStatus::Active:
            return "ACTIVE";
        case TwapStatus::Completed:
            return "COMPLETED";
        case TwapStatus::Failed:
            return "FAILED";
        case TwapStatus::Canceled:
            return "CANCELED";
        case TwapStatus::Error:
        default:
            return "ERROR";
    }
}

const char* toString(TwapChunkStatus status) {
    switch (status) {
        case TwapChunkStatus::Pending:
            return "PENDING";
        case TwapChunkStatus::Executed:
            return "EXECUTED";
        case TwapChunkStatus::Failed:
        default:
            return "FAILED";
    }
}

const char* toString(PositionSide side) {
    return side == PositionSide::Long ? "LONG" : "SHORT";
}

const char* toString(OcoStatus status) {
    return status == OcoStatus::Active ? "ACTIVE" : "RESOLVED";
}

const char* toString(OcoLeg leg) {
    return leg == OcoLeg::TakeProfit ? "TAKE_PROFIT" : "STOP_LOSS";
}

std::optional<PositionSide> parsePositionSide(const std::string& text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "LONG") {
        return PositionSide::Long;
    }
    if (upper == "SHORT") {
        return PositionSide::Short;
    }
    return std::nullopt;
}

}  // namespace strategy
