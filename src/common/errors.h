#pragma once

#include <stdexcept>
#include <string>

namespace common {

// Raised before any order is submitted when caller input cannot be accepted.
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Quantity outside the symbol's [minQty, maxQty] or not a multiple of its step.
class InvalidQuantity : public ValidationError {
public:
    using ValidationError::ValidationError;
};

// The exchange cannot be reached at startup; nothing may run afterwards.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace common
