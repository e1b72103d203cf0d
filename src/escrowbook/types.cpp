#include "escrowbook/types.hpp"

#include "escrowbook/error.hpp"

namespace escrowbook {

const char* to_string(Side side) noexcept
{
    return side == Side::Bid ? "bid" : "ask";
}

const char* to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::ZeroQuantity:       return "ZeroQuantity";
    case ErrorKind::InvalidPrice:       return "InvalidPrice";
    case ErrorKind::ArithmeticOverflow: return "ArithmeticOverflow";
    case ErrorKind::InsufficientFunds:  return "InsufficientFunds";
    case ErrorKind::PairNotFound:       return "PairNotFound";
    case ErrorKind::InvariantViolation: return "InvariantViolation";
    case ErrorKind::Config:             return "Config";
    }
    return "Unknown";
}

} // namespace escrowbook
