#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "escrowbook/types.hpp"

namespace escrowbook {

enum class ErrorKind : std::uint8_t {
    ZeroQuantity,
    InvalidPrice,
    ArithmeticOverflow,
    InsufficientFunds,
    PairNotFound,
    InvariantViolation,
    Config
};

const char* to_string(ErrorKind kind) noexcept;

/// Base of every error raised by the engine. Thrown synchronously from the
/// call that triggered it; the engine never retries.
class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind)
    {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ZeroQuantity : public Error
{
public:
    explicit ZeroQuantity(Side side)
        : Error(ErrorKind::ZeroQuantity,
                std::string(to_string(side)) + " rejected: quantity must be positive")
    {}
};

class InvalidPrice : public Error
{
public:
    explicit InvalidPrice(Side side)
        : Error(ErrorKind::InvalidPrice,
                std::string(to_string(side)) + " rejected: price must be positive")
    {}
};

class ArithmeticOverflow : public Error
{
public:
    explicit ArithmeticOverflow(const std::string& what)
        : Error(ErrorKind::ArithmeticOverflow, "arithmetic overflow: " + what)
    {}
};

class InsufficientFunds : public Error
{
public:
    InsufficientFunds(const AssetId& asset, const AccountId& account,
                      Quantity available, Quantity requested)
        : Error(ErrorKind::InsufficientFunds,
                "insufficient " + asset + " for '" + account + "': have " +
                std::to_string(available) + ", need " + std::to_string(requested))
    {}
};

class PairNotFound : public Error
{
public:
    explicit PairNotFound(PairId id)
        : Error(ErrorKind::PairNotFound, "unknown pair id " + std::to_string(id))
    {}
};

class InvariantViolation : public Error
{
public:
    explicit InvariantViolation(const std::string& what)
        : Error(ErrorKind::InvariantViolation, "invariant violated: " + what)
    {}
};

class ConfigError : public Error
{
public:
    explicit ConfigError(const std::string& what)
        : Error(ErrorKind::Config, "config: " + what)
    {}
};

} // namespace escrowbook
