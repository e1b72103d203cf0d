#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "utils/priority_queue.hpp"

namespace escrowbook {

using Price     = std::uint64_t;   // units of asset B per unit of asset A
using Quantity  = std::uint64_t;
using PairId    = std::uint64_t;
using Sequence  = std::uint64_t;
using AccountId = std::string;
using AssetId   = std::string;

using utils::Priority;

enum class Side : std::uint8_t {
    Bid,   // escrows asset A, highest price first
    Ask    // escrows asset B, lowest price first
};

const char* to_string(Side side) noexcept;

/// Heap key for a limit price. Bids use the price as is; asks use its
/// complement so that the max-heap yields the lowest ask first.
constexpr Priority to_priority(Side side, Price price) noexcept
{
    return side == Side::Bid ? price : std::numeric_limits<Priority>::max() - price;
}

/// Inverse of to_priority (the complement is its own inverse).
constexpr Price to_price(Side side, Priority priority) noexcept
{
    return side == Side::Bid ? priority : std::numeric_limits<Price>::max() - priority;
}

/// A resting order: what is still escrowed and who receives the counter-asset.
struct Offer {
    AccountId beneficiary;
    Quantity  quantity{0};
};

struct BestQuote {
    Price    price{};
    Quantity qty{};
    bool     valid{false};
};

struct Trade {
    PairId    pair{0};
    AccountId bid_beneficiary;   // receives quantity_b of asset B
    AccountId ask_beneficiary;   // receives quantity_a of asset A
    Price     bid_price{0};
    Price     price{0};          // execution price = resting ask price
    Quantity  quantity_a{0};
    Quantity  quantity_b{0};
    Quantity  dust_b{0};         // quantity_b - quantity_a * price, not refunded
    Sequence  bid_sequence{0};
    Sequence  ask_sequence{0};
};

struct SubmitResult {
    Side     side{Side::Bid};
    Sequence sequence{0};
    Quantity requested{0};
    Quantity filled{0};      // units of the submitted asset consumed by trades
    Quantity remaining{0};   // units still resting for this order
    std::vector<Trade> trades;
};

} // namespace escrowbook
