#pragma once

#include "escrowbook/types.hpp"

#include <cstdint>
#include <string>

namespace escrowbook {

enum class EventType : std::uint8_t {
    Pair,   // PAIR,<name>,<asset_a>,<asset_b>
    Fund,   // FUND,<asset>,<account>,<amount>
    Bid,    // BID,<pair>,<price>,<qty>,<payer>[,<beneficiary>]
    Ask     // ASK,<pair>,<price>,<qty>,<payer>[,<beneficiary>]
};

// One line of a replay file.
struct Event {
    EventType   type        = EventType::Bid;
    std::string name;           // pair name (PAIR/BID/ASK) or asset (FUND)
    AssetId     asset_a;        // PAIR
    AssetId     asset_b;        // PAIR
    AccountId   account;        // payer (BID/ASK) or funded account (FUND)
    AccountId   beneficiary;    // BID/ASK, defaults to account
    Price       price       = 0;
    Quantity    qty         = 0;
};

} // namespace escrowbook
