#pragma once

#include <vector>

#include "escrowbook/ledger.hpp"
#include "escrowbook/types.hpp"

namespace escrowbook {

class Pair;

/**
 * Settlement loop run after every insertion into a Pair.
 *
 * Each iteration extracts the best bid and the best ask. If they do not
 * cross both go back and the loop stops: the best bid is globally highest
 * and the best ask globally lowest, so no other pair can cross either.
 * Otherwise the trade settles at the resting ask price:
 *
 *     value_b  = bid.quantity * ask_price          (checked)
 *     match_b  = min(value_b, ask.quantity)
 *     match_a  = match_b / ask_price               (floor)
 *
 * match_a of asset A goes to the ask's beneficiary, match_b of asset B to
 * the bid's beneficiary, and non-zero remainders are reinserted with their
 * original sequence. Every crossing iteration empties at least one of the
 * two orders, so the loop terminates.
 */
class MatchingEngine
{
public:
    /// Match until the book no longer crosses. Returns the trades in
    /// execution order. Throws ArithmeticOverflow if bid.quantity * ask_price
    /// does not fit in 64 bits.
    static std::vector<Trade> run(Pair& pair, Ledger& ledger);
};

} // namespace escrowbook
