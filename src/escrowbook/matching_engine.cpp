#include "escrowbook/matching_engine.hpp"

#include "escrowbook/error.hpp"
#include "escrowbook/log.hpp"
#include "escrowbook/pair.hpp"
#include "utils/checked_math.hpp"

#include <algorithm> // std::min
#include <string>
#include <utility>

namespace escrowbook {

std::vector<Trade> MatchingEngine::run(Pair& pair, Ledger& ledger)
{
    std::vector<Trade> trades;

    const Pair::Book& bids = pair.bids_;
    const Pair::Book& asks = pair.asks_;

    while (!bids.empty() && !asks.empty())
    {
        Pair::Entry ask = pair.take(Side::Ask);
        Pair::Entry bid = pair.take(Side::Bid);

        const Price ask_price = to_price(Side::Ask, ask.priority);
        const Price bid_price = to_price(Side::Bid, bid.priority);

        if (bid_price < ask_price)
        {
            pair.place(Side::Ask, std::move(ask));
            pair.place(Side::Bid, std::move(bid));
            break;
        }

        Quantity bid_value_b = 0;
        if (!utils::checked_mul(bid.payload.quantity, ask_price, bid_value_b))
        {
            ArithmeticOverflow err("bid quantity " + std::to_string(bid.payload.quantity) +
                                   " at ask price " + std::to_string(ask_price));
            pair.place(Side::Ask, std::move(ask));
            pair.place(Side::Bid, std::move(bid));
            throw err;
        }

        const Quantity match_b = std::min(bid_value_b, ask.payload.quantity);
        const Quantity match_a = match_b / ask_price;

        pair.pool_a_.release(match_a);
        pair.pool_b_.release(match_b);

        if (match_a > 0)
            ledger.deliver(pair.asset_a(), ask.payload.beneficiary, match_a);
        if (match_b > 0)
            ledger.deliver(pair.asset_b(), bid.payload.beneficiary, match_b);

        Trade tr;
        tr.pair            = pair.id();
        tr.bid_beneficiary = bid.payload.beneficiary;
        tr.ask_beneficiary = ask.payload.beneficiary;
        tr.bid_price       = bid_price;
        tr.price           = ask_price;
        tr.quantity_a      = match_a;
        tr.quantity_b      = match_b;
        tr.dust_b          = match_b - match_a * ask_price;
        tr.bid_sequence    = bid.sequence;
        tr.ask_sequence    = ask.sequence;

        ESCROWBOOK_LOG("pair " << tr.pair << " trade bid #" << tr.bid_sequence << " x ask #"
                       << tr.ask_sequence << " @" << tr.price << " a=" << tr.quantity_a
                       << " b=" << tr.quantity_b << " dust=" << tr.dust_b);

        trades.push_back(std::move(tr));

        bid.payload.quantity -= match_a;
        ask.payload.quantity -= match_b;

        if (bid.payload.quantity > 0)
            pair.place(Side::Bid, std::move(bid));
        if (ask.payload.quantity > 0)
            pair.place(Side::Ask, std::move(ask));
    }

    return trades;
}

} // namespace escrowbook
