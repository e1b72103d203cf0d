#include "escrowbook/ledger.hpp"
#include "escrowbook/pair.hpp"
#include "escrowbook/types.hpp"
#include "utils/benchmark.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <vector>

using namespace escrowbook;

struct OrderParams {
    Side     side;
    Price    price;
    Quantity qty;
};

static std::vector<OrderParams> make_orders(std::size_t n, std::mt19937_64& rng,
                                            Price lo, Price hi, bool bids_only)
{
    std::uniform_int_distribution<int>      side_dist(0, 1);
    std::uniform_int_distribution<Price>    price_dist(lo, hi);
    std::uniform_int_distribution<Quantity> qty_dist(1, 10);

    std::vector<OrderParams> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        Side  side  = (bids_only || side_dist(rng) == 0) ? Side::Bid : Side::Ask;
        Price price = price_dist(rng);
        Quantity qty = qty_dist(rng);
        if (side == Side::Ask)
            qty *= price;
        out.push_back(OrderParams{side, price, qty});
    }
    return out;
}

static void fund(InMemoryLedger& ledger)
{
    const Quantity plenty = std::numeric_limits<Quantity>::max() / 4;
    ledger.deposit("USDC", "maker", plenty);
    ledger.deposit("SUI", "maker", plenty);
    ledger.deposit("USDC", "taker", plenty);
    ledger.deposit("SUI", "taker", plenty);
}

int main(int argc, char** argv)
{
    std::size_t iterations = (argc > 1) ? std::stoull(argv[1]) : 200'000;
    std::size_t runs       = (argc > 2) ? std::stoull(argv[2]) : 5;
    std::size_t batch_size = (argc > 3) ? std::stoull(argv[3]) : 128;

    if (iterations == 0 || runs == 0) {
        std::cerr << "iterations and runs must be > 0\n";
        return 1;
    }

    const std::size_t warmup = iterations / 10;

    std::cout << "Config:\n"
              << "  iterations = " << iterations << "\n"
              << "  runs       = " << runs << "\n"
              << "  batch_size = " << batch_size << "\n"
              << "  warmup     = " << warmup << "\n\n";

    std::mt19937_64 rng(42);

    // Resting bids only: no crossing, measures insert + escrow cost.
    auto resting = make_orders(iterations, rng, 1, 1000, true);

    // Mixed sides around one price band: most submissions trade.
    auto mixed = make_orders(iterations, rng, 95, 105, false);

    auto submit = [](Pair& pair, InMemoryLedger& ledger, const OrderParams& p,
                     const AccountId& who) {
        if (p.side == Side::Bid)
            pair.submit_bid(ledger, p.price, who, p.qty);
        else
            pair.submit_ask(ledger, p.price, who, p.qty);
    };

    auto r_rest = bench::run_multi("submit_resting_bid", runs, [&](std::size_t) {
        InMemoryLedger ledger;
        fund(ledger);
        Pair pair(1, "USDC", "SUI");
        return bench::run_batched("submit_resting_bid", iterations, batch_size,
                                  [&](std::size_t i) { submit(pair, ledger, resting[i], "maker"); },
                                  warmup);
    });

    auto r_mixed = bench::run_multi("submit_mixed_crossing", runs, [&](std::size_t) {
        InMemoryLedger ledger;
        fund(ledger);
        Pair pair(1, "USDC", "SUI");
        return bench::run_batched("submit_mixed_crossing", iterations, batch_size,
                                  [&](std::size_t i) { submit(pair, ledger, mixed[i], "taker"); },
                                  warmup);
    });

    bench::print(r_rest);
    bench::print(r_mixed);
    return 0;
}
