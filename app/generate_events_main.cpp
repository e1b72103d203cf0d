#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Random replay file for a single pair "SUI/USDC" (asset A = USDC,
// asset B = SUI). Every trader is funded with both assets up front.
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: escrowbook_generate <num_events> <seed> [num_traders]\n";
        return 1;
    }

    const std::size_t   num_events  = static_cast<std::size_t>(std::stoull(argv[1]));
    const std::uint32_t seed        = static_cast<std::uint32_t>(std::stoul(argv[2]));
    const std::size_t   num_traders = (argc > 3) ? static_cast<std::size_t>(std::stoull(argv[3])) : 8;

    if (num_traders == 0) {
        std::cerr << "num_traders must be > 0\n";
        return 1;
    }

    std::mt19937_64 rng(seed);

    // 0..49 -> BID, 50..99 -> ASK
    std::uniform_int_distribution<int>           side_dist(0, 99);
    std::uniform_int_distribution<std::uint64_t> price_dist(95, 105);
    std::uniform_int_distribution<std::uint64_t> qty_dist(1, 50);
    std::uniform_int_distribution<std::size_t>   trader_dist(0, num_traders - 1);

    std::vector<std::string> traders;
    traders.reserve(num_traders);
    for (std::size_t i = 0; i < num_traders; ++i) {
        traders.push_back("trader" + std::to_string(i));
    }

    std::cout << "# type,pair,price,qty,payer[,beneficiary]\n";
    std::cout << "PAIR,SUI/USDC,USDC,SUI\n";

    // Enough to cover every order a trader could place.
    const std::uint64_t funding_a = static_cast<std::uint64_t>(num_events) * 50 + 1;
    const std::uint64_t funding_b = funding_a * 105;
    for (const auto& t : traders) {
        std::cout << "FUND,USDC," << t << "," << funding_a << "\n";
        std::cout << "FUND,SUI," << t << "," << funding_b << "\n";
    }

    for (std::size_t i = 0; i < num_events; ++i) {
        const bool  bid   = side_dist(rng) < 50;
        const auto& payer = traders[trader_dist(rng)];
        const auto  price = price_dist(rng);

        // Asks escrow asset B, so scale their size by price to keep the two
        // sides of comparable value.
        const auto qty = bid ? qty_dist(rng) : qty_dist(rng) * price;

        std::cout << (bid ? "BID" : "ASK") << ",SUI/USDC," << price << "," << qty << ","
                  << payer << "\n";
    }

    return 0;
}
