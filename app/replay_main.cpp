#include "escrowbook/config.hpp"
#include "escrowbook/error.hpp"
#include "escrowbook/exchange.hpp"
#include "escrowbook/ledger.hpp"
#include "escrowbook/replay.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <utility>

using namespace escrowbook;

static void print_quote(const char* label, const BestQuote& q)
{
    std::cout << "    " << label << ": ";
    if (q.valid)
        std::cout << q.price << " x " << q.qty << "\n";
    else
        std::cout << "none\n";
}

static void print_summary(const ReplayStats& st, const Replayer& replayer,
                          const Exchange& exchange, const InMemoryLedger& ledger)
{
    std::cout << "=== Replay summary ===\n\n";

    std::cout << "Lines    : " << st.lines << " (skipped " << st.skipped << ")\n";
    std::cout << "Pairs    : " << st.pairs_created << " created by events\n";
    std::cout << "Fundings : " << st.fundings << "\n";
    std::cout << "Bids     : " << st.bids << "\n";
    std::cout << "Asks     : " << st.asks << "\n\n";

    std::cout << "Trades   : " << st.trades << "\n";
    std::cout << "  volume A : " << st.volume_a << "\n";
    std::cout << "  volume B : " << st.volume_b << "\n";
    std::cout << "  dust B   : " << st.dust_b << "\n\n";

    std::cout << "Rejected : " << st.rejected_total() << "\n";
    for (const auto& [kind, count] : st.rejected)
        std::cout << "  " << to_string(kind) << ": " << count << "\n";
    std::cout << "\n";

    for (const auto& [name, id] : replayer.pairs())
    {
        Pair pair = exchange.snapshot(id);

        std::cout << "Pair " << name << " (#" << id << ", "
                  << pair.asset_a() << "/" << pair.asset_b() << ")\n";
        std::cout << "    bids: " << pair.bids().size()
                  << ", asks: " << pair.asks().size() << "\n";
        print_quote("best bid", pair.best_bid());
        print_quote("best ask", pair.best_ask());
        std::cout << "    pool " << pair.asset_a() << ": " << pair.pool_a().balance()
                  << ", pool " << pair.asset_b() << ": " << pair.pool_b().balance() << "\n";
        std::cout << "    invariants: " << (pair.invariants_hold() ? "ok" : "BROKEN") << "\n";
        std::cout << "    custody " << pair.asset_a() << ": " << ledger.custody(pair.asset_a())
                  << ", custody " << pair.asset_b() << ": " << ledger.custody(pair.asset_b()) << "\n";
    }
}

int main(int argc, char** argv)
{
    if (argc < 3)
    {
        std::cerr << "Usage: escrowbook_replay <config.json> <events_file>\n";
        return 1;
    }

    ExchangeConfig config;
    try
    {
        config = load_config(argv[1]);
    }
    catch (const ConfigError& ex)
    {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    std::ifstream in(argv[2]);
    if (!in)
    {
        std::cerr << "Failed to open: " << argv[2] << "\n";
        return 1;
    }

    InMemoryLedger ledger;
    Exchange       exchange(ledger);

    try
    {
        auto     pairs = apply_config(config, exchange, ledger);
        Replayer replayer(exchange, ledger, std::move(pairs), config.strict);

        const ReplayStats& st = replayer.run(in);
        print_summary(st, replayer, exchange, ledger);
    }
    catch (const Error& ex)
    {
        std::cerr << "replay aborted: " << ex.what() << "\n";
        return 2;
    }

    return 0;
}
