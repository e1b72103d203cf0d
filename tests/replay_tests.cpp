#include <gtest/gtest.h>

#include "escrowbook/error.hpp"
#include "escrowbook/event.hpp"
#include "escrowbook/exchange.hpp"
#include "escrowbook/ledger.hpp"
#include "escrowbook/replay.hpp"

#include <limits>
#include <sstream>
#include <string>

using namespace escrowbook;

TEST(EventParser, SkipsCommentsAndBlankLines) {
    EXPECT_FALSE(parse_event_line("").has_value());
    EXPECT_FALSE(parse_event_line("   \t").has_value());
    EXPECT_FALSE(parse_event_line("# type,pair,price,qty,payer").has_value());
}

TEST(EventParser, ParsesPairAndFund) {
    auto pair = parse_event_line("PAIR, SUI/USDC, USDC, SUI");
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(pair->type, EventType::Pair);
    EXPECT_EQ(pair->name, "SUI/USDC");
    EXPECT_EQ(pair->asset_a, "USDC");
    EXPECT_EQ(pair->asset_b, "SUI");

    auto fund = parse_event_line("fund,USDC,alice,1000");
    ASSERT_TRUE(fund.has_value());
    EXPECT_EQ(fund->type, EventType::Fund);
    EXPECT_EQ(fund->name, "USDC");
    EXPECT_EQ(fund->account, "alice");
    EXPECT_EQ(fund->qty, 1000u);
}

TEST(EventParser, ParsesOrdersWithOptionalBeneficiary) {
    auto bid = parse_event_line("BID,SUI/USDC,40,1000,alice");
    ASSERT_TRUE(bid.has_value());
    EXPECT_EQ(bid->type, EventType::Bid);
    EXPECT_EQ(bid->price, 40u);
    EXPECT_EQ(bid->qty, 1000u);
    EXPECT_EQ(bid->account, "alice");
    EXPECT_EQ(bid->beneficiary, "alice");

    auto ask = parse_event_line("ASK,SUI/USDC,5,1000000,bob,carol\r");
    ASSERT_TRUE(ask.has_value());
    EXPECT_EQ(ask->type, EventType::Ask);
    EXPECT_EQ(ask->account, "bob");
    EXPECT_EQ(ask->beneficiary, "carol");
}

TEST(EventParser, RejectsMalformedLines) {
    EXPECT_FALSE(parse_event_line("CANCEL,1").has_value());
    EXPECT_FALSE(parse_event_line("BID,SUI/USDC,40,1000").has_value());
    EXPECT_FALSE(parse_event_line("BID,SUI/USDC,-40,1000,alice").has_value());
    EXPECT_FALSE(parse_event_line("BID,SUI/USDC,4x,1000,alice").has_value());
    EXPECT_FALSE(parse_event_line("BID,SUI/USDC,40,,alice").has_value());
    EXPECT_FALSE(parse_event_line("BID,SUI/USDC,40,99999999999999999999999,alice").has_value());
    EXPECT_FALSE(parse_event_line("FUND,USDC,alice").has_value());
    EXPECT_FALSE(parse_event_line("PAIR,x,USDC").has_value());
}

TEST(Replayer, RunsScenarioFromStream) {
    InMemoryLedger ledger;
    Exchange       exchange(ledger);
    Replayer       replayer(exchange, ledger);

    std::istringstream in(
        "# scenario\n"
        "PAIR,SUI/USDC,USDC,SUI\n"
        "FUND,USDC,alice,111000\n"
        "FUND,SUI,bob,1000000\n"
        "BID,SUI/USDC,40,1000,alice\n"
        "BID,SUI/USDC,20,10000,alice\n"
        "BID,SUI/USDC,10,100000,alice\n"
        "ASK,SUI/USDC,5,1000000,bob\n"
        "garbage line\n");

    const auto& st = replayer.run(in);

    EXPECT_EQ(st.lines, 9u);
    EXPECT_EQ(st.skipped, 2u);
    EXPECT_EQ(st.pairs_created, 1u);
    EXPECT_EQ(st.fundings, 2u);
    EXPECT_EQ(st.bids, 3u);
    EXPECT_EQ(st.asks, 1u);
    EXPECT_EQ(st.trades, 3u);
    EXPECT_EQ(st.volume_a, 111000u);
    EXPECT_EQ(st.volume_b, 555000u);
    EXPECT_EQ(st.rejected_total(), 0u);

    ASSERT_EQ(replayer.pairs().count("SUI/USDC"), 1u);
    Pair p = exchange.snapshot(replayer.pairs().at("SUI/USDC"));
    EXPECT_EQ(p.bids().size(), 0u);
    EXPECT_EQ(p.asks().size(), 1u);
    EXPECT_EQ(p.best_ask().price, 5u);
    EXPECT_EQ(p.pool_b().balance(), 445000u);
}

TEST(Replayer, CountsRejectionsByKind) {
    InMemoryLedger ledger;
    Exchange       exchange(ledger);
    Replayer       replayer(exchange, ledger);

    std::istringstream in(
        "PAIR,P,USDC,SUI\n"
        "FUND,USDC,alice,10\n"
        "BID,P,10,0,alice\n"       // zero quantity
        "BID,P,10,50,alice\n"      // not enough USDC
        "BID,Q,10,5,alice\n"       // unknown pair
        "ASK,P,0,5,alice\n"        // zero ask price
        "BID,P,10,5,alice\n");

    const auto& st = replayer.run(in);

    EXPECT_EQ(st.bids, 1u);
    EXPECT_EQ(st.rejected_total(), 4u);
    EXPECT_EQ(st.rejected.at(ErrorKind::ZeroQuantity), 1u);
    EXPECT_EQ(st.rejected.at(ErrorKind::InsufficientFunds), 1u);
    EXPECT_EQ(st.rejected.at(ErrorKind::PairNotFound), 1u);
    EXPECT_EQ(st.rejected.at(ErrorKind::InvalidPrice), 1u);
    EXPECT_EQ(ledger.balance("USDC", "alice"), 5u);
}

TEST(Replayer, VolumeTotalsSaturateInsteadOfWrapping) {
    InMemoryLedger ledger;
    Exchange       exchange(ledger);
    Replayer       replayer(exchange, ledger);

    // Two fills of 2^63 units on each side.
    std::istringstream in(
        "PAIR,P,USDC,SUI\n"
        "FUND,USDC,alice,9223372036854775808\n"
        "FUND,SUI,bob,9223372036854775808\n"
        "BID,P,1,9223372036854775808,alice\n"
        "ASK,P,1,9223372036854775808,bob\n"
        "BID,P,1,9223372036854775808,bob\n"
        "ASK,P,1,9223372036854775808,alice\n");

    const auto& st = replayer.run(in);

    EXPECT_EQ(st.rejected_total(), 0u);
    EXPECT_EQ(st.trades, 2u);
    EXPECT_EQ(st.volume_a, std::numeric_limits<Quantity>::max());
    EXPECT_EQ(st.volume_b, std::numeric_limits<Quantity>::max());
    EXPECT_EQ(st.dust_b, 0u);
    EXPECT_EQ(ledger.balance("USDC", "alice"), Quantity{1} << 63);
    EXPECT_EQ(ledger.balance("SUI", "bob"), Quantity{1} << 63);
}

TEST(Replayer, StrictModeStopsOnFirstRejection) {
    InMemoryLedger ledger;
    Exchange       exchange(ledger);
    Replayer       replayer(exchange, ledger, {}, true);

    std::istringstream in(
        "PAIR,P,USDC,SUI\n"
        "BID,P,10,5,alice\n"
        "PAIR,never,USDC,SUI\n");

    EXPECT_THROW(replayer.run(in), InsufficientFunds);
    EXPECT_EQ(replayer.stats().pairs_created, 1u);
    EXPECT_EQ(exchange.size(), 1u);
}

TEST(Replayer, UsesPreconfiguredPairNames) {
    InMemoryLedger ledger;
    Exchange       exchange(ledger);
    PairId         id = exchange.create_pair("USDC", "SUI");
    ledger.deposit("USDC", "alice", 100);

    Replayer replayer(exchange, ledger, {{"main", id}});

    Event ev;
    ev.type        = EventType::Bid;
    ev.name        = "main";
    ev.price       = 7;
    ev.qty         = 100;
    ev.account     = "alice";
    ev.beneficiary = "carol";
    replayer.apply(ev);

    Pair p = exchange.snapshot(id);
    ASSERT_EQ(p.bids().size(), 1u);
    EXPECT_EQ(p.bids().top().payload.beneficiary, "carol");
    EXPECT_EQ(ledger.balance("USDC", "alice"), 0u);
}
