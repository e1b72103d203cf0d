#include "escrowbook/pair.hpp"

#include "escrowbook/error.hpp"
#include "escrowbook/log.hpp"
#include "escrowbook/matching_engine.hpp"
#include "utils/checked_math.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

namespace escrowbook {

Pair::Pair(PairId id, AssetId asset_a, AssetId asset_b)
    : id_(id),
      pool_a_(std::move(asset_a)),
      pool_b_(std::move(asset_b))
{
    bids_.reserve(256);
    asks_.reserve(256);
}

SubmitResult Pair::submit_bid(Ledger& ledger, Price price, const AccountId& beneficiary,
                              Quantity quantity, const AccountId& payer)
{
    return submit(Side::Bid, ledger, price, beneficiary, quantity, payer);
}

SubmitResult Pair::submit_bid(Ledger& ledger, Price price, const AccountId& beneficiary,
                              Quantity quantity)
{
    return submit(Side::Bid, ledger, price, beneficiary, quantity, beneficiary);
}

SubmitResult Pair::submit_ask(Ledger& ledger, Price price, const AccountId& beneficiary,
                              Quantity quantity, const AccountId& payer)
{
    return submit(Side::Ask, ledger, price, beneficiary, quantity, payer);
}

SubmitResult Pair::submit_ask(Ledger& ledger, Price price, const AccountId& beneficiary,
                              Quantity quantity)
{
    return submit(Side::Ask, ledger, price, beneficiary, quantity, beneficiary);
}

SubmitResult Pair::submit(Side side, Ledger& ledger, Price price, const AccountId& beneficiary,
                          Quantity quantity, const AccountId& payer)
{
    validate(side, price, quantity);

    Book&       book = (side == Side::Bid) ? bids_ : asks_;
    EscrowPool& pool = (side == Side::Bid) ? pool_a_ : pool_b_;

    // Checked before the ledger moves anything.
    Quantity pooled = 0;
    if (!utils::checked_add(pool.balance(), quantity, pooled))
        throw ArithmeticOverflow("escrow pool " + pool.asset() + " balance");

    ledger.lock(pool.asset(), payer, quantity);
    pool.lock(quantity);

    SubmitResult res;
    res.side      = side;
    res.requested = quantity;
    if (journal_.open)
    {
        journal_.inserted.reserve(journal_.inserted.size() + 1);
        journal_.placed.reserve(journal_.placed.size() + 1);
    }
    res.sequence  = book.insert(to_priority(side, price), Offer{beneficiary, quantity});
    if (journal_.open)
    {
        journal_.inserted.emplace_back(side, res.sequence);
        journal_.placed.emplace_back(side, res.sequence);
    }

    ESCROWBOOK_LOG("pair " << id_ << ' ' << to_string(side) << " #" << res.sequence
                   << " price=" << price << " qty=" << quantity << " for " << beneficiary);

    res.trades = MatchingEngine::run(*this, ledger);

    for (const Trade& tr : res.trades)
    {
        if (side == Side::Bid && tr.bid_sequence == res.sequence)
            res.filled += tr.quantity_a;
        else if (side == Side::Ask && tr.ask_sequence == res.sequence)
            res.filled += tr.quantity_b;
    }
    res.remaining = res.requested - res.filled;

    return res;
}

Pair::Entry Pair::take(Side side)
{
    Book& book = book_of(side);
    if (journal_.open && !book.empty())
        journal_.taken.emplace_back(side, book.top());
    return book.extract_max();
}

void Pair::place(Side side, Entry entry)
{
    // Recorded first: an entry that reaches the heap is always undoable.
    if (journal_.open)
        journal_.placed.emplace_back(side, entry.sequence);
    book_of(side).reinsert(std::move(entry));
}

void Pair::begin()
{
    if (journal_.open)
        throw std::logic_error("pair " + std::to_string(id_) + " journal already open");

    journal_.open   = true;
    journal_.pool_a = pool_a_.balance();
    journal_.pool_b = pool_b_.balance();
}

void Pair::commit() noexcept
{
    journal_ = Journal{};
}

void Pair::rollback() noexcept
{
    if (!journal_.open)
        return;

    // Each sequence sits in its heap at most once, so this leaves only the
    // entries the call never touched.
    for (auto it = journal_.placed.rbegin(); it != journal_.placed.rend(); ++it)
        book_of(it->first).erase(it->second);

    const auto& inserted = journal_.inserted;
    auto&       taken    = journal_.taken;
    for (std::size_t i = 0; i < taken.size(); ++i)
    {
        const Side     side = taken[i].first;
        const Sequence seq  = taken[i].second.sequence;
        auto same = [side, seq](const auto& rec) {
            return rec.first == side && rec.second == seq;
        };
        auto same_entry = [side, seq](const std::pair<Side, Entry>& rec) {
            return rec.first == side && rec.second.sequence == seq;
        };

        // First extraction holds the state from before the call.
        if (std::any_of(inserted.begin(), inserted.end(), same) ||
            std::any_of(taken.begin(), taken.begin() + static_cast<std::ptrdiff_t>(i), same_entry))
            continue;

        book_of(side).reinsert(std::move(taken[i].second));
    }

    pool_a_.reset(journal_.pool_a);
    pool_b_.reset(journal_.pool_b);

    ESCROWBOOK_LOG("pair " << id_ << " rolled back " << journal_.placed.size()
                   << " placements, " << taken.size() << " extractions");

    journal_ = Journal{};
}

void Pair::validate(Side side, Price price, Quantity quantity)
{
    if (quantity == 0)
        throw ZeroQuantity(side);
    // Settlement divides by the ask price. A zero bid simply never crosses.
    if (side == Side::Ask && price == 0)
        throw InvalidPrice(side);
}

BestQuote Pair::best_bid() const
{
    return best_of(Side::Bid);
}

BestQuote Pair::best_ask() const
{
    return best_of(Side::Ask);
}

BestQuote Pair::best_of(Side side) const
{
    const Book& book = (side == Side::Bid) ? bids_ : asks_;

    BestQuote info;
    if (book.empty())
        return info;

    const Priority top = book.top().priority;

    // Heap order is partial; equal keys may sit anywhere below the root.
    for (const Entry& e : book)
    {
        if (e.priority == top)
            info.qty += e.payload.quantity;
    }

    info.valid = true;
    info.price = to_price(side, top);
    return info;
}

bool Pair::invariants_hold() const noexcept
{
    Quantity bid_total = 0;
    for (const Entry& e : bids_)
    {
        if (e.payload.quantity == 0 || !utils::checked_add(bid_total, e.payload.quantity, bid_total))
            return false;
    }

    Quantity ask_total = 0;
    for (const Entry& e : asks_)
    {
        if (e.payload.quantity == 0 || !utils::checked_add(ask_total, e.payload.quantity, ask_total))
            return false;
    }

    if (bid_total != pool_a_.balance() || ask_total != pool_b_.balance())
        return false;

    if (!bids_.empty() && !asks_.empty())
    {
        const Price bid = to_price(Side::Bid, bids_.top().priority);
        const Price ask = to_price(Side::Ask, asks_.top().priority);
        if (bid >= ask)
            return false;
    }

    return true;
}

void Pair::check_invariants() const
{
    if (invariants_hold())
        return;

    for (const Book* book : {&bids_, &asks_})
    {
        for (const Entry& e : *book)
        {
            if (e.payload.quantity == 0)
                throw InvariantViolation("zero-quantity offer resting in pair " + std::to_string(id_));
        }
    }

    if (!bids_.empty() && !asks_.empty() &&
        to_price(Side::Bid, bids_.top().priority) >= to_price(Side::Ask, asks_.top().priority))
        throw InvariantViolation("pair " + std::to_string(id_) + " left crossed");

    throw InvariantViolation("escrow pools of pair " + std::to_string(id_) +
                             " differ from resting quantities");
}

} // namespace escrowbook
