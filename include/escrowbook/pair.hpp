#pragma once

#include <utility>
#include <vector>

#include "escrowbook/escrow_pool.hpp"
#include "escrowbook/ledger.hpp"
#include "escrowbook/types.hpp"
#include "utils/priority_queue.hpp"

namespace escrowbook {

/**
 * Order book and escrow state for one asset A / asset B trading pair.
 *
 * Design
 *  - bids_ : max-heap keyed by price; every bid escrows asset A.
 *  - asks_ : max-heap keyed by to_priority(Side::Ask, price); every ask
 *            escrows asset B. The complement key makes the lowest ask pop
 *            first from the same heap type.
 *  - pool_a_ / pool_b_ hold the escrowed totals of the two sides.
 *
 * Each submission locks the order's quantity through the Ledger, rests it
 * in the book and runs MatchingEngine until no crossing pair remains.
 *
 * Validation errors (zero quantity, zero ask price) are raised before any
 * state change. Failures after that point leave the pair mid-match unless
 * the caller opened a journal with begin(): every heap extraction and
 * insertion made until commit() is recorded, and rollback() undoes them and
 * restores both pools. Exchange pairs this with a ledger transaction.
 *
 * All methods are NOT thread-safe.
 */
class Pair
{
public:
    using Book  = utils::PriorityQueue<Offer>;
    using Entry = Book::Entry;

    Pair(PairId id, AssetId asset_a, AssetId asset_b);

    PairId id() const noexcept { return id_; }
    const AssetId& asset_a() const noexcept { return pool_a_.asset(); }
    const AssetId& asset_b() const noexcept { return pool_b_.asset(); }

    /// Buy asset B with asset A: locks quantity units of A from payer.
    SubmitResult submit_bid(Ledger& ledger, Price price, const AccountId& beneficiary,
                            Quantity quantity, const AccountId& payer);

    /// Same as above with the beneficiary paying.
    SubmitResult submit_bid(Ledger& ledger, Price price, const AccountId& beneficiary,
                            Quantity quantity);

    /// Sell asset B for asset A: locks quantity units of B from payer.
    SubmitResult submit_ask(Ledger& ledger, Price price, const AccountId& beneficiary,
                            Quantity quantity, const AccountId& payer);

    SubmitResult submit_ask(Ledger& ledger, Price price, const AccountId& beneficiary,
                            Quantity quantity);

    const Book& bids() const noexcept { return bids_; }
    const Book& asks() const noexcept { return asks_; }

    const EscrowPool& pool_a() const noexcept { return pool_a_; }
    const EscrowPool& pool_b() const noexcept { return pool_b_; }

    /// Highest bid with the total quantity resting at that price.
    BestQuote best_bid() const;

    /// Lowest ask with the total quantity resting at that price.
    BestQuote best_ask() const;

    bool empty() const noexcept { return bids_.empty() && asks_.empty(); }

    /// Throws ZeroQuantity for any side and InvalidPrice for an ask at price 0.
    static void validate(Side side, Price price, Quantity quantity);

    /// Pools match resting quantities, no zero-quantity offer rests and the
    /// book is not crossed.
    bool invariants_hold() const noexcept;

    /// Throws InvariantViolation naming the first broken invariant.
    void check_invariants() const;

    /// Start recording changes. Throws std::logic_error if already recording.
    void begin();
    void commit() noexcept;

    /// Undo everything since begin(). No-op when nothing is being recorded.
    void rollback() noexcept;

    bool in_journal() const noexcept { return journal_.open; }

private:
    friend class MatchingEngine;

    SubmitResult submit(Side side, Ledger& ledger, Price price, const AccountId& beneficiary,
                        Quantity quantity, const AccountId& payer);

    BestQuote best_of(Side side) const;

    Book& book_of(Side side) noexcept { return side == Side::Bid ? bids_ : asks_; }

    // Heap access for MatchingEngine, recorded while a journal is open.
    Entry take(Side side);
    void  place(Side side, Entry entry);

    struct Journal {
        bool     open{false};
        Quantity pool_a{0};
        Quantity pool_b{0};
        std::vector<std::pair<Side, Sequence>> inserted;   // new orders
        std::vector<std::pair<Side, Sequence>> placed;     // every push, in order
        std::vector<std::pair<Side, Entry>>    taken;      // entries as extracted
    };

    PairId     id_;
    Book       bids_;
    Book       asks_;
    EscrowPool pool_a_;
    EscrowPool pool_b_;
    Journal    journal_;
};

} // namespace escrowbook
