#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "escrowbook/ledger.hpp"
#include "escrowbook/pair.hpp"
#include "escrowbook/types.hpp"

namespace escrowbook {

/**
 * Keyed store of pairs and the host that runs calls against them.
 *
 *  - create_pair() never deduplicates: several pairs may trade the same
 *    asset combination, find_pairs() returns all of them in creation order.
 *  - Every public method holds one mutex, so a pair has a single writer and
 *    readers never see it mid-match.
 *  - A submission runs inside a ledger transaction with the pair's journal
 *    open. If anything throws, both are rolled back, so a failed call
 *    changes nothing. Nothing is copied on the success path.
 */
class Exchange
{
public:
    explicit Exchange(Ledger& ledger);

    Exchange(const Exchange&)            = delete;
    Exchange& operator=(const Exchange&) = delete;

    PairId create_pair(const AssetId& asset_a, const AssetId& asset_b);

    /// Ids of every pair created for (asset_a, asset_b), oldest first.
    std::vector<PairId> find_pairs(const AssetId& asset_a, const AssetId& asset_b) const;

    std::vector<PairId> pair_ids() const;
    std::size_t size() const;
    bool contains(PairId id) const;

    SubmitResult submit_bid(PairId id, Price price, const AccountId& beneficiary,
                            Quantity quantity, const AccountId& payer);
    SubmitResult submit_bid(PairId id, Price price, const AccountId& beneficiary,
                            Quantity quantity);

    SubmitResult submit_ask(PairId id, Price price, const AccountId& beneficiary,
                            Quantity quantity, const AccountId& payer);
    SubmitResult submit_ask(PairId id, Price price, const AccountId& beneficiary,
                            Quantity quantity);

    /// Copy of the pair's current state. Throws PairNotFound.
    Pair snapshot(PairId id) const;

private:
    SubmitResult submit(Side side, PairId id, Price price, const AccountId& beneficiary,
                        Quantity quantity, const AccountId& payer);

    Pair&       find(PairId id);
    const Pair& find(PairId id) const;

    Ledger&            ledger_;
    mutable std::mutex mutex_;

    std::map<PairId, Pair>                               pairs_;
    std::multimap<std::pair<AssetId, AssetId>, PairId>   registry_;
    PairId                                               next_id_{1};
};

} // namespace escrowbook
