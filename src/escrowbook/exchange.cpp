#include "escrowbook/exchange.hpp"

#include "escrowbook/error.hpp"
#include "escrowbook/log.hpp"

#include <exception>
#include <utility>

namespace escrowbook {

Exchange::Exchange(Ledger& ledger)
    : ledger_(ledger)
{
}

PairId Exchange::create_pair(const AssetId& asset_a, const AssetId& asset_b)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const PairId id = next_id_++;
    pairs_.emplace(id, Pair(id, asset_a, asset_b));
    registry_.emplace(std::make_pair(asset_a, asset_b), id);

    ESCROWBOOK_LOG("pair " << id << " created: " << asset_a << '/' << asset_b);
    return id;
}

std::vector<PairId> Exchange::find_pairs(const AssetId& asset_a, const AssetId& asset_b) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PairId> ids;
    auto range = registry_.equal_range(std::make_pair(asset_a, asset_b));
    for (auto it = range.first; it != range.second; ++it)
        ids.push_back(it->second);
    return ids;
}

std::vector<PairId> Exchange::pair_ids() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PairId> ids;
    ids.reserve(pairs_.size());
    for (const auto& [id, pair] : pairs_)
        ids.push_back(id);
    return ids;
}

std::size_t Exchange::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pairs_.size();
}

bool Exchange::contains(PairId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pairs_.count(id) != 0;
}

SubmitResult Exchange::submit_bid(PairId id, Price price, const AccountId& beneficiary,
                                  Quantity quantity, const AccountId& payer)
{
    return submit(Side::Bid, id, price, beneficiary, quantity, payer);
}

SubmitResult Exchange::submit_bid(PairId id, Price price, const AccountId& beneficiary,
                                  Quantity quantity)
{
    return submit(Side::Bid, id, price, beneficiary, quantity, beneficiary);
}

SubmitResult Exchange::submit_ask(PairId id, Price price, const AccountId& beneficiary,
                                  Quantity quantity, const AccountId& payer)
{
    return submit(Side::Ask, id, price, beneficiary, quantity, payer);
}

SubmitResult Exchange::submit_ask(PairId id, Price price, const AccountId& beneficiary,
                                  Quantity quantity)
{
    return submit(Side::Ask, id, price, beneficiary, quantity, beneficiary);
}

SubmitResult Exchange::submit(Side side, PairId id, Price price, const AccountId& beneficiary,
                              Quantity quantity, const AccountId& payer)
{
    std::lock_guard<std::mutex> lock(mutex_);

    Pair& pair = find(id);

    // Cheap rejections first: nothing to journal for them.
    Pair::validate(side, price, quantity);

    Ledger::Transaction tx(ledger_);
    pair.begin();

    try
    {
        SubmitResult res = (side == Side::Bid)
            ? pair.submit_bid(ledger_, price, beneficiary, quantity, payer)
            : pair.submit_ask(ledger_, price, beneficiary, quantity, payer);

        pair.commit();
        tx.commit();
        return res;
    }
    catch (const std::exception& ex)
    {
        ESCROWBOOK_LOG("pair " << id << ' ' << to_string(side) << " rolled back: " << ex.what());
        pair.rollback();
        throw;
    }
}

Pair Exchange::snapshot(PairId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return find(id);
}

Pair& Exchange::find(PairId id)
{
    auto it = pairs_.find(id);
    if (it == pairs_.end())
        throw PairNotFound(id);
    return it->second;
}

const Pair& Exchange::find(PairId id) const
{
    auto it = pairs_.find(id);
    if (it == pairs_.end())
        throw PairNotFound(id);
    return it->second;
}

} // namespace escrowbook
