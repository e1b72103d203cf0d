#include "escrowbook/ledger.hpp"

#include "escrowbook/error.hpp"
#include "escrowbook/log.hpp"
#include "utils/checked_math.hpp"

#include <stdexcept>

namespace escrowbook {

void InMemoryLedger::deposit(const AssetId& asset, const AccountId& account, Quantity qty)
{
    Key      key{asset, account};
    Quantity next = 0;
    if (!utils::checked_add(balance(asset, account), qty, next))
        throw ArithmeticOverflow("balance of " + account + " in " + asset);

    set_balance(key, next);
}

Quantity InMemoryLedger::balance(const AssetId& asset, const AccountId& account) const noexcept
{
    auto it = balances_.find(Key{asset, account});
    return it == balances_.end() ? 0 : it->second;
}

Quantity InMemoryLedger::custody(const AssetId& asset) const noexcept
{
    auto it = custody_.find(asset);
    return it == custody_.end() ? 0 : it->second;
}

Quantity InMemoryLedger::total_supply(const AssetId& asset) const noexcept
{
    Quantity total = custody(asset);
    for (const auto& [key, qty] : balances_)
    {
        if (key.first == asset)
            total = utils::saturating_add(total, qty);
    }
    return total;
}

void InMemoryLedger::lock(const AssetId& asset, const AccountId& from, Quantity qty)
{
    const Quantity have = balance(asset, from);
    if (have < qty)
        throw InsufficientFunds(asset, from, have, qty);

    Quantity held = 0;
    if (!utils::checked_add(custody(asset), qty, held))
        throw ArithmeticOverflow("custody of " + asset);

    set_balance(Key{asset, from}, have - qty);
    set_custody(asset, held);

    ESCROWBOOK_LOG("ledger lock " << qty << ' ' << asset << " from " << from);
}

void InMemoryLedger::deliver(const AssetId& asset, const AccountId& to, Quantity qty)
{
    const Quantity held = custody(asset);
    if (held < qty)
        throw InsufficientFunds(asset, "custody", held, qty);

    Quantity next = 0;
    if (!utils::checked_add(balance(asset, to), qty, next))
        throw ArithmeticOverflow("balance of " + to + " in " + asset);

    set_custody(asset, held - qty);
    set_balance(Key{asset, to}, next);

    ESCROWBOOK_LOG("ledger deliver " << qty << ' ' << asset << " to " << to);
}

void InMemoryLedger::begin()
{
    if (open_)
        throw std::logic_error("ledger transaction already open");

    journal_.clear();
    open_ = true;
}

void InMemoryLedger::commit()
{
    if (!open_)
        throw std::logic_error("no ledger transaction to commit");

    journal_.clear();
    open_ = false;
}

void InMemoryLedger::rollback() noexcept
{
    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it)
    {
        if (it->custody)
            custody_[it->key.first] = it->previous;
        else
            balances_[it->key] = it->previous;
    }

    if (!journal_.empty())
        ESCROWBOOK_LOG("ledger rollback of " << journal_.size() << " changes");

    journal_.clear();
    open_ = false;
}

void InMemoryLedger::set_balance(const Key& key, Quantity value)
{
    if (open_)
    {
        auto it = balances_.find(key);
        journal_.push_back(JournalEntry{false, key, it == balances_.end() ? 0 : it->second});
    }
    balances_[key] = value;
}

void InMemoryLedger::set_custody(const AssetId& asset, Quantity value)
{
    if (open_)
        journal_.push_back(JournalEntry{true, Key{asset, AccountId{}}, custody(asset)});

    custody_[asset] = value;
}

} // namespace escrowbook
