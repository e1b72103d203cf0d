#pragma once

#include <map>
#include <utility>
#include <vector>

#include "escrowbook/types.hpp"

namespace escrowbook {

/**
 * Custody collaborator of a pair.
 *
 *  - lock()    moves units of an asset from an account into custody.
 *  - deliver() pays units of an asset out of custody to a beneficiary.
 *
 * Mutations between begin() and commit() are all-or-nothing: rollback()
 * restores every balance touched since begin().
 */
class Ledger
{
public:
    virtual ~Ledger() = default;

    virtual void lock(const AssetId& asset, const AccountId& from, Quantity qty) = 0;
    virtual void deliver(const AssetId& asset, const AccountId& to, Quantity qty) = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() noexcept = 0;

    /// Scoped transaction: rolls back on destruction unless commit() was called.
    class Transaction
    {
    public:
        explicit Transaction(Ledger& ledger) : ledger_(ledger) { ledger_.begin(); }
        ~Transaction()
        {
            if (!done_)
                ledger_.rollback();
        }

        Transaction(const Transaction&)            = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit()
        {
            ledger_.commit();
            done_ = true;
        }

    private:
        Ledger& ledger_;
        bool    done_{false};
    };
};

/**
 * Ledger kept in memory: balances per (asset, account) plus the custodied
 * total per asset. Used by the replay tool, the benchmark and the tests.
 *
 * Not thread-safe; Exchange serializes access.
 */
class InMemoryLedger : public Ledger
{
public:
    /// Credit an account from outside the system (funding).
    void deposit(const AssetId& asset, const AccountId& account, Quantity qty);

    Quantity balance(const AssetId& asset, const AccountId& account) const noexcept;

    /// Units of an asset currently held in custody.
    Quantity custody(const AssetId& asset) const noexcept;

    /// Sum of all account balances plus custody for one asset.
    Quantity total_supply(const AssetId& asset) const noexcept;

    bool in_transaction() const noexcept { return open_; }

    void lock(const AssetId& asset, const AccountId& from, Quantity qty) override;
    void deliver(const AssetId& asset, const AccountId& to, Quantity qty) override;

    void begin() override;
    void commit() override;
    void rollback() noexcept override;

private:
    using Key = std::pair<AssetId, AccountId>;

    struct JournalEntry
    {
        bool      custody{false};
        Key       key;
        Quantity  previous{0};
    };

    void set_balance(const Key& key, Quantity value);
    void set_custody(const AssetId& asset, Quantity value);

    std::map<Key, Quantity>     balances_;
    std::map<AssetId, Quantity> custody_;

    std::vector<JournalEntry> journal_;
    bool                      open_{false};
};

} // namespace escrowbook
