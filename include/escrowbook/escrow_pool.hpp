#pragma once

#include "escrowbook/types.hpp"

namespace escrowbook {

/**
 * Units of one asset held in custody by a pair on behalf of its resting
 * orders. The pair keeps balance() equal to the sum of the quantities of
 * the orders on the side that escrows this asset.
 */
class EscrowPool
{
public:
    EscrowPool() = default;
    explicit EscrowPool(AssetId asset);

    const AssetId& asset() const noexcept { return asset_; }
    Quantity balance() const noexcept { return balance_; }

    /// Add qty to the pool. Throws ArithmeticOverflow if the balance would wrap.
    void lock(Quantity qty);

    /// Take qty out of the pool. Throws InsufficientFunds if qty > balance().
    void release(Quantity qty);

    /// Overwrite the balance. Used to restore a pool saved before a failed call.
    void reset(Quantity balance) noexcept { balance_ = balance; }

private:
    AssetId  asset_;
    Quantity balance_{0};
};

} // namespace escrowbook
