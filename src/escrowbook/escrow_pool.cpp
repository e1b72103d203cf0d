#include "escrowbook/escrow_pool.hpp"

#include "escrowbook/error.hpp"
#include "utils/checked_math.hpp"

#include <utility>

namespace escrowbook {

EscrowPool::EscrowPool(AssetId asset)
    : asset_(std::move(asset))
{
}

void EscrowPool::lock(Quantity qty)
{
    Quantity next = 0;
    if (!utils::checked_add(balance_, qty, next))
        throw ArithmeticOverflow("escrow pool " + asset_ + " balance");

    balance_ = next;
}

void EscrowPool::release(Quantity qty)
{
    Quantity next = 0;
    if (!utils::checked_sub(balance_, qty, next))
        throw InsufficientFunds(asset_, "escrow pool", balance_, qty);

    balance_ = next;
}

} // namespace escrowbook
