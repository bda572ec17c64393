#include "protocol_fees.hpp"

namespace vault {

void check_fee_settings(const FeeSettings& s)
{
    if (s.swap > MAX_SWAP_FEE)
        throw Error(ESWAPFEE);
    if (s.flashLoan > MAX_FLASH_LOAN_FEE)
        throw Error(EFLASHFEE);
    if (s.withdraw > MAX_WITHDRAW_FEE)
        throw Error(EWITHDRAWFEE);
}

ProtocolFees::ProtocolFees(FeeSettings s)
    : fees((check_fee_settings(s), s))
{
}

void ProtocolFees::set_swap_fee(defi::FeePercentage f)
{
    if (f > MAX_SWAP_FEE)
        throw Error(ESWAPFEE);
    auto s { fees.get() };
    s.swap = f;
    fees.set(s);
}

void ProtocolFees::set_flash_loan_fee(defi::FeePercentage f)
{
    if (f > MAX_FLASH_LOAN_FEE)
        throw Error(EFLASHFEE);
    auto s { fees.get() };
    s.flashLoan = f;
    fees.set(s);
}

void ProtocolFees::set_withdraw_fee(defi::FeePercentage f)
{
    if (f > MAX_WITHDRAW_FEE)
        throw Error(EWITHDRAWFEE);
    auto s { fees.get() };
    s.withdraw = f;
    fees.set(s);
}

Funds ProtocolFees::collected(const Address& token) const
{
    if (auto p { collectedFees.find(token) })
        return *p;
    return Funds::zero();
}

void ProtocolFees::collect(const Address& token, Funds amount)
{
    if (amount.is_zero())
        return;
    collectedFees.set(token, Funds::sum_throw(collected(token), amount));
}

void ProtocolFees::withdraw(const Address& token, Funds amount)
{
    auto remaining { Funds::diff_throw(collected(token), amount, EFEEBALANCE) };
    if (remaining.is_zero())
        collectedFees.erase(token);
    else
        collectedFees.set(token, remaining);
}

void ProtocolFees::commit()
{
    fees.commit();
    collectedFees.commit();
}

void ProtocolFees::rollback()
{
    fees.rollback();
    collectedFees.rollback();
}
}
