#include "memory_bank.hpp"

namespace vault {

void MemoryBank::mint(const Address& token, const Address& holder, Funds amount)
{
    auto b { Funds::sum_throw(balance_of(token, holder), amount) };
    holdings.insert_or_assign({ token, holder }, b);
}

Funds MemoryBank::balance_of(const Address& token, const Address& holder) const
{
    auto iter { holdings.find({ token, holder }) };
    if (iter == holdings.end())
        return Funds::zero();
    return iter->second;
}

void MemoryBank::transfer(const Address& token, const Address& from, const Address& to, Funds amount)
{
    if (amount.is_zero() || from == to)
        return;
    auto f { Funds::diff_throw(balance_of(token, from), amount, ETRANSFER) };
    auto t { Funds::sum_throw(balance_of(token, to), amount) };
    holdings.insert_or_assign({ token, from }, f);
    holdings.insert_or_assign({ token, to }, t);
}

void MemoryBank::pull(const Address& token, const Address& from, Funds amount)
{
    if (from == vaultAccount)
        throw Error(ETRANSFER);
    transfer(token, from, vaultAccount, amount);
}

void MemoryBank::push(const Address& token, const Address& to, Funds amount)
{
    if (to == vaultAccount)
        throw Error(ETRANSFER);
    transfer(token, vaultAccount, to, amount);
}

Funds MemoryBank::custody(const Address& token) const
{
    return balance_of(token, vaultAccount);
}
}
