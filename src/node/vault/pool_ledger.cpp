#include "pool_ledger.hpp"

namespace vault {
bool TokenSet::add(const Address& a)
{
    if (contains(a))
        return false;
    index.emplace(a, elements.size());
    elements.push_back(a);
    return true;
}

bool TokenSet::remove(const Address& a)
{
    auto iter { index.find(a) };
    if (iter == index.end())
        return false;
    auto i { iter->second };
    index.erase(iter);
    if (i + 1 != elements.size()) {
        elements[i] = elements.back();
        index.insert_or_assign(elements[i], i);
    }
    elements.pop_back();
    return true;
}

void PoolLedger::create(const defi::PoolId& id)
{
    if (pools.contains(id))
        throw Error(EDUPLICATEPOOLID);
    pools.set(id, {});
}

const TokenSet& PoolLedger::token_set(const defi::PoolId& id) const
{
    auto p { pools.find(id) };
    if (!p)
        throw Error(ENOPOOL);
    return *p;
}

defi::CashManaged PoolLedger::balance(const defi::PoolId& id, const Address& token) const
{
    if (!exists(id))
        throw Error(ENOPOOL);
    if (auto p { balances.find({ id, token }) })
        return *p;
    return defi::CashManaged::zero();
}

const std::vector<Address>& PoolLedger::tokens(const defi::PoolId& id) const
{
    return token_set(id).items();
}

bool PoolLedger::has_token(const defi::PoolId& id, const Address& token) const
{
    return token_set(id).contains(token);
}

uint64_t PoolLedger::last_change(const defi::PoolId& id, const Address& token) const
{
    if (!exists(id))
        throw Error(ENOPOOL);
    return lastChange.get({ id, token }).value_or(0);
}

template <typename F>
defi::CashManaged PoolLedger::update(const defi::PoolId& id, const Address& token, F&& f)
{
    auto set { token_set(id) };
    auto b { balance(id, token) };
    f(b);
    if (!set.contains(token) && !b.is_zero()) {
        if (id.strategy == defi::StrategyType::Pair && set.size() >= 2)
            throw Error(EPAIRTOKENS);
        set.add(token);
        pools.set(id, std::move(set));
    } else if (id.strategy == defi::StrategyType::Tuple && set.contains(token) && b.is_zero()) {
        set.remove(token);
        pools.set(id, std::move(set));
    }
    if (b.is_zero())
        balances.erase({ id, token });
    else
        balances.set({ id, token }, b);
    lastChange.set({ id, token }, operation);
    return b;
}

defi::CashManaged PoolLedger::increase_cash(const defi::PoolId& id, const Address& token, Funds amount)
{
    return update(id, token, [&](defi::CashManaged& b) { b.increase_cash(amount); });
}

defi::CashManaged PoolLedger::decrease_cash(const defi::PoolId& id, const Address& token, Funds amount)
{
    return update(id, token, [&](defi::CashManaged& b) { b.decrease_cash(amount); });
}

defi::CashManaged PoolLedger::invest(const defi::PoolId& id, const Address& token, Funds amount)
{
    return update(id, token, [&](defi::CashManaged& b) { b.invest(amount); });
}

defi::CashManaged PoolLedger::divest(const defi::PoolId& id, const Address& token, Funds amount)
{
    return update(id, token, [&](defi::CashManaged& b) { b.divest(amount); });
}

defi::CashManaged PoolLedger::set_managed(const defi::PoolId& id, const Address& token, Funds amount)
{
    if (!has_token(id, token) && !amount.is_zero())
        throw Error(ENOTOKEN);
    return update(id, token, [&](defi::CashManaged& b) { b.set_managed(amount); });
}

Funds PoolLedger::total(const Address& token) const
{
    Funds sum { 0 };
    for (auto& [k, b] : balances.entries())
        if (k.second == token)
            sum.add_throw(b.total());
    return sum;
}

Funds PoolLedger::cash(const Address& token) const
{
    Funds sum { 0 };
    for (auto& [k, b] : balances.entries())
        if (k.second == token)
            sum.add_throw(b.get_cash());
    return sum;
}

void PoolLedger::commit()
{
    pools.commit();
    balances.commit();
    lastChange.commit();
}

void PoolLedger::rollback()
{
    pools.rollback();
    balances.rollback();
    lastChange.rollback();
}
}
