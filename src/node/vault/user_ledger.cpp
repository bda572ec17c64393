#include "user_ledger.hpp"

namespace vault {

Funds UserLedger::balance(const Address& user, const Address& token) const
{
    if (auto p { tokenBalances.find({ user, token }) })
        return *p;
    return Funds::zero();
}

Funds UserLedger::increase(const Address& user, const Address& token, Funds amount)
{
    auto b { Funds::sum_throw(balance(user, token), amount) };
    if (!b.is_zero())
        tokenBalances.set({ user, token }, b);
    return b;
}

Funds UserLedger::decrease(const Address& user, const Address& token, Funds amount)
{
    auto b { Funds::diff_throw(balance(user, token), amount, EBALANCE) };
    if (b.is_zero())
        tokenBalances.erase({ user, token });
    else
        tokenBalances.set({ user, token }, b);
    return b;
}

std::vector<std::pair<Address, Funds>> UserLedger::balances(const Address& user) const
{
    std::vector<std::pair<Address, Funds>> out;
    auto& m { tokenBalances.entries() };
    for (auto iter { m.lower_bound({ user, Address::zero() }) }; iter != m.end() && iter->first.first == user; ++iter)
        out.push_back({ iter->first.second, iter->second });
    return out;
}

Funds UserLedger::total(const Address& token) const
{
    Funds sum { 0 };
    for (auto& [k, v] : tokenBalances.entries())
        if (k.second == token)
            sum.add_throw(v);
    return sum;
}

bool UserLedger::is_agent_for(const Address& user, const Address& candidate) const
{
    return candidate == user
        || userAgents.contains({ user, candidate })
        || universalAgents.contains(candidate);
}

bool UserLedger::add_agent(const Address& user, const Address& agent)
{
    if (agent == user || userAgents.contains({ user, agent }))
        return false;
    userAgents.set({ user, agent }, true);
    return true;
}

bool UserLedger::remove_agent(const Address& user, const Address& agent)
{
    if (agent == user)
        throw Error(ESELFAGENT);
    if (!userAgents.contains({ user, agent })) {
        if (universalAgents.contains(agent))
            throw Error(EUNIVERSALAGENT);
        return false;
    }
    userAgents.erase({ user, agent });
    return true;
}

std::vector<Address> UserLedger::agents(const Address& user) const
{
    std::vector<Address> out;
    auto& m { userAgents.entries() };
    for (auto iter { m.lower_bound({ user, Address::zero() }) }; iter != m.end() && iter->first.first == user; ++iter)
        out.push_back(iter->first.second);
    return out;
}

bool UserLedger::add_universal_agent(const Address& a)
{
    if (universalAgents.contains(a))
        return false;
    universalAgents.set(a, true);
    return true;
}

bool UserLedger::remove_universal_agent(const Address& a)
{
    if (!universalAgents.contains(a))
        return false;
    universalAgents.erase(a);
    return true;
}

std::vector<Address> UserLedger::universal_agents() const
{
    std::vector<Address> out;
    for (auto& [a, _] : universalAgents.entries())
        out.push_back(a);
    return out;
}

bool UserLedger::add_universal_agent_manager(const Address& a)
{
    if (universalAgentManagers.contains(a))
        return false;
    universalAgentManagers.set(a, true);
    return true;
}

bool UserLedger::remove_universal_agent_manager(const Address& a)
{
    if (!universalAgentManagers.contains(a))
        return false;
    universalAgentManagers.erase(a);
    return true;
}

void UserLedger::commit()
{
    tokenBalances.commit();
    userAgents.commit();
    universalAgents.commit();
    universalAgentManagers.commit();
}

void UserLedger::rollback()
{
    tokenBalances.rollback();
    userAgents.rollback();
    universalAgents.rollback();
    universalAgentManagers.rollback();
}
}
