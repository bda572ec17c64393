#pragma once
#include "rollback_map.hpp"
#include "crypto/address.hpp"
#include "general/funds.hpp"
#include <utility>
#include <vector>

namespace vault {

// Per user token balances held inside the vault and the agent relation
// authorizing third parties to move a user's funds.
class UserLedger {
public:
    Funds balance(const Address& user, const Address& token) const;
    // returns the new balance
    Funds increase(const Address& user, const Address& token, Funds amount);
    // throws EBALANCE, returns the new balance
    Funds decrease(const Address& user, const Address& token, Funds amount);
    std::vector<std::pair<Address, Funds>> balances(const Address& user) const;
    // sum over all users
    Funds total(const Address& token) const;

    // agents
    bool is_agent_for(const Address& user, const Address& candidate) const;
    bool add_agent(const Address& user, const Address& agent);
    bool remove_agent(const Address& user, const Address& agent);
    std::vector<Address> agents(const Address& user) const;

    bool is_universal_agent(const Address& a) const { return universalAgents.contains(a); }
    bool add_universal_agent(const Address&);
    bool remove_universal_agent(const Address&);
    std::vector<Address> universal_agents() const;

    bool is_universal_agent_manager(const Address& a) const { return universalAgentManagers.contains(a); }
    bool add_universal_agent_manager(const Address&);
    bool remove_universal_agent_manager(const Address&);

    void commit();
    void rollback();

private:
    using key_t = std::pair<Address, Address>;
    RollbackMap<key_t, Funds> tokenBalances; // (user, token)
    RollbackMap<key_t, bool> userAgents; // (user, agent)
    RollbackMap<Address, bool> universalAgents;
    RollbackMap<Address, bool> universalAgentManagers;
};
}
