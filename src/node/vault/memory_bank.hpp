#pragma once
#include "collaborators.hpp"
#include <map>

namespace vault {

// In-memory token balances of all accounts. Used as the vault's token
// transfer collaborator by the simulator and the tests.
class MemoryBank : public TokenTransfer {
public:
    MemoryBank(const Address& vaultAccount)
        : vaultAccount(vaultAccount)
    {
    }
    const Address& vault_account() const { return vaultAccount; }

    void mint(const Address& token, const Address& holder, Funds amount);
    Funds balance_of(const Address& token, const Address& holder) const;
    // throws ETRANSFER on insufficient balance
    void transfer(const Address& token, const Address& from, const Address& to, Funds amount);
    const std::map<std::pair<Address, Address>, Funds>& balances() const { return holdings; }

    void pull(const Address& token, const Address& from, Funds amount) override;
    void push(const Address& token, const Address& to, Funds amount) override;
    Funds custody(const Address& token) const override;
    Address custody_account() const override { return vaultAccount; }

private:
    Address vaultAccount;
    std::map<std::pair<Address, Address>, Funds> holdings; // (token, holder)
};
}
