#pragma once
#include "rollback_map.hpp"
#include "defi/cash_managed.hpp"
#include "defi/pool_id.hpp"
#include <map>
#include <vector>

namespace vault {

// Enumerable token set, insertion ordered with swap-remove.
class TokenSet {
public:
    bool contains(const Address& a) const { return index.contains(a); }
    bool add(const Address&);
    bool remove(const Address&);
    const std::vector<Address>& items() const { return elements; }
    size_t size() const { return elements.size(); }

private:
    std::vector<Address> elements;
    std::map<Address, size_t> index;
};

// Per pool, per token cash/managed balances. Pair pools fill two fixed
// token slots in order of first appearance, tuple pools keep the set of
// tokens with nonzero total. Every balance update is stamped with the
// number of the operation that made it.
class PoolLedger {
public:
    // stamp for the updates that follow
    void begin_operation(uint64_t op) { operation = op; }
    void create(const defi::PoolId&);
    bool exists(const defi::PoolId& id) const { return pools.contains(id); }

    defi::CashManaged balance(const defi::PoolId&, const Address& token) const;
    const std::vector<Address>& tokens(const defi::PoolId&) const;
    bool has_token(const defi::PoolId&, const Address& token) const;
    // operation that last changed the balance, 0 if never changed
    uint64_t last_change(const defi::PoolId&, const Address& token) const;

    // all throw ENOPOOL for unknown pools, return the updated balance
    defi::CashManaged increase_cash(const defi::PoolId&, const Address& token, Funds);
    defi::CashManaged decrease_cash(const defi::PoolId&, const Address& token, Funds);
    defi::CashManaged invest(const defi::PoolId&, const Address& token, Funds);
    defi::CashManaged divest(const defi::PoolId&, const Address& token, Funds);
    defi::CashManaged set_managed(const defi::PoolId&, const Address& token, Funds);

    // sum of totals over all pools
    Funds total(const Address& token) const;
    // sum of cash over all pools
    Funds cash(const Address& token) const;

    void commit();
    void rollback();

private:
    const TokenSet& token_set(const defi::PoolId&) const;
    template <typename F>
    defi::CashManaged update(const defi::PoolId&, const Address& token, F&& f);

    using key_t = std::pair<defi::PoolId, Address>;
    RollbackMap<defi::PoolId, TokenSet> pools;
    RollbackMap<key_t, defi::CashManaged> balances;
    RollbackMap<key_t, uint64_t> lastChange;
    uint64_t operation { 0 };
};
}
