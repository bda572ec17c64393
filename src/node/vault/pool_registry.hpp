#pragma once
#include "collaborators.hpp"
#include "rollback_map.hpp"
#include "defi/pool_id.hpp"
#include <optional>
#include <vector>

namespace vault {

// Append-only set of registered pools and their investment managers.
class PoolRegistry {
public:
    // throws EZEROCONTROLLER, EPOOLINDEX, EDUPLICATEPOOLID
    defi::PoolId register_pool(const Address& controller, defi::StrategyType, SwapStrategy&);
    bool exists(const defi::PoolId& id) const { return strategies.contains(id); }
    // throws ENOPOOL
    SwapStrategy& strategy(const defi::PoolId&) const;
    // throws ENOPOOL, ECALLERNOTCONTROLLER
    void require_controller(const defi::PoolId&, const Address& caller) const;
    size_t count() const { return strategies.size(); }
    std::vector<defi::PoolId> pools() const;

    std::optional<Address> manager(const defi::PoolId&, const Address& token) const;
    void set_manager(const defi::PoolId&, const Address& token, const Address& manager);
    void clear_manager(const defi::PoolId&, const Address& token);

    void commit();
    void rollback();

private:
    RollbackValue<uint32_t> nextIndex { 0 };
    RollbackMap<defi::PoolId, SwapStrategy*> strategies;
    RollbackMap<std::pair<defi::PoolId, Address>, Address> managers;
};
}
