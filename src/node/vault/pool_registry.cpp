#include "pool_registry.hpp"
#include <algorithm>
#include <limits>

namespace vault {

defi::PoolId PoolRegistry::register_pool(const Address& controller, defi::StrategyType type, SwapStrategy& s)
{
    if (controller.is_zero())
        throw Error(EZEROCONTROLLER);
    auto index { nextIndex.get() };
    if (index == std::numeric_limits<uint32_t>::max())
        throw Error(EPOOLINDEX);
    defi::PoolId id { controller, type, index };
    if (strategies.contains(id))
        throw Error(EDUPLICATEPOOLID);
    nextIndex.set(index + 1);
    strategies.set(id, &s);
    return id;
}

SwapStrategy& PoolRegistry::strategy(const defi::PoolId& id) const
{
    auto p { strategies.find(id) };
    if (!p)
        throw Error(ENOPOOL);
    return **p;
}

void PoolRegistry::require_controller(const defi::PoolId& id, const Address& caller) const
{
    if (!exists(id))
        throw Error(ENOPOOL);
    if (id.controller != caller)
        throw Error(ECALLERNOTCONTROLLER);
}

std::vector<defi::PoolId> PoolRegistry::pools() const
{
    std::vector<defi::PoolId> out;
    for (auto& [id, _] : strategies.entries())
        out.push_back(id);
    std::sort(out.begin(), out.end(), [](auto& a, auto& b) { return a.index < b.index; });
    return out;
}

std::optional<Address> PoolRegistry::manager(const defi::PoolId& id, const Address& token) const
{
    return managers.get({ id, token });
}

void PoolRegistry::set_manager(const defi::PoolId& id, const Address& token, const Address& manager)
{
    managers.set({ id, token }, manager);
}

void PoolRegistry::clear_manager(const defi::PoolId& id, const Address& token)
{
    managers.erase({ id, token });
}

void PoolRegistry::commit()
{
    nextIndex.commit();
    strategies.commit();
    managers.commit();
}

void PoolRegistry::rollback()
{
    nextIndex.rollback();
    strategies.rollback();
    managers.rollback();
}
}
