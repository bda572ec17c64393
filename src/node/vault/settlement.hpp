#pragma once
#include "general/funds.hpp"
#include <vector>

namespace vault {

// Per token sums of what a batch swap sends into and takes out of pools.
// Tracked separately so amounts stay unsigned, netted at settlement.
class NetFlows {
public:
    NetFlows(size_t n)
        : inflow(n, Funds::zero())
        , outflow(n, Funds::zero())
    {
    }
    void add_in(size_t i, Funds f) { inflow[i].add_throw(f); }
    void add_out(size_t i, Funds f) { outflow[i].add_throw(f); }
    // amount owed to the vault
    Funds net_in(size_t i) const { return Funds::diff_saturating(inflow[i], outflow[i]); }
    // amount paid by the vault
    Funds net_out(size_t i) const { return Funds::diff_saturating(outflow[i], inflow[i]); }
    size_t size() const { return inflow.size(); }

private:
    std::vector<Funds> inflow;
    std::vector<Funds> outflow;
};
}
