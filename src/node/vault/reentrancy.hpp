#pragma once
#include "general/errors.hpp"

namespace vault {

// Single global "operation in progress" flag. A Lock is held for the
// whole duration of every mutating vault call.
class ReentrancyGuard {
public:
    class Lock {
    public:
        Lock(ReentrancyGuard& g)
            : g(g)
        {
            if (g.entered)
                throw Error(EREENTRANCY);
            g.entered = true;
        }
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
        ~Lock() { g.entered = false; }

    private:
        ReentrancyGuard& g;
    };
    bool active() const { return entered; }

private:
    bool entered { false };
};
}
