#pragma once
#include "general/funds.hpp"
#include "nlohmann/json_fwd.hpp"

namespace defi {

// Token balance of a pool split into cash held by the vault and the
// amount delegated to an investment manager. cash + managed never
// overflows, failed mutations leave the balance untouched.
class CashManaged {
private:
    constexpr CashManaged(Funds cash, Funds managed)
        : cash(cash)
        , managed(managed)
    {
    }

public:
    static constexpr CashManaged zero() { return { 0, 0 }; }
    // throws EBALANCEOVERFLOW if the total does not fit
    static CashManaged from_cash_managed(Funds cash, Funds managed);

    Funds get_cash() const { return cash; }
    Funds get_managed() const { return managed; }
    Funds total() const { return Funds(cash.value() + managed.value()); }
    bool is_zero() const { return cash.is_zero() && managed.is_zero(); }

    void increase_cash(Funds);
    // throws EBALANCE
    void decrease_cash(Funds);
    // cash -> managed, throws EBALANCE
    void invest(Funds);
    // managed -> cash, throws EMANAGED
    void divest(Funds);
    // absolute value reported by the manager
    void set_managed(Funds);

    bool operator==(const CashManaged&) const = default;
    operator nlohmann::json() const;

private:
    Funds cash;
    Funds managed;
};
}
