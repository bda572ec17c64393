#include "cash_managed.hpp"
#include "nlohmann/json.hpp"

namespace defi {
CashManaged CashManaged::from_cash_managed(Funds cash, Funds managed)
{
    Funds::sum_throw(cash, managed);
    return { cash, managed };
}

void CashManaged::increase_cash(Funds amount)
{
    auto c { Funds::sum_throw(cash, amount) };
    Funds::sum_throw(c, managed);
    cash = c;
}

void CashManaged::decrease_cash(Funds amount)
{
    cash.subtract_throw(amount, EBALANCE);
}

void CashManaged::invest(Funds amount)
{
    auto c { Funds::diff_throw(cash, amount, EBALANCE) };
    // total unchanged, cannot overflow
    managed = Funds(managed.value() + amount.value());
    cash = c;
}

void CashManaged::divest(Funds amount)
{
    auto m { Funds::diff_throw(managed, amount, EMANAGED) };
    cash = Funds(cash.value() + amount.value());
    managed = m;
}

void CashManaged::set_managed(Funds amount)
{
    Funds::sum_throw(cash, amount);
    managed = amount;
}

CashManaged::operator nlohmann::json() const
{
    return nlohmann::json {
        { "cash", cash.value() },
        { "managed", managed.value() },
        { "total", total().value() }
    };
}
}
