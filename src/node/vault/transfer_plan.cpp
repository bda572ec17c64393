#include "transfer_plan.hpp"

namespace vault {

void TransferPlan::pull(const Address& token, const Address& from, Funds amount)
{
    if (from == custodyAccount)
        throw Error(ECUSTODYACCOUNT);
    if (!amount.is_zero())
        pulls.push_back({ token, from, amount });
}

void TransferPlan::push(const Address& token, const Address& to, Funds amount)
{
    if (to == custodyAccount)
        throw Error(ECUSTODYACCOUNT);
    if (!amount.is_zero())
        pushes.push_back({ token, to, amount });
}

void TransferPlan::execute(TokenTransfer& t) const
{
    size_t pulled { 0 };
    size_t pushed { 0 };
    auto revert = [&]() {
        while (pushed > 0) {
            auto& e { pushes[--pushed] };
            external_call(ETRANSFER, [&]() { t.pull(e.token, e.account, e.amount); });
        }
        while (pulled > 0) {
            auto& e { pulls[--pulled] };
            external_call(ETRANSFER, [&]() { t.push(e.token, e.account, e.amount); });
        }
    };
    try {
        for (; pulled < pulls.size(); ++pulled) {
            auto& e { pulls[pulled] };
            external_call(ETRANSFER, [&]() { t.pull(e.token, e.account, e.amount); });
        }
        for (; pushed < pushes.size(); ++pushed) {
            auto& e { pushes[pushed] };
            external_call(ETRANSFER, [&]() { t.push(e.token, e.account, e.amount); });
        }
    } catch (const Error& e) {
        try {
            revert();
        } catch (const Error& re) {
            spdlog::error("Cannot revert token transfers after {}: {}", e.format(), re.format());
        }
        throw;
    }
}
}
