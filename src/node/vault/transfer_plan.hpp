#pragma once
#include "collaborators.hpp"
#include "spdlog/spdlog.h"
#include <vector>

namespace vault {

// Physical token movements of one vault call. Collected while the
// ledgers are updated and executed once at the end, pulls before pushes.
class TransferPlan {
public:
    struct Entry {
        Address token;
        Address account;
        Funds amount;
    };
    explicit TransferPlan(const Address& custodyAccount)
        : custodyAccount(custodyAccount)
    {
    }
    // both throw ECUSTODYACCOUNT when the counterparty is the custody account
    void pull(const Address& token, const Address& from, Funds amount);
    void push(const Address& token, const Address& to, Funds amount);
    bool empty() const { return pulls.empty() && pushes.empty(); }
    const std::vector<Entry>& get_pulls() const { return pulls; }
    const std::vector<Entry>& get_pushes() const { return pushes; }

    // On failure already completed movements are reverted in reverse
    // order and the error is rethrown.
    void execute(TokenTransfer&) const;

private:
    Address custodyAccount;
    std::vector<Entry> pulls;
    std::vector<Entry> pushes;
};

// Calls into a collaborator, translating anything else it throws to the
// given error code. Errors thrown by the collaborator propagate unchanged.
template <typename F>
auto external_call(int32_t code, F&& f)
{
    try {
        return f();
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("External call failed: {}", e.what());
        throw Error(code);
    } catch (...) {
        spdlog::warn("External call failed with unknown exception");
        throw Error(code);
    }
}
}
