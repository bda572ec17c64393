#pragma once
#include "collaborators.hpp"
#include "events.hpp"
#include "pool_ledger.hpp"
#include "pool_registry.hpp"
#include "protocol_fees.hpp"
#include "reentrancy.hpp"
#include "transfer_plan.hpp"
#include "user_ledger.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace vault {

struct SwapStep {
    defi::PoolId pool;
    size_t tokenInIndex; // index into the batch token list
    size_t tokenOutIndex;
    Funds amount; // zero continues a multihop path
};

struct FundManagement {
    Address sender;
    bool fromUserBalance { false };
    Address recipient;
    bool toUserBalance { false };
};

struct SwapLimit {
    Funds maxIn { Funds::max() }; // maximal net amount sent to the vault
    Funds minOut { 0 }; // minimal net amount received from the vault
};

// Net token movement of a batch swap, per batch token. At most one of
// sentIn[i] and receivedOut[i] is nonzero.
struct BatchSwapResult {
    std::vector<Funds> sentIn;
    std::vector<Funds> receivedOut;
};

struct PoolTokenBalance {
    Address token;
    Funds total;
    uint64_t lastChange; // operation that last changed the balance
};

struct PoolTokenInfo {
    Funds cash;
    Funds managed;
    uint64_t lastChange;
    std::optional<Address> manager;
};

// Accounting core of the multi pool vault. Every mutating call either
// commits completely or throws an Error and leaves all ledgers untouched.
// Mutating calls are serialized by a single reentrancy guard.
class Vault {
    class Transaction;

public:
    using subscriber_t = std::function<void(const Event&)>;
    Vault(TokenTransfer&, Authorizer&, FeeSettings = {});
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // called for every event of a committed call
    void subscribe(subscriber_t s) { subscriber = std::move(s); }

    ////////////////////
    // pools
    defi::PoolId register_pool(const Address& controller, defi::StrategyType, SwapStrategy&);
    defi::PoolId get_pool(const defi::PoolIdBytes&) const;
    bool pool_exists(const defi::PoolId& id) const { return registry.exists(id); }
    size_t pool_count() const { return registry.count(); }
    std::vector<defi::PoolId> pools() const { return registry.pools(); }
    std::vector<PoolTokenBalance> get_pool_tokens(const defi::PoolId&) const;
    // latest change over all tokens of the pool
    uint64_t get_pool_last_change(const defi::PoolId&) const;
    // number of committed mutating calls
    uint64_t operation_count() const { return operations.get(); }
    PoolTokenInfo get_pool_token_info(const defi::PoolId&, const Address& token) const;
    defi::CashManaged get_pool_balance(const defi::PoolId& id, const Address& token) const
    {
        return poolLedger.balance(id, token);
    }

    void add_liquidity(const Address& caller, const defi::PoolId&, const Address& from,
        const std::vector<Address>& tokens, const std::vector<Funds>& amounts, bool useUserBalance);
    void remove_liquidity(const Address& caller, const defi::PoolId&, const Address& to,
        const std::vector<Address>& tokens, const std::vector<Funds>& amounts, bool depositToUserBalance);

    ////////////////////
    // investment managers
    void authorize_pool_investment_manager(const Address& caller, const defi::PoolId&,
        const Address& token, const Address& manager);
    void revoke_pool_investment_manager(const Address& caller, const defi::PoolId&, const Address& token);
    void invest_pool_balance(const Address& caller, const defi::PoolId&, const Address& token, Funds);
    void divest_pool_balance(const Address& caller, const defi::PoolId&, const Address& token, Funds);
    void update_invested(const Address& caller, const defi::PoolId&, const Address& token, Funds managed);

    ////////////////////
    // user balances
    std::vector<Funds> get_user_balance(const Address& user, const std::vector<Address>& tokens) const;
    Funds get_user_balance(const Address& user, const Address& token) const { return userLedger.balance(user, token); }
    // pulls from caller, credits user
    void deposit(const Address& caller, const Address& token, Funds, const Address& user);
    // debits user, sends amount minus withdraw fee to recipient
    void withdraw(const Address& caller, const Address& user, const Address& token, Funds, const Address& recipient);
    void transfer_user_balance(const Address& caller, const Address& from, const Address& token, Funds, const Address& to);

    ////////////////////
    // agents
    bool is_agent_for(const Address& user, const Address& candidate) const { return userLedger.is_agent_for(user, candidate); }
    std::vector<Address> get_agents(const Address& user) const { return userLedger.agents(user); }
    void add_agent(const Address& caller, const Address& agent);
    void remove_agent(const Address& caller, const Address& agent);
    bool is_universal_agent(const Address& a) const { return userLedger.is_universal_agent(a); }
    void add_universal_agent(const Address& caller, const Address& agent);
    void remove_universal_agent(const Address& caller, const Address& agent);
    bool is_universal_agent_manager(const Address& a) const { return userLedger.is_universal_agent_manager(a); }
    void add_universal_agent_manager(const Address& caller, const Address& manager);
    void remove_universal_agent_manager(const Address& caller, const Address& manager);

    ////////////////////
    // swaps and flash loans
    BatchSwapResult batch_swap(const Address& caller, SwapKind, const std::vector<SwapStep>&,
        const std::vector<Address>& tokens, const FundManagement&, const std::vector<SwapLimit>& limits = {});
    // computes the net token movement of a batch swap without applying it
    BatchSwapResult query_batch_swap(SwapKind, const std::vector<SwapStep>&,
        const std::vector<Address>& tokens, const FundManagement&);
    void flash_loan(const Address& receiver, FlashLoanReceiver&, const std::vector<Address>& tokens,
        const std::vector<Funds>& amounts, const std::vector<uint8_t>& data = {});

    ////////////////////
    // protocol fees
    const FeeSettings& protocol_fees() const { return protocolFees.settings(); }
    void set_swap_fee(const Address& caller, defi::FeePercentage);
    void set_flash_loan_fee(const Address& caller, defi::FeePercentage);
    void set_withdraw_fee(const Address& caller, defi::FeePercentage);
    std::vector<Funds> collected_fees(const std::vector<Address>& tokens) const;
    void withdraw_collected_fees(const Address& caller, const std::vector<Address>& tokens,
        const std::vector<Funds>& amounts, const Address& recipient);

    // token amount the ledgers account for: pool cash, user balances and
    // collected fees. Equals the vault's custody after every call.
    Funds accounted_custody(const Address& token) const;

private:
    template <typename F>
    auto run(const char* name, F&& f);
    template <typename F>
    auto execute(F& f);
    void publish(const char* name);
    void commit();
    void rollback();

    void emit(Event e) { pendingEvents.push_back(std::move(e)); }
    void require_agent(const Address& user, const Address& caller) const;
    void require_manager(const defi::PoolId&, const Address& token, const Address& caller) const;
    void require_allowed(Action, const Address& caller) const;
    // throws EZEROTOKEN, EDUPLICATETOKEN
    static void check_tokens(const std::vector<Address>& tokens);
    void credit_user(const Address& user, const Address& token, Funds);
    void debit_user(const Address& user, const Address& token, Funds);
    // pushes amount minus withdraw fee, fee is collected
    void send_out(TransferPlan&, const Address& token, const Address& to, Funds);
    BatchSwapResult swap(SwapKind, const std::vector<SwapStep>&, const std::vector<Address>& tokens,
        const FundManagement&, const std::vector<SwapLimit>& limits, TransferPlan&);

    TokenTransfer& transfers;
    const Address custodyAccount;
    Authorizer& authorizer;
    ReentrancyGuard guard;
    PoolRegistry registry;
    PoolLedger poolLedger;
    UserLedger userLedger;
    ProtocolFees protocolFees;
    RollbackValue<uint64_t> operations { 0 };
    std::vector<Event> pendingEvents;
    std::vector<Event> committedEvents;
    subscriber_t subscriber;
};
}
