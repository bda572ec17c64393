#include "vault.hpp"
#include "general/logging.hpp"
#include <algorithm>
#include <set>
#include <type_traits>

namespace vault {

const char* swap_kind_name(SwapKind k)
{
    switch (k) {
    case SwapKind::GivenIn:
        return "given-in";
    case SwapKind::GivenOut:
        return "given-out";
    }
    return "unknown";
}

const char* action_name(Action a)
{
    switch (a) {
    case Action::ManageUniversalAgentManagers:
        return "manage-universal-agent-managers";
    case Action::SetProtocolFees:
        return "set-protocol-fees";
    case Action::WithdrawCollectedFees:
        return "withdraw-collected-fees";
    }
    return "unknown";
}

namespace {
    void check_lengths(size_t a, size_t b)
    {
        if (a != b)
            throw Error(ELENGTHMISMATCH);
    }
}

void Vault::check_tokens(const std::vector<Address>& tokens)
{
    std::set<Address> seen;
    for (auto& t : tokens) {
        if (t.is_zero())
            throw Error(EZEROTOKEN);
        if (!seen.insert(t).second)
            throw Error(EDUPLICATETOKEN);
    }
}

// Rolls back all ledgers unless committed.
class Vault::Transaction {
public:
    Transaction(Vault& v)
        : v(v)
    {
    }
    Transaction(const Transaction&) = delete;
    void commit()
    {
        v.commit();
        committed = true;
    }
    ~Transaction()
    {
        if (!committed)
            v.rollback();
    }

private:
    Vault& v;
    bool committed { false };
};

Vault::Vault(TokenTransfer& transfers, Authorizer& authorizer, FeeSettings fees)
    : transfers(transfers)
    , custodyAccount(transfers.custody_account())
    , authorizer(authorizer)
    , protocolFees(fees)
{
}

template <typename F>
auto Vault::execute(F& f)
{
    ReentrancyGuard::Lock l(guard);
    Transaction t(*this);
    TransferPlan plan(custodyAccount);
    operations.set(operations.get() + 1);
    poolLedger.begin_operation(operations.get());
    if constexpr (std::is_void_v<std::invoke_result_t<F&, TransferPlan&>>) {
        f(plan);
        plan.execute(transfers);
        t.commit();
    } else {
        auto res = f(plan);
        plan.execute(transfers);
        t.commit();
        return res;
    }
}

template <typename F>
auto Vault::run(const char* name, F&& f)
{
    if constexpr (std::is_void_v<std::invoke_result_t<F&, TransferPlan&>>) {
        try {
            execute(f);
        } catch (const Error& e) {
            spdlog::warn("Rejected {}: {}", name, e.format());
            throw;
        }
        publish(name);
    } else {
        auto res = [&]() {
            try {
                return execute(f);
            } catch (const Error& e) {
                spdlog::warn("Rejected {}: {}", name, e.format());
                throw;
            }
        }();
        publish(name);
        return res;
    }
}

void Vault::commit()
{
    registry.commit();
    poolLedger.commit();
    userLedger.commit();
    protocolFees.commit();
    operations.commit();
    for (auto& e : pendingEvents)
        committedEvents.push_back(std::move(e));
    pendingEvents.clear();
}

void Vault::rollback()
{
    registry.rollback();
    poolLedger.rollback();
    userLedger.rollback();
    protocolFees.rollback();
    operations.rollback();
    pendingEvents.clear();
}

void Vault::publish(const char* name)
{
    auto published { std::move(committedEvents) };
    committedEvents.clear();
    if (!subscriber)
        return;
    // the call is committed at this point, subscriber failures cannot undo it
    for (auto& e : published) {
        try {
            subscriber(e);
        } catch (const Error& err) {
            spdlog::error("Subscriber failed on {} event of committed {}: {}", event_name(e), name, err.format());
        } catch (const std::exception& ex) {
            spdlog::error("Subscriber failed on {} event of committed {}: {}", event_name(e), name, ex.what());
        }
    }
}

void Vault::require_agent(const Address& user, const Address& caller) const
{
    if (!userLedger.is_agent_for(user, caller))
        throw Error(ESENDERNOTAGENT);
}

void Vault::require_manager(const defi::PoolId& id, const Address& token, const Address& caller) const
{
    if (!registry.exists(id))
        throw Error(ENOPOOL);
    auto m { registry.manager(id, token) };
    if (!m || *m != caller)
        throw Error(ENOTMANAGER);
}

void Vault::require_allowed(Action a, const Address& caller) const
{
    if (!authorizer.can_perform(a, caller))
        throw Error(ENOTALLOWED);
}

void Vault::credit_user(const Address& user, const Address& token, Funds amount)
{
    if (amount.is_zero())
        return;
    auto b { userLedger.increase(user, token, amount) };
    emit(events::UserBalanceChanged { user, token, b });
}

void Vault::debit_user(const Address& user, const Address& token, Funds amount)
{
    if (amount.is_zero())
        return;
    auto b { userLedger.decrease(user, token, amount) };
    emit(events::UserBalanceChanged { user, token, b });
}

void Vault::send_out(TransferPlan& plan, const Address& token, const Address& to, Funds amount)
{
    auto fee { protocolFees.settings().withdraw.of_ceil(amount) };
    protocolFees.collect(token, fee);
    plan.push(token, to, Funds::diff_throw(amount, fee));
}

////////////////////
// pools

defi::PoolId Vault::register_pool(const Address& controller, defi::StrategyType type, SwapStrategy& strategy)
{
    return run("register_pool", [&](TransferPlan&) {
        auto id { registry.register_pool(controller, type, strategy) };
        poolLedger.create(id);
        emit(events::PoolRegistered { id });
        spdlog::info("Registered {} pool {} with controller {}",
            defi::strategy_name(type), id.to_string(), controller.to_string());
        return id;
    });
}

defi::PoolId Vault::get_pool(const defi::PoolIdBytes& b) const
{
    auto id { b.decode().value_throw() };
    if (!registry.exists(id))
        throw Error(ENOPOOL);
    return id;
}

std::vector<PoolTokenBalance> Vault::get_pool_tokens(const defi::PoolId& id) const
{
    std::vector<PoolTokenBalance> out;
    for (auto& t : poolLedger.tokens(id))
        out.push_back({ t, poolLedger.balance(id, t).total(), poolLedger.last_change(id, t) });
    return out;
}

uint64_t Vault::get_pool_last_change(const defi::PoolId& id) const
{
    uint64_t last { 0 };
    for (auto& t : poolLedger.tokens(id))
        last = std::max(last, poolLedger.last_change(id, t));
    return last;
}

PoolTokenInfo Vault::get_pool_token_info(const defi::PoolId& id, const Address& token) const
{
    auto b { poolLedger.balance(id, token) };
    return {
        .cash { b.get_cash() },
        .managed { b.get_managed() },
        .lastChange = poolLedger.last_change(id, token),
        .manager { registry.manager(id, token) }
    };
}

void Vault::add_liquidity(const Address& caller, const defi::PoolId& id, const Address& from,
    const std::vector<Address>& tokens, const std::vector<Funds>& amounts, bool useUserBalance)
{
    run("add_liquidity", [&](TransferPlan& plan) {
        check_lengths(tokens.size(), amounts.size());
        registry.require_controller(id, caller);
        require_agent(from, caller);
        check_tokens(tokens);
        for (size_t i = 0; i < tokens.size(); ++i) {
            auto& token { tokens[i] };
            auto amount { amounts[i] };
            if (amount.is_zero())
                continue;
            Funds fromUser { 0 };
            if (useUserBalance) {
                fromUser = min(userLedger.balance(from, token), amount);
                debit_user(from, token, fromUser);
            }
            plan.pull(token, from, Funds::diff_throw(amount, fromUser));
            poolLedger.increase_cash(id, token, amount);
        }
        emit(events::PoolBalanceChanged { id, from, true, tokens, amounts });
        spdlog::info("Added liquidity to pool {} from {}", id.to_string(), from.to_string());
    });
}

void Vault::remove_liquidity(const Address& caller, const defi::PoolId& id, const Address& to,
    const std::vector<Address>& tokens, const std::vector<Funds>& amounts, bool depositToUserBalance)
{
    run("remove_liquidity", [&](TransferPlan& plan) {
        check_lengths(tokens.size(), amounts.size());
        registry.require_controller(id, caller);
        check_tokens(tokens);
        for (size_t i = 0; i < tokens.size(); ++i) {
            auto& token { tokens[i] };
            auto amount { amounts[i] };
            if (amount.is_zero())
                continue;
            poolLedger.decrease_cash(id, token, amount);
            if (depositToUserBalance)
                credit_user(to, token, amount);
            else
                send_out(plan, token, to, amount);
        }
        emit(events::PoolBalanceChanged { id, to, false, tokens, amounts });
        spdlog::info("Removed liquidity from pool {} to {}", id.to_string(), to.to_string());
    });
}

////////////////////
// investment managers

void Vault::authorize_pool_investment_manager(const Address& caller, const defi::PoolId& id,
    const Address& token, const Address& manager)
{
    run("authorize_pool_investment_manager", [&](TransferPlan&) {
        registry.require_controller(id, caller);
        if (manager.is_zero())
            throw Error(EBADADDRESS);
        if (!poolLedger.balance(id, token).get_managed().is_zero())
            throw Error(EMANAGEDNONZERO);
        registry.set_manager(id, token, manager);
        emit(events::ManagerChanged { id, token, manager });
        spdlog::info("Authorized investment manager {} for token {} of pool {}",
            manager.to_string(), token.to_string(), id.to_string());
    });
}

void Vault::revoke_pool_investment_manager(const Address& caller, const defi::PoolId& id, const Address& token)
{
    run("revoke_pool_investment_manager", [&](TransferPlan&) {
        registry.require_controller(id, caller);
        if (!registry.manager(id, token))
            throw Error(ENOMANAGER);
        if (!poolLedger.balance(id, token).get_managed().is_zero())
            throw Error(EMANAGEDNONZERO);
        registry.clear_manager(id, token);
        emit(events::ManagerChanged { id, token, std::nullopt });
        spdlog::info("Revoked investment manager for token {} of pool {}",
            token.to_string(), id.to_string());
    });
}

void Vault::invest_pool_balance(const Address& caller, const defi::PoolId& id, const Address& token, Funds amount)
{
    run("invest_pool_balance", [&](TransferPlan& plan) {
        require_manager(id, token, caller);
        auto b { poolLedger.invest(id, token, amount) };
        plan.push(token, caller, amount);
        emit(events::ManagedBalanceChanged { id, token, caller, b });
    });
}

void Vault::divest_pool_balance(const Address& caller, const defi::PoolId& id, const Address& token, Funds amount)
{
    run("divest_pool_balance", [&](TransferPlan& plan) {
        require_manager(id, token, caller);
        auto b { poolLedger.divest(id, token, amount) };
        plan.pull(token, caller, amount);
        emit(events::ManagedBalanceChanged { id, token, caller, b });
    });
}

void Vault::update_invested(const Address& caller, const defi::PoolId& id, const Address& token, Funds managed)
{
    run("update_invested", [&](TransferPlan&) {
        require_manager(id, token, caller);
        auto b { poolLedger.set_managed(id, token, managed) };
        emit(events::ManagedBalanceChanged { id, token, caller, b });
    });
}

////////////////////
// user balances

std::vector<Funds> Vault::get_user_balance(const Address& user, const std::vector<Address>& tokens) const
{
    std::vector<Funds> out;
    for (auto& t : tokens)
        out.push_back(userLedger.balance(user, t));
    return out;
}

void Vault::deposit(const Address& caller, const Address& token, Funds amount, const Address& user)
{
    run("deposit", [&](TransferPlan& plan) {
        if (token.is_zero())
            throw Error(EZEROTOKEN);
        credit_user(user, token, amount);
        plan.pull(token, caller, amount);
    });
}

void Vault::withdraw(const Address& caller, const Address& user, const Address& token, Funds amount, const Address& recipient)
{
    run("withdraw", [&](TransferPlan& plan) {
        require_agent(user, caller);
        debit_user(user, token, amount);
        send_out(plan, token, recipient, amount);
    });
}

void Vault::transfer_user_balance(const Address& caller, const Address& from, const Address& token, Funds amount, const Address& to)
{
    run("transfer_user_balance", [&](TransferPlan&) {
        require_agent(from, caller);
        debit_user(from, token, amount);
        credit_user(to, token, amount);
    });
}

////////////////////
// agents

void Vault::add_agent(const Address& caller, const Address& agent)
{
    run("add_agent", [&](TransferPlan&) {
        if (agent.is_zero())
            throw Error(EBADADDRESS);
        if (userLedger.add_agent(caller, agent))
            spdlog::debug("Added agent {} for {}", agent.to_string(), caller.to_string());
    });
}

void Vault::remove_agent(const Address& caller, const Address& agent)
{
    run("remove_agent", [&](TransferPlan&) {
        if (userLedger.remove_agent(caller, agent))
            spdlog::debug("Removed agent {} for {}", agent.to_string(), caller.to_string());
    });
}

void Vault::add_universal_agent(const Address& caller, const Address& agent)
{
    run("add_universal_agent", [&](TransferPlan&) {
        if (!userLedger.is_universal_agent_manager(caller))
            throw Error(ENOTUNIVERSALMANAGER);
        if (agent.is_zero())
            throw Error(EBADADDRESS);
        if (userLedger.add_universal_agent(agent))
            spdlog::info("Added universal agent {}", agent.to_string());
    });
}

void Vault::remove_universal_agent(const Address& caller, const Address& agent)
{
    run("remove_universal_agent", [&](TransferPlan&) {
        if (!userLedger.is_universal_agent_manager(caller))
            throw Error(ENOTUNIVERSALMANAGER);
        if (userLedger.remove_universal_agent(agent))
            spdlog::info("Removed universal agent {}", agent.to_string());
    });
}

void Vault::add_universal_agent_manager(const Address& caller, const Address& manager)
{
    run("add_universal_agent_manager", [&](TransferPlan&) {
        require_allowed(Action::ManageUniversalAgentManagers, caller);
        if (manager.is_zero())
            throw Error(EBADADDRESS);
        if (userLedger.add_universal_agent_manager(manager))
            spdlog::info("Added universal agent manager {}", manager.to_string());
    });
}

void Vault::remove_universal_agent_manager(const Address& caller, const Address& manager)
{
    run("remove_universal_agent_manager", [&](TransferPlan&) {
        require_allowed(Action::ManageUniversalAgentManagers, caller);
        if (userLedger.remove_universal_agent_manager(manager))
            spdlog::info("Removed universal agent manager {}", manager.to_string());
    });
}

////////////////////
// swaps and flash loans

BatchSwapResult Vault::batch_swap(const Address& caller, SwapKind kind, const std::vector<SwapStep>& steps,
    const std::vector<Address>& tokens, const FundManagement& funds, const std::vector<SwapLimit>& limits)
{
    return run("batch_swap", [&](TransferPlan& plan) {
        require_agent(funds.sender, caller);
        auto res { swap(kind, steps, tokens, funds, limits, plan) };
        spdlog::debug("Batch swap of {} steps ({}) by {}", steps.size(), swap_kind_name(kind), caller.to_string());
        return res;
    });
}

BatchSwapResult Vault::query_batch_swap(SwapKind kind, const std::vector<SwapStep>& steps,
    const std::vector<Address>& tokens, const FundManagement& funds)
{
    ReentrancyGuard::Lock l(guard);
    Transaction t(*this); // never committed
    TransferPlan plan(custodyAccount);
    return swap(kind, steps, tokens, funds, {}, plan);
}

namespace {
    // brings the vault's custody of lent tokens back to the pre loan level
    void restore_custody(TokenTransfer& transfers, const Address& receiver,
        const std::vector<Address>& tokens, const std::vector<Funds>& pre, size_t n)
    {
        for (size_t i = 0; i < n; ++i) {
            try {
                external_call(ETRANSFER, [&]() {
                    auto now { transfers.custody(tokens[i]) };
                    if (now < pre[i])
                        transfers.pull(tokens[i], receiver, Funds::diff_throw(pre[i], now));
                    else if (now > pre[i])
                        transfers.push(tokens[i], receiver, Funds::diff_throw(now, pre[i]));
                });
            } catch (const Error& e) {
                spdlog::error("Cannot restore custody of {} after failed flash loan: {}", tokens[i].to_string(), e.format());
            }
        }
    }
}

void Vault::flash_loan(const Address& receiver, FlashLoanReceiver& callback, const std::vector<Address>& tokens,
    const std::vector<Funds>& amounts, const std::vector<uint8_t>& data)
{
    run("flash_loan", [&](TransferPlan&) {
        if (receiver == custodyAccount)
            throw Error(ECUSTODYACCOUNT);
        check_lengths(tokens.size(), amounts.size());
        check_tokens(tokens);
        const auto pct { protocolFees.settings().flashLoan };
        std::vector<Funds> pre;
        std::vector<Funds> fees;
        for (size_t i = 0; i < tokens.size(); ++i) {
            auto c { external_call(ETRANSFER, [&]() { return transfers.custody(tokens[i]); }) };
            if (amounts[i] > c)
                throw Error(EBALANCE);
            pre.push_back(c);
            fees.push_back(pct.of_ceil(amounts[i]));
        }
        size_t lent { 0 };
        try {
            for (; lent < tokens.size(); ++lent) {
                if (amounts[lent].is_zero())
                    continue;
                external_call(ETRANSFER, [&]() { transfers.push(tokens[lent], receiver, amounts[lent]); });
            }
            external_call(EFLASHCALLBACK, [&]() { callback.receive_flash_loan(tokens, amounts, fees, data); });
            for (size_t i = 0; i < tokens.size(); ++i) {
                auto post { external_call(ETRANSFER, [&]() { return transfers.custody(tokens[i]); }) };
                if (post < Funds::sum_throw(pre[i], fees[i]))
                    throw Error(EFLASHNOTREPAID);
                // everything above the pre loan level is protocol fee
                auto received { Funds::diff_throw(post, pre[i]) };
                protocolFees.collect(tokens[i], received);
                emit(events::FlashLoan { receiver, tokens[i], amounts[i], received });
            }
        } catch (const Error&) {
            restore_custody(transfers, receiver, tokens, pre, lent);
            throw;
        }
        spdlog::info("Flash loan of {} tokens to {} repaid", tokens.size(), receiver.to_string());
    });
}

////////////////////
// protocol fees

void Vault::set_swap_fee(const Address& caller, defi::FeePercentage f)
{
    run("set_swap_fee", [&](TransferPlan&) {
        require_allowed(Action::SetProtocolFees, caller);
        protocolFees.set_swap_fee(f);
        emit(events::ProtocolFeeChanged { "swap", f });
    });
}

void Vault::set_flash_loan_fee(const Address& caller, defi::FeePercentage f)
{
    run("set_flash_loan_fee", [&](TransferPlan&) {
        require_allowed(Action::SetProtocolFees, caller);
        protocolFees.set_flash_loan_fee(f);
        emit(events::ProtocolFeeChanged { "flash-loan", f });
    });
}

void Vault::set_withdraw_fee(const Address& caller, defi::FeePercentage f)
{
    run("set_withdraw_fee", [&](TransferPlan&) {
        require_allowed(Action::SetProtocolFees, caller);
        protocolFees.set_withdraw_fee(f);
        emit(events::ProtocolFeeChanged { "withdraw", f });
    });
}

std::vector<Funds> Vault::collected_fees(const std::vector<Address>& tokens) const
{
    std::vector<Funds> out;
    for (auto& t : tokens)
        out.push_back(protocolFees.collected(t));
    return out;
}

void Vault::withdraw_collected_fees(const Address& caller, const std::vector<Address>& tokens,
    const std::vector<Funds>& amounts, const Address& recipient)
{
    run("withdraw_collected_fees", [&](TransferPlan& plan) {
        require_allowed(Action::WithdrawCollectedFees, caller);
        check_lengths(tokens.size(), amounts.size());
        check_tokens(tokens);
        for (size_t i = 0; i < tokens.size(); ++i) {
            protocolFees.withdraw(tokens[i], amounts[i]);
            plan.push(tokens[i], recipient, amounts[i]);
        }
    });
}

Funds Vault::accounted_custody(const Address& token) const
{
    return Funds::sum_throw(poolLedger.cash(token), userLedger.total(token), protocolFees.collected(token));
}
}
