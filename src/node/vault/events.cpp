#include "events.hpp"
#include "nlohmann/json.hpp"

namespace vault {
namespace {
    using nlohmann::json;
    struct NameVisitor {
        const char* operator()(const events::PoolRegistered&) { return "PoolRegistered"; }
        const char* operator()(const events::PoolBalanceChanged&) { return "PoolBalanceChanged"; }
        const char* operator()(const events::Swap&) { return "Swap"; }
        const char* operator()(const events::ManagerChanged&) { return "ManagerChanged"; }
        const char* operator()(const events::ManagedBalanceChanged&) { return "ManagedBalanceChanged"; }
        const char* operator()(const events::UserBalanceChanged&) { return "UserBalanceChanged"; }
        const char* operator()(const events::FlashLoan&) { return "FlashLoan"; }
        const char* operator()(const events::ProtocolFeeChanged&) { return "ProtocolFeeChanged"; }
    };

    struct JsonVisitor {
        json operator()(const events::PoolRegistered& e)
        {
            return {
                { "pool", e.pool.to_string() },
                { "controller", e.pool.controller.to_string() },
                { "strategy", defi::strategy_name(e.pool.strategy) },
                { "index", e.pool.index }
            };
        }
        json operator()(const events::PoolBalanceChanged& e)
        {
            json tokens(json::array());
            for (size_t i = 0; i < e.tokens.size(); ++i) {
                tokens.push_back(json { { "token", e.tokens[i].to_string() },
                    { "amount", e.amounts[i].value() } });
            }
            return {
                { "pool", e.pool.to_string() },
                { "account", e.account.to_string() },
                { "direction", e.added ? "add" : "remove" },
                { "tokens", tokens }
            };
        }
        json operator()(const events::Swap& e)
        {
            return {
                { "pool", e.pool.to_string() },
                { "tokenIn", e.tokenIn.to_string() },
                { "tokenOut", e.tokenOut.to_string() },
                { "amountIn", e.amountIn.value() },
                { "amountOut", e.amountOut.value() },
                { "protocolFee", e.protocolFee.value() }
            };
        }
        json operator()(const events::ManagerChanged& e)
        {
            return {
                { "pool", e.pool.to_string() },
                { "token", e.token.to_string() },
                { "manager", e.manager ? json(e.manager->to_string()) : json(nullptr) }
            };
        }
        json operator()(const events::ManagedBalanceChanged& e)
        {
            return {
                { "pool", e.pool.to_string() },
                { "token", e.token.to_string() },
                { "manager", e.manager.to_string() },
                { "balance", json(e.balance) }
            };
        }
        json operator()(const events::UserBalanceChanged& e)
        {
            return {
                { "user", e.user.to_string() },
                { "token", e.token.to_string() },
                { "balance", e.balance.value() }
            };
        }
        json operator()(const events::FlashLoan& e)
        {
            return {
                { "receiver", e.receiver.to_string() },
                { "token", e.token.to_string() },
                { "amount", e.amount.value() },
                { "fee", e.fee.value() }
            };
        }
        json operator()(const events::ProtocolFeeChanged& e)
        {
            return {
                { "kind", e.kind },
                { "fee", e.fee.to_string() }
            };
        }
    };
}

const char* event_name(const Event& e)
{
    return std::visit(NameVisitor {}, e);
}

nlohmann::json to_json(const Event& e)
{
    json j = std::visit(JsonVisitor {}, e);
    j["event"] = event_name(e);
    return j;
}
}
